//          Copyright Maarten L. Hekkelman, 2020-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// A read only std::streambuf over a block of received bytes.

#include <soapclient/config.hpp>

#include <algorithm>
#include <cassert>
#include <functional>
#include <streambuf>

namespace soapclient
{

// --------------------------------------------------------------------
/// \brief A simple class to use const char buffers as streambuf
///
/// The HTTP parsers consume their input from a std::streambuf, data
/// read from a socket is handed to them through this class. What the
/// parser did not consume is still available via in_avail().

class char_streambuf : public std::streambuf
{
  public:
	/// \brief constructor taking a \a buffer and a \a length
	char_streambuf(const char* buffer, size_t length)
		: m_begin(buffer), m_end(buffer + length), m_current(buffer)
	{
		assert(std::less_equal<const char*>()(m_begin, m_end));
	}

	char_streambuf(const char_streambuf&) = delete;
	char_streambuf& operator=(const char_streambuf&) = delete;

  private:
	int_type underflow() override
	{
		if (m_current == m_end)
			return traits_type::eof();

		return traits_type::to_int_type(*m_current);
	}

	int_type uflow() override
	{
		if (m_current == m_end)
			return traits_type::eof();

		return traits_type::to_int_type(*m_current++);
	}

	std::streamsize showmanyc() override
	{
		return m_end - m_current;
	}

	std::streamsize xsgetn(char* s, std::streamsize n) override
	{
		std::streamsize k = std::min<std::streamsize>(n, m_end - m_current);
		std::copy(m_current, m_current + k, s);
		m_current += k;
		return k;
	}

  private:
	const char* const m_begin;
	const char* const m_end;
	const char* m_current;
};

} // namespace soapclient
