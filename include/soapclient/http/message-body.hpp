//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// The body of a reply, read incrementally and released with close()

#include <soapclient/config.hpp>

#include <string>

namespace soapclient::http
{

/// \brief abstract base class for the body of a HTTP reply
///
/// The body of a reply received over the network is not read up front,
/// the receiver decides how much of it it needs. When done, the body
/// must be closed which releases the connection it was read from.

class message_body
{
  public:
	virtual ~message_body() = default;

	/// \brief read at most \a length bytes into \a data, returns the number
	/// of bytes read, zero means the end of the body was reached
	virtual size_t read(char* data, size_t length) = 0;

	/// \brief release the resources held by this body
	virtual void close() = 0;
};

/// \brief a message_body for data already in memory
class string_body : public message_body
{
  public:
	string_body(std::string data)
		: m_data(std::move(data)) {}

	size_t read(char* data, size_t length) override;

	void close() override;

	bool is_closed() const			{ return m_closed; }

  private:
	std::string m_data;
	size_t m_offset = 0;
	bool m_closed = false;
};

/// \brief read the body until its end or until \a limit bytes were read,
/// whichever comes first
std::string read_all(message_body& body, size_t limit = std::string::npos);

} // namespace soapclient::http
