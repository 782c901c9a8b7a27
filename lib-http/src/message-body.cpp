//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>

#include <soapclient/exception.hpp>
#include <soapclient/http/message-body.hpp>

namespace soapclient::http
{

size_t string_body::read(char* data, size_t length)
{
	if (m_closed)
		throw exception("read on closed body");

	size_t n = std::min(length, m_data.length() - m_offset);
	std::copy(m_data.begin() + m_offset, m_data.begin() + m_offset + n, data);
	m_offset += n;

	return n;
}

void string_body::close()
{
	m_closed = true;
}

std::string read_all(message_body& body, size_t limit)
{
	std::string result;
	char buffer[8192];

	while (result.length() < limit)
	{
		size_t n = body.read(buffer, std::min(sizeof(buffer), limit - result.length()));
		if (n == 0)
			break;
		result.append(buffer, n);
	}

	return result;
}

} // namespace soapclient::http
