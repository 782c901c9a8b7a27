//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapclient::soap::http_error, thrown when a server replies
/// with any status other than 200

#include <soapclient/config.hpp>

#include <string>

#include <soapclient/exception.hpp>

namespace soapclient::soap
{

/// \brief return \a s as a double quoted string with quotes, backslashes,
/// control characters and invalid UTF-8 escaped
std::string quote(const std::string& s);

/// \brief A round trip completed but the reply did not have status 200
///
/// The body holds at most SOAPCLIENT_ERROR_BODY_LIMIT bytes of what the
/// server sent. what() returns the quoted status line and body separated by a colon.

class http_error : public exception
{
  public:
	http_error(int status_code, const std::string& status, const std::string& body)
		: exception(quote(status) + ": " + quote(body))
		, m_status_code(status_code), m_status(status), m_body(body) {}

	int status_code() const					{ return m_status_code; }

	/// \brief the status line, e.g. "500 Internal Server Error"
	const std::string& status() const		{ return m_status; }

	/// \brief the start of the body of the reply
	const std::string& body() const			{ return m_body; }

  private:
	int m_status_code;
	std::string m_status;
	std::string m_body;
};

} // namespace soapclient::soap
