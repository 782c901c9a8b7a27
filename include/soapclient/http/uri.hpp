//          Copyright Maarten L. Hekkelman, 2021-2024
//   Distributed under the Boost Software License, Version 1.0.
//      (See accompanying file LICENSE_1_0.txt or copy at
//            http://www.boost.org/LICENSE_1_0.txt)

#pragma once

// A simple uri class, just enough to split the url of a SOAP endpoint.

#include <soapclient/config.hpp>

#include <string>

#include <soapclient/exception.hpp>

namespace soapclient::http
{

// --------------------------------------------------------------------

class uri_parse_error : public soapclient::exception
{
  public:
	uri_parse_error()
		: exception("invalid uri"){};
	uri_parse_error(const std::string& u)
		: exception("invalid uri: " + u){};
};

// --------------------------------------------------------------------

/// \brief an absolute url, split into its parts.
///
/// Only the parts a client needs to connect are kept: scheme, host,
/// port and the target (path and query). The fragment is dropped.

class uri
{
  public:
	uri(const std::string& s);

	uri(const uri& u) = default;
	uri(uri&& u) = default;
	uri& operator=(const uri& u) = default;
	uri& operator=(uri&& u) = default;

	/// \brief the scheme, in lower case
	const std::string& get_scheme() const		{ return m_scheme; }

	/// \brief the host name, without the brackets for IPv6 addresses
	const std::string& get_host() const			{ return m_host; }

	/// \brief the port, the default for the scheme if none was given
	const std::string& get_port() const			{ return m_port; }

	/// \brief host and port as they should appear in a Host header
	std::string get_authority() const;

	/// \brief the path and query, at least "/"
	const std::string& get_target() const		{ return m_target; }

  private:
	std::string m_scheme;
	std::string m_host;
	std::string m_port;
	bool m_explicit_port = false;
	bool m_ipv6 = false;
	std::string m_target;
};

} // namespace soapclient::http
