//          Copyright Maarten L. Hekkelman, 2021-2024
//   Distributed under the Boost Software License, Version 1.0.
//      (See accompanying file LICENSE_1_0.txt or copy at
//            http://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string.hpp>

#include <soapclient/http/uri.hpp>

namespace ba = boost::algorithm;

namespace soapclient::http
{

uri::uri(const std::string& s)
{
	auto cs = s.find("://");
	if (cs == std::string::npos or cs == 0)
		throw uri_parse_error(s);

	m_scheme = ba::to_lower_copy(s.substr(0, cs));
	if (not std::isalpha(static_cast<unsigned char>(m_scheme.front())) or
		not std::all_of(m_scheme.begin(), m_scheme.end(), [](char ch) { return std::isalnum(static_cast<unsigned char>(ch)) or ch == '+' or ch == '-' or ch == '.'; }))
	{
		throw uri_parse_error(s);
	}

	auto as = cs + 3;
	auto ae = s.find_first_of("/?#", as);
	std::string authority = s.substr(as, ae == std::string::npos ? std::string::npos : ae - as);

	// strip user info, it is not used
	auto at = authority.rfind('@');
	if (at != std::string::npos)
		authority.erase(0, at + 1);

	if (authority.empty())
		throw uri_parse_error(s);

	std::string port;

	if (authority.front() == '[')
	{
		auto cb = authority.find(']');
		if (cb == std::string::npos)
			throw uri_parse_error(s);

		m_host = authority.substr(1, cb - 1);
		m_ipv6 = true;

		if (cb + 1 < authority.length())
		{
			if (authority[cb + 1] != ':')
				throw uri_parse_error(s);
			port = authority.substr(cb + 2);
		}
	}
	else
	{
		auto colon = authority.rfind(':');
		if (colon != std::string::npos)
		{
			m_host = authority.substr(0, colon);
			port = authority.substr(colon + 1);
		}
		else
			m_host = authority;
	}

	if (m_host.empty())
		throw uri_parse_error(s);

	ba::to_lower(m_host);

	if (not port.empty())
	{
		if (port.length() > 5 or not std::all_of(port.begin(), port.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)); }) or std::stoi(port) > 65535)
			throw uri_parse_error(s);

		m_port = port;
		m_explicit_port = true;
	}
	else if (m_scheme == "http")
		m_port = "80";
	else if (m_scheme == "https")
		m_port = "443";

	if (ae != std::string::npos)
	{
		auto fe = s.find('#', ae);
		m_target = s.substr(ae, fe == std::string::npos ? std::string::npos : fe - ae);
	}

	if (m_target.empty() or m_target.front() != '/')
		m_target.insert(0, "/");
}

std::string uri::get_authority() const
{
	std::string result = m_ipv6 ? '[' + m_host + ']' : m_host;

	if (m_explicit_port)
		result += ':' + m_port;

	return result;
}

} // namespace soapclient::http
