// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <iostream>

#include <soapclient/http/request.hpp>
#include <soapclient/http/uri.hpp>

namespace soapclient::http
{

request::request(const std::string& method, const std::string& url, std::string payload)
	: m_method(method)
	, m_url(url)
	, m_payload(std::move(payload))
{
}

std::ostream& operator<<(std::ostream& os, const request& req)
{
	// outbound requests carry a full url, the request line wants the origin form
	std::string target = req.m_url;
	if (target.find("://") != std::string::npos)
		target = uri(target).get_target();

	os << req.m_method << ' ' << target << " HTTP/" << req.m_version_major << '.' << req.m_version_minor << "\r\n";

	for (auto& h : req.m_headers)
		os << h.name << ": " << h.value << "\r\n";

	os << "\r\n"
	   << req.m_payload;

	return os;
}

} // namespace soapclient::http
