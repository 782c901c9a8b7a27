// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <soapclient/http/reply.hpp>

namespace soapclient::http
{

namespace detail
{

	struct status_string
	{
		status_type code;
		const char* text;
	} kStatusStrings[] = {
		{ cont, "Continue" },
		{ ok, "OK" },
		{ created, "Created" },
		{ accepted, "Accepted" },
		{ no_content, "No Content" },
		{ multiple_choices, "Multiple Choices" },
		{ moved_permanently, "Moved Permanently" },
		{ moved_temporarily, "Found" },
		{ see_other, "See Other" },
		{ not_modified, "Not Modified" },
		{ bad_request, "Bad Request" },
		{ unauthorized, "Unauthorized" },
		{ forbidden, "Forbidden" },
		{ not_found, "Not Found" },
		{ method_not_allowed, "Method Not Allowed" },
		{ proxy_authentication_required, "Proxy Authentication Required" },
		{ internal_server_error, "Internal Server Error" },
		{ not_implemented, "Not Implemented" },
		{ bad_gateway, "Bad Gateway" },
		{ service_unavailable, "Service Unavailable" },
		{ gateway_timeout, "Gateway Timeout" }
	};

} // namespace detail

std::string get_status_text(int status)
{
	std::string result;

	for (auto& s : detail::kStatusStrings)
	{
		if (s.code == status)
		{
			result = s.text;
			break;
		}
	}

	return result;
}

// --------------------------------------------------------------------

reply::reply(int status, std::unique_ptr<message_body> body)
	: m_status(status)
	, m_reason(get_status_text(status))
{
	set_body(std::move(body));
}

reply::reply(int status, const std::string& reason, std::tuple<int,int> version,
	header_list&& headers, std::unique_ptr<message_body> body)
	: m_status(status)
	, m_reason(reason)
	, m_version_major(std::get<0>(version))
	, m_version_minor(std::get<1>(version))
	, m_headers(std::move(headers))
{
	// a server may leave out the reason phrase
	if (m_reason.empty())
		m_reason = get_status_text(status);

	set_body(std::move(body));
}

std::string reply::get_status_line() const
{
	std::string result = std::to_string(m_status);

	if (not m_reason.empty())
		result += ' ' + m_reason;

	return result;
}

void reply::set_body(std::unique_ptr<message_body> body)
{
	if (body)
		m_body = std::move(body);
	else
		m_body = std::make_unique<string_body>(std::string{});
}

} // namespace soapclient::http
