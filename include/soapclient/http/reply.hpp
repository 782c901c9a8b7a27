// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapclient::http::reply class, the reply received
/// from a server

#include <soapclient/config.hpp>

#include <memory>
#include <string>
#include <tuple>

#include <soapclient/http/header.hpp>
#include <soapclient/http/message-body.hpp>

namespace soapclient::http
{

/// Various predefined HTTP status codes

enum status_type
{
	cont = 100,
	ok = 200,
	created = 201,
	accepted = 202,
	no_content = 204,
	multiple_choices = 300,
	moved_permanently = 301,
	moved_temporarily = 302,
	see_other = 303,
	not_modified = 304,
	bad_request = 400,
	unauthorized = 401,
	forbidden = 403,
	not_found = 404,
	method_not_allowed = 405,
	proxy_authentication_required = 407,
	internal_server_error = 500,
	not_implemented = 501,
	bad_gateway = 502,
	service_unavailable = 503,
	gateway_timeout = 504
};

/// Return the reason phrase for \a status, an empty string for unknown codes
std::string get_status_text(int status);

/// The reply as received from a server. The body is read on demand
/// through the message_body interface. A reply can be moved but not copied.

class reply
{
  public:
	/// \brief Create a reply with \a status, the reason phrase is taken from
	/// the list of known status codes
	reply(int status = internal_server_error, std::unique_ptr<message_body> body = {});

	/// \brief Create a reply as parsed from the wire
	reply(int status, const std::string& reason, std::tuple<int,int> version,
		header_list&& headers, std::unique_ptr<message_body> body);

	reply(const reply&) = delete;
	reply(reply&&) = default;
	reply& operator=(const reply&) = delete;
	reply& operator=(reply&&) = default;

	/// \brief the numeric status code, e.g. 200
	int get_status() const								{ return m_status; }

	/// \brief the status line, the code followed by the reason, e.g. "200 OK"
	std::string get_status_line() const;

	const std::string& get_reason() const				{ return m_reason; }

	std::tuple<int,int> get_version() const				{ return { m_version_major, m_version_minor }; }

	/// \brief return the value of header \a name or an empty string
	std::string get_header(const std::string& name) const	{ return http::get_header(m_headers, name); }
	void set_header(const std::string& name, const std::string& value)	{ http::set_header(m_headers, name, value); }

	const header_list& get_headers() const				{ return m_headers; }

	/// \brief the body of the reply, never null
	message_body& get_body() const						{ return *m_body; }
	void set_body(std::unique_ptr<message_body> body);

  private:
	int m_status;
	std::string m_reason;
	int m_version_major = 1, m_version_minor = 1;
	header_list m_headers;
	std::unique_ptr<message_body> m_body;
};

} // namespace soapclient::http
