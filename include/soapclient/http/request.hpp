// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapclient::http::request class, the outbound request

#include <soapclient/config.hpp>

#include <iosfwd>
#include <memory>
#include <string>
#include <tuple>

#include <soapclient/context.hpp>
#include <soapclient/http/header.hpp>

namespace soapclient::http
{

/// request contains the HTTP request a client is about to send.
///
/// Header names are case insensitive.

class request
{
  public:
	request(const std::string& method, const std::string& url, std::string payload = {});

	request(const request& req) = default;
	request(request&& req) = default;
	request& operator=(const request& req) = default;
	request& operator=(request&& req) = default;

	const std::string& get_method() const				{ return m_method; }
	void set_method(const std::string& method)			{ m_method = method; }

	/// \brief the target, a full URL for outbound requests
	const std::string& get_url() const					{ return m_url; }
	void set_url(const std::string& url)				{ m_url = url; }

	std::tuple<int,int> get_version() const				{ return { m_version_major, m_version_minor }; }

	/// \brief return the value of header \a name or an empty string
	std::string get_header(const std::string& name) const	{ return http::get_header(m_headers, name); }

	/// \brief set header \a name to \a value, replacing any existing header with that name
	void set_header(const std::string& name, const std::string& value)	{ http::set_header(m_headers, name, value); }

	/// \brief add a header \a name with \a value, existing headers with the same name are kept
	void add_header(const std::string& name, const std::string& value)	{ m_headers.push_back({ name, value }); }

	void remove_header(const std::string& name)			{ http::remove_header(m_headers, name); }

	bool has_header(const std::string& name) const		{ return http::has_header(m_headers, name); }

	const header_list& get_headers() const				{ return m_headers; }

	const std::string& get_payload() const				{ return m_payload; }
	void set_payload(std::string payload)				{ m_payload = std::move(payload); }

	/// \brief the context governing cancellation of this request, may be null
	const std::shared_ptr<const context>& get_context() const	{ return m_context; }
	void set_context(std::shared_ptr<const context> ctx)		{ m_context = std::move(ctx); }

	/// \brief write the request as it goes over the wire, the request
	/// line uses the origin form of the url (path and query)
	friend std::ostream& operator<<(std::ostream& os, const request& req);

  private:
	std::string m_method;
	std::string m_url;
	int m_version_major = 1, m_version_minor = 1;
	header_list m_headers;
	std::string m_payload;
	std::shared_ptr<const context> m_context;
};

} // namespace soapclient::http
