//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <soapclient/config.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

#include <soapclient/http/message-body.hpp>
#include <soapclient/soap/client.hpp>

namespace soapclient::soap
{

namespace
{

std::mutex s_log_lock;

http::reply execute_request(http::transport& transport, http::request& req)
{
	try
	{
		return transport.execute(req);
	}
	catch (const transport_error&)
	{
		throw;
	}
	catch (const std::exception& e)
	{
		throw transport_error(e.what());
	}
}

void log_round_trip(const http::request& req, const http::reply& rep, const std::string& action,
	const std::chrono::system_clock::time_point& start, int verbose)
{
	// protect the output stream from garbled log messages
	std::unique_lock<std::mutex> lock(s_log_lock);

	const std::time_t start_t = std::chrono::system_clock::to_time_t(start);
	const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() - start);

	const auto& [major, minor] = rep.get_version();

	std::clog << std::put_time(std::localtime(&start_t), "[%d/%b/%Y:%H:%M:%S %z]") << ' '
			  << '"' << req.get_method() << ' ' << req.get_url() << ' '
			  << "HTTP/" << major << '.' << minor << "\" "
			  << rep.get_status() << ' '
			  << req.get_payload().length() << ' '
			  << (action.empty() ? "-" : '"' + action + '"') << ' '
			  << duration.count() << "ms" << std::endl;

	if (verbose > 1)
		std::clog << req.get_payload() << std::endl;
}

} // namespace

// --------------------------------------------------------------------

std::string unqualified_type_name(const std::string& name)
{
	// drop the template arguments of each part of the name
	std::string result;
	int depth = 0;

	for (char ch : name)
	{
		if (ch == '<')
			++depth;
		else if (ch == '>')
			--depth;
		else if (depth == 0)
			result += ch;
	}

	auto s = result.rfind("::");
	if (s != std::string::npos)
		result.erase(0, s + 2);

	return result;
}

// --------------------------------------------------------------------

void client::set_soap11_headers(http::request& req, const std::string& action, bool has_body) const
{
	if (not m_config.user_agent.empty())
		req.add_header("User-Agent", m_config.user_agent);

	req.set_header("Content-Type", m_config.content_type.empty() ? "text/xml" : m_config.content_type);

	if (has_body)
	{
		if (m_config.exclude_action_namespace)
			req.add_header("SOAPAction", action);
		else
			req.add_header("SOAPAction", m_config.name_space + '/' + action);
	}
}

void client::set_soap12_headers(http::request& req, const std::string& action)
{
	req.add_header("Content-Type", "application/soap+xml; charset=utf-8; action=\"" + action + '"');
}

void client::execute(const std::string& action, const header_setter& set_headers, std::string payload,
	const std::function<void(const xml::element&)>& decode) const
{
	auto start = std::chrono::system_clock::now();

	auto transport = m_config.transport ? m_config.transport : http::default_transport();

	http::request req("POST", m_config.url, std::move(payload));

	set_headers(req);

	if (m_config.pre)
		m_config.pre(req);

	if (m_config.timeout.count() > 0)
		req.set_context(soapclient::context::with_timeout(m_config.context, m_config.timeout));
	else if (m_config.context)
		req.set_context(m_config.context);

	http::reply rep = execute_request(*transport, req);
	http::message_body& body = rep.get_body();

	try
	{
		if (m_config.post)
			m_config.post(rep);

		if (m_config.verbose > 0)
			log_round_trip(req, rep, action, start, m_config.verbose);

		if (rep.get_status() != http::ok)
		{
			// error pages can be huge, keep only the first part
			std::string text = http::read_all(body, SOAPCLIENT_ERROR_BODY_LIMIT);
			throw http_error(rep.get_status(), rep.get_status_line(), text);
		}

		std::string text = http::read_all(body);

		if (m_config.verbose > 1)
		{
			std::unique_lock<std::mutex> lock(s_log_lock);
			std::clog << text << std::endl;
		}

		try
		{
			xml::document doc;
			doc.read(text, &xml::charset_resolver::instance());

			auto root = doc.child();
			if (root == nullptr)
				throw exception("empty reply");

			if (root->name() != "Envelope")
				throw exception("expected element type <Envelope> but have <" + root->get_qname() + '>');

			// a reply without Body leaves the response untouched
			for (auto& e : *root)
			{
				if (e.name() == "Body")
				{
					decode(e);
					break;
				}
			}
		}
		catch (const std::exception& e)
		{
			throw deserialization_error(e.what());
		}
	}
	catch (...)
	{
		body.close();
		throw;
	}

	body.close();
}

} // namespace soapclient::soap
