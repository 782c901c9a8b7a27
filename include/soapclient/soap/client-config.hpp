//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapclient::soap::client_config, the settings of a soap::client

#include <soapclient/config.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include <soapclient/context.hpp>
#include <soapclient/http/reply.hpp>
#include <soapclient/http/request.hpp>
#include <soapclient/http/transport.hpp>
#include <soapclient/soap/header.hpp>

namespace soapclient::soap
{

/// \brief The settings used by a soap::client
///
/// A client_config is not modified by the client, the same config can be
/// used by several round trips at the same time provided the transport
/// and the hooks can handle that.

struct client_config
{
	/// \brief The endpoint, also the default namespace when name_space is empty
	std::string url;

	/// \brief The User-Agent header, not sent when empty
	std::string user_agent;

	/// \brief The SOAP namespace, written as default namespace and used
	/// as prefix of the SOAPAction
	std::string name_space;

	std::string urn_namespace;		///< xmlns:urn, omitted when empty
	std::string tns_namespace;		///< xmlns:tns, omitted when empty
	std::string xsi_namespace;		///< xmlns:xsi, omitted when empty

	/// \brief Send the bare action name as SOAPAction
	bool exclude_action_namespace = false;

	/// \brief The namespace of the soapenv prefix, kEnvelopeNamespace when empty
	std::string envelope_namespace;

	/// \brief Written as content of the soapenv:Header, omitted when empty
	soap::header header;

	/// \brief The Content-Type of requests, "text/xml" when empty. Not used by SOAP 1.2 round trips.
	std::string content_type = "text/xml";

	/// \brief Called with the request after the headers were set, before it is sent
	std::function<void(http::request&)> pre;

	/// \brief Called with the reply before its body is read
	std::function<void(const http::reply&)> post;

	/// \brief Cancels round trips or limits the time they may take
	std::shared_ptr<const soapclient::context> context;

	/// \brief When not zero, each round trip is given this much time. The
	/// deadline is checked in addition to the one of \a context.
	std::chrono::milliseconds timeout{ 0 };

	/// \brief Extra namespaces for the envelope, the keys are the prefixes
	/// "tns0" up to "tns14". Other keys are ignored.
	std::map<std::string, std::string> used_namespaces;

	/// \brief The transport executing the requests, the default transport when null
	std::shared_ptr<http::transport> transport;

	/// \brief Trace level, 1 logs one line per round trip, 2 also logs the payloads
	int verbose = 0;
};

} // namespace soapclient::soap
