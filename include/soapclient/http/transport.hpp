//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapclient::http::transport, the interface used to
/// execute a HTTP request, and the default implementation using Boost.Asio

#include <soapclient/config.hpp>

#include <chrono>
#include <memory>

#include <soapclient/http/reply.hpp>
#include <soapclient/http/request.hpp>

namespace soapclient::http
{

/// \brief A transport executes a request and returns the reply
///
/// Implementations throw soapclient::transport_error when the exchange
/// could not be completed and soapclient::cancelled_error when the context
/// attached to the request was cancelled or expired. A reply with any status
/// code is a successful exchange as far as the transport is concerned.
///
/// The body of the returned reply may still be attached to the network
/// connection, the caller is responsible for closing it.

class transport
{
  public:
	virtual ~transport() = default;

	virtual reply execute(request& req) = 0;
};

/// \brief HTTP/1.1 over plain TCP, one connection per request
///
/// The request is sent with a Host, Content-Length and Connection: close
/// header. Replies framed with Content-Length, chunked transfer encoding
/// or by closing the connection are understood.

class basic_transport : public transport
{
  public:
	/// \brief \a poll_interval is how often the context of a request is checked
	basic_transport(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(20))
		: m_poll_interval(poll_interval) {}

	reply execute(request& req) override;

  private:
	std::chrono::milliseconds m_poll_interval;
};

/// \brief the transport used when none was configured
std::shared_ptr<transport> default_transport();

} // namespace soapclient::http
