//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <soapclient/config.hpp>

#include <algorithm>
#include <sstream>

#include <boost/asio.hpp>

#include <soapclient/exception.hpp>
#include <soapclient/http/message-parser.hpp>
#include <soapclient/http/transport.hpp>
#include <soapclient/http/uri.hpp>
#include <soapclient/streambuf.hpp>

namespace soapclient::http
{

using boost::asio::ip::tcp;

namespace
{

// --------------------------------------------------------------------
// A connection runs its own io_context. Each operation is started
// asynchronously and the io_context is run in small steps, checking the
// context of the request in between. When that context is done the
// socket is closed, which aborts the pending operation.

class client_connection
{
  public:
	client_connection(std::shared_ptr<const context> ctx, std::chrono::milliseconds poll_interval)
		: m_socket(m_io_context)
		, m_resolver(m_io_context)
		, m_context(std::move(ctx))
		, m_poll_interval(poll_interval)
	{
	}

	client_connection(const client_connection&) = delete;
	client_connection& operator=(const client_connection&) = delete;

	~client_connection()
	{
		close();
	}

	void connect(const uri& u)
	{
		boost::system::error_code ec;
		bool finished = false;
		tcp::resolver::results_type endpoints;

		m_resolver.async_resolve(u.get_host(), u.get_port(),
			[&](const boost::system::error_code& e, tcp::resolver::results_type results)
			{
				ec = e;
				endpoints = std::move(results);
				finished = true;
			});

		run_until(finished);

		if (ec)
			throw transport_error("dial tcp " + u.get_authority() + ": " + ec.message());

		finished = false;
		boost::asio::async_connect(m_socket, endpoints,
			[&](const boost::system::error_code& e, const tcp::endpoint&)
			{
				ec = e;
				finished = true;
			});

		run_until(finished);

		if (ec)
			throw transport_error("dial tcp " + u.get_authority() + ": " + ec.message());
	}

	void write(const std::string& data)
	{
		boost::system::error_code ec;
		bool finished = false;

		boost::asio::async_write(m_socket, boost::asio::buffer(data),
			[&](const boost::system::error_code& e, size_t)
			{
				ec = e;
				finished = true;
			});

		run_until(finished);

		if (ec)
			throw transport_error("write: " + ec.message());
	}

	/// returns 0 when the server closed the connection
	size_t read_some(char* data, size_t length)
	{
		boost::system::error_code ec;
		bool finished = false;
		size_t result = 0;

		m_socket.async_read_some(boost::asio::buffer(data, length),
			[&](const boost::system::error_code& e, size_t bytes_transferred)
			{
				ec = e;
				result = bytes_transferred;
				finished = true;
			});

		run_until(finished);

		if (ec == boost::asio::error::eof)
			result = 0;
		else if (ec)
			throw transport_error("read: " + ec.message());

		return result;
	}

	void close()
	{
		boost::system::error_code ignored;

		if (m_socket.is_open())
		{
			m_socket.shutdown(tcp::socket::shutdown_both, ignored);
			m_socket.close(ignored);
		}
	}

  private:
	void run_until(const bool& finished)
	{
		m_io_context.restart();

		while (not finished)
		{
			if (m_context and m_context->done())
			{
				m_resolver.cancel();
				close();

				// the aborted handlers refer to the stack of our caller, let them run
				m_io_context.run();

				throw cancelled_error(m_context->reason());
			}

			m_io_context.run_one_for(m_poll_interval);
		}
	}

	boost::asio::io_context m_io_context;
	tcp::socket m_socket;
	tcp::resolver m_resolver;
	std::shared_ptr<const context> m_context;
	std::chrono::milliseconds m_poll_interval;
};

// --------------------------------------------------------------------
// The body of a reply, read from the connection when asked for

class connection_body : public message_body
{
  public:
	connection_body(std::unique_ptr<client_connection> connection, const reply_parser& parser,
		std::string data, bool complete)
		: m_connection(std::move(connection))
		, m_parser(parser)
		, m_data(std::move(data))
		, m_complete(complete)
	{
	}

	size_t read(char* data, size_t length) override
	{
		if (m_closed)
			throw exception("read on closed body");

		while (m_offset == m_data.length() and not m_complete)
			fill();

		size_t n = std::min(length, m_data.length() - m_offset);
		std::copy(m_data.begin() + m_offset, m_data.begin() + m_offset + n, data);
		m_offset += n;

		return n;
	}

	void close() override
	{
		if (not m_closed)
		{
			m_closed = true;
			m_connection->close();
		}
	}

  private:
	void fill()
	{
		char buffer[8192];

		m_data.erase(0, m_offset);
		m_offset = 0;

		size_t n = m_connection->read_some(buffer, sizeof(buffer));
		if (n == 0)
		{
			if (not m_parser.reads_until_eof())
				throw transport_error("unexpected EOF");
			m_complete = true;
		}
		else
		{
			char_streambuf sb(buffer, n);

			auto r = m_parser.parse_body(sb);
			if (r == false)
				throw transport_error("malformed HTTP response body");

			m_complete = static_cast<bool>(r);
		}

		m_data += m_parser.take_payload();
	}

	std::unique_ptr<client_connection> m_connection;
	reply_parser m_parser;
	std::string m_data;
	size_t m_offset = 0;
	bool m_complete;
	bool m_closed = false;
};

uri parse_url(const std::string& url)
{
	try
	{
		return uri(url);
	}
	catch (const uri_parse_error& e)
	{
		throw transport_error(e.what());
	}
}

} // namespace

// --------------------------------------------------------------------

reply basic_transport::execute(request& req)
{
	uri u = parse_url(req.get_url());

	if (u.get_scheme() != "http")
		throw transport_error("unsupported protocol scheme \"" + u.get_scheme() + "\"");

	auto& ctx = req.get_context();
	if (ctx and ctx->done())
		throw cancelled_error(ctx->reason());

	if (not req.has_header("Host"))
		req.set_header("Host", u.get_authority());
	req.set_header("Content-Length", std::to_string(req.get_payload().length()));
	req.set_header("Connection", "close");

	auto connection = std::make_unique<client_connection>(ctx, m_poll_interval);
	connection->connect(u);

	std::ostringstream os;
	os << req;
	connection->write(os.str());

	reply_parser parser;
	bool complete = false;

	for (;;)
	{
		char buffer[4096];

		size_t n = connection->read_some(buffer, sizeof(buffer));
		if (n == 0)
			throw transport_error("unexpected EOF");

		char_streambuf sb(buffer, n);

		auto r = parser.parse_header(sb);
		if (r.is_indeterminate())
			continue;

		if (not r)
			throw transport_error("malformed HTTP response");

		// what is left in the buffer belongs to the body
		if (parser.expects_body())
		{
			r = parser.parse_body(sb);
			if (r == false)
				throw transport_error("malformed HTTP response body");
			complete = static_cast<bool>(r);
		}
		else
			complete = true;

		break;
	}

	std::string data = parser.take_payload();
	auto body = std::make_unique<connection_body>(std::move(connection), parser, std::move(data), complete);

	return parser.get_reply(std::move(body));
}

std::shared_ptr<transport> default_transport()
{
	static std::shared_ptr<transport> s_default_transport = std::make_shared<basic_transport>();
	return s_default_transport;
}

} // namespace soapclient::http
