// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapclient::http::reply_parser class that parses the HTTP replies a client receives

#include <soapclient/config.hpp>

#include <streambuf>
#include <string>

#include <soapclient/http/reply.hpp>

namespace soapclient::http
{

/// An HTTP message parser with support for Transfer-Encoding: Chunked

// --------------------------------------------------------------------
// A simple tribool, a parser returns true when done, false on an error
// and indeterminate when it needs more input

class parse_result
{
  public:
	enum value_type
	{
		true_value,
		false_value,
		indeterminate_value
	} m_value;

	constexpr parse_result() noexcept
		: m_value(false_value)
	{
	}
	constexpr parse_result(bool init) noexcept
		: m_value(init ? true_value : false_value)
	{
	}
	constexpr parse_result(value_type init) noexcept
		: m_value(init)
	{
	}

	constexpr explicit operator bool() const noexcept { return m_value == true_value; }

	constexpr bool is_indeterminate() const noexcept { return m_value == indeterminate_value; }

	constexpr bool operator==(parse_result rhs) const noexcept { return m_value == rhs.m_value; }
	constexpr bool operator!=(parse_result rhs) const noexcept { return m_value != rhs.m_value; }
};

constexpr parse_result indeterminate = parse_result(parse_result::indeterminate_value);

// --------------------------------------------------------------------

class parser
{
  public:
	virtual ~parser() {}

	virtual void reset();

	/// \brief parse a complete message, returns true when the message
	/// including its body was parsed
	parse_result parse(std::streambuf& text);

	/// \brief parse the initial line and the header lines only. Returns
	/// true when the empty line ending the header section was consumed,
	/// the body bytes following it are left in \a text
	parse_result parse_header(std::streambuf& text);

	/// \brief parse body bytes, the decoded payload is collected and can be
	/// retrieved with take_payload. Returns true when the body is complete.
	parse_result parse_body(std::streambuf& text);

	/// \brief true when the header was parsed and body bytes are expected
	bool expects_body() const			{ return m_parsing_content; }

	/// \brief true when the end of the body is marked by closing the connection
	bool reads_until_eof() const		{ return m_parser == &parser::parse_until_eof; }

	/// \brief return the decoded payload collected so far and clear it
	std::string take_payload();

	parse_result parse_header_lines(char ch);
	parse_result parse_until_eof(char ch);

  protected:
	typedef parse_result (parser::*state_parser)(char ch);

	parser();

	virtual state_parser initial_state() = 0;

	/// \brief called when all header lines were read, decides how the body is framed
	virtual parse_result post_process_headers();

	parse_result parse_chunk(char ch);
	parse_result parse_content(char ch);

	bool find_last_token(const header& h, const std::string& t) const;

	state_parser m_parser;
	int m_state;
	size_t m_chunk_size;
	std::string m_data;

	bool m_parsing_content;
	bool m_header_complete;
	int m_http_version_major, m_http_version_minor;

	header_list m_headers;
	std::string m_payload;
};

/// \brief reply_parser parses the replies a client receives
class reply_parser : public parser
{
  public:
	reply_parser();

	void reset() override;

	/// \brief return the reply parsed so far with \a body as its body
	reply get_reply(std::unique_ptr<message_body> body);

	/// \brief return the parsed reply, its body is the collected payload
	reply get_reply();

	int get_status() const			{ return m_status; }

  private:
	state_parser initial_state() override;

	parse_result post_process_headers() override;

	parse_result parse_initial_line(char ch);

	int m_status = 0;
	std::string m_reason;
};

} // namespace soapclient::http
