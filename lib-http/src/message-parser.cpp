// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <soapclient/config.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

#include <boost/algorithm/string.hpp>

#include <soapclient/http/message-parser.hpp>

namespace ba = boost::algorithm;

namespace soapclient::http
{

namespace
{
	bool is_tspecial_or_cntrl(int c)
	{
		switch (c)
		{
			case '(':
			case ')':
			case '<':
			case '>':
			case '@':
			case ',':
			case ';':
			case ':':
			case '\\':
			case '"':
			case '/':
			case '[':
			case ']':
			case '?':
			case '=':
			case '{':
			case '}':
			case ' ':
			case 0x7f:
				return true;

			default:
				return c <= 0x1f;
		}
	}

} // namespace

parser::parser()
{
	reset();
}

void parser::reset()
{
	m_parser = nullptr;
	m_state = 0;
	m_chunk_size = 0;
	m_data.clear();
	m_parsing_content = false;
	m_header_complete = false;
	m_http_version_major = 1;
	m_http_version_minor = 0;
	m_headers.clear();
	m_payload.clear();
}

std::string parser::take_payload()
{
	std::string result;
	std::swap(result, m_payload);
	return result;
}

parse_result parser::parse(std::streambuf& text)
{
	parse_result result = parse_header(text);

	if (result and m_parsing_content)
		result = parse_body(text);

	return result;
}

parse_result parser::parse_header(std::streambuf& text)
{
	if (m_header_complete)
		return true;

	if (m_parser == nullptr)
		m_parser = initial_state();

	parse_result result = indeterminate;

	while (text.in_avail() > 0 and result.is_indeterminate())
		result = (this->*m_parser)(static_cast<char>(text.sbumpc()));

	return result;
}

parse_result parser::parse_body(std::streambuf& text)
{
	if (not m_parsing_content)
		return m_header_complete;

	parse_result result = indeterminate;

	while (text.in_avail() > 0 and result.is_indeterminate())
		result = (this->*m_parser)(static_cast<char>(text.sbumpc()));

	return result;
}

parse_result parser::parse_header_lines(char ch)
{
	parse_result result = indeterminate;

	// parse the header lines, consisting of
	// NAME: VALUE
	// optionally followed by more VALUE prefixed by white space on the next lines

	switch (m_state)
	{
		case 0:
			// If the header starts with \r, it is the start of an empty line
			// which indicates the end of the header section
			if (ch == '\r')
				m_state = 20;
			else if ((ch == ' ' or ch == '\t') and not m_headers.empty())
				m_state = 10;
			else if (is_tspecial_or_cntrl(ch))
				result = false;
			else
			{
				m_headers.push_back(header());
				m_headers.back().name += ch;
				m_state = 1;
			}
			break;

		case 1:
			if (ch == ':')
				++m_state;
			else if (is_tspecial_or_cntrl(ch))
				result = false;
			else
				m_headers.back().name += ch;
			break;

		case 2:
			if (ch == ' ')
				++m_state;
			else if (ch == '\r')
				m_state = 5;
			else
			{
				m_headers.back().value += ch;
				m_state = 4;
			}
			break;

		case 3:
			if (ch == '\r')
				m_state += 2;
			else if (ch != ' ')
			{
				m_headers.back().value += ch;
				++m_state;
			}
			break;

		case 4:
			if (ch == '\r')
				++m_state;
			else
				m_headers.back().value += ch;
			break;

		case 5:
			if (ch == '\n')
			{
				ba::trim_right(m_headers.back().value);
				m_state = 0;
			}
			else
				result = false;
			break;

		case 10:
			if (ch == '\r')
				m_state = 4;
			else if (std::iscntrl(static_cast<unsigned char>(ch)))
				result = false;
			else if (not(ch == ' ' or ch == '\t'))
			{
				m_headers.back().value += ' ';
				m_headers.back().value += ch;
				m_state = 4;
			}
			break;

		case 20:
			if (ch == '\n')
			{
				m_header_complete = true;
				result = post_process_headers();
			}
			else
				result = false;
			break;
	}

	return result;
}

bool parser::find_last_token(const header& h, const std::string& t) const
{
	bool result = false;
	if (h.value.length() >= t.length())
	{
		auto ix = h.value.length() - t.length();

		result = ba::iequals(h.value.substr(ix), t);
		if (result)
			result = ix == 0 or h.value[ix - 1] == ' ' or h.value[ix - 1] == ',';
	}

	return result;
}

parse_result parser::post_process_headers()
{
	parse_result result = true;

	auto i = std::find_if(m_headers.begin(), m_headers.end(), [](const header& h)
		{ return ba::iequals(h.name, "transfer-encoding"); });
	if (i != m_headers.end())
	{
		if (find_last_token(*i, "chunked"))
		{
			m_parser = &parser::parse_chunk;
			m_state = 0;
			m_parsing_content = true;
		}
		else
			result = false;
	}
	else
	{
		i = std::find_if(m_headers.begin(), m_headers.end(), [](const header& h)
			{ return ba::iequals(h.name, "content-length"); });
		if (i != m_headers.end())
		{
			auto r = std::from_chars(i->value.data(), i->value.data() + i->value.length(), m_chunk_size);
			if (r.ec != std::errc() or r.ptr != i->value.data() + i->value.length())
				result = false;
			else if (m_chunk_size)
			{
				m_parser = &parser::parse_content;
				m_parsing_content = true;
			}
			else
				m_parsing_content = false;
		}
	}

	return result;
}

parse_result parser::parse_chunk(char ch)
{
	parse_result result = indeterminate;

	switch (m_state)
	{
			// Transfer-Encoding: Chunked
			// lines starting with hex encoded length, optionally followed by text
			// then a newline (\r\n) and the actual length bytes.
			// This repeats until length is zero

			// new chunk, starts with hex encoded length
		case 0:
			if (std::isxdigit(static_cast<unsigned char>(ch)))
			{
				m_data = ch;
				++m_state;
			}
			else
				result = false;
			break;

		case 1:
			if (std::isxdigit(static_cast<unsigned char>(ch)))
				m_data += ch;
			else if (ch == ';')
				++m_state;
			else if (ch == '\r')
				m_state = 3;
			else
				result = false;
			break;

		case 2:
			if (ch == '\r')
				++m_state;
			else if (ch != '=' and ch != ';' and ch != '"' and is_tspecial_or_cntrl(ch) and ch != ' ')
				result = false;
			break;

		case 3:
			if (ch == '\n')
			{
				auto r = std::from_chars(m_data.data(), m_data.data() + m_data.length(), m_chunk_size, 16);

				if (r.ec != std::errc{})
					result = false;
				else if (m_chunk_size > 0)
					++m_state;
				else
					m_state = 10;
			}
			else
				result = false;
			break;

		case 4:
			m_payload += ch;
			if (--m_chunk_size == 0)
				m_state = 5; // parse trailing \r\n
			break;

		case 5:
			if (ch == '\r')
				++m_state;
			else
				result = false;
			break;
		case 6:
			if (ch == '\n')
				m_state = 0;
			else
				result = false;
			break;

			// optional trailer lines followed by the final \r\n
		case 10:
			if (ch == '\r')
				m_state = 11;
			else
				m_state = 12;
			break;
		case 11:
			if (ch == '\n')
			{
				m_parsing_content = false;
				result = true;
			}
			else
				result = false;
			break;
		case 12:
			if (ch == '\r')
				m_state = 13;
			break;
		case 13:
			if (ch == '\n')
				m_state = 10;
			else
				result = false;
			break;
	}

	return result;
}

parse_result parser::parse_content(char ch)
{
	parse_result result = indeterminate;

	// here we simply read m_chunk_size of bytes and finish
	m_payload += ch;

	if (--m_chunk_size == 0)
	{
		result = true;
		m_parsing_content = false;
	}

	return result;
}

parse_result parser::parse_until_eof(char ch)
{
	m_payload += ch;
	return indeterminate;
}

// --------------------------------------------------------------------
//

reply_parser::reply_parser()
{
}

void reply_parser::reset()
{
	parser::reset();
	m_status = 0;
	m_reason.clear();
}

parser::state_parser reply_parser::initial_state()
{
	return static_cast<state_parser>(&reply_parser::parse_initial_line);
}

parse_result reply_parser::post_process_headers()
{
	// these never have a body
	if (m_status / 100 == 1 or m_status == no_content or m_status == not_modified)
	{
		m_parsing_content = false;
		return true;
	}

	parse_result result = parser::post_process_headers();

	// no framing information, the body ends when the server closes the connection
	if (result and not m_parsing_content and
		std::none_of(m_headers.begin(), m_headers.end(), [](const header& h) { return ba::iequals(h.name, "content-length"); }))
	{
		m_parser = &parser::parse_until_eof;
		m_parsing_content = true;
	}

	return result;
}

reply reply_parser::get_reply(std::unique_ptr<message_body> body)
{
	return { m_status, m_reason, { m_http_version_major, m_http_version_minor }, std::move(m_headers), std::move(body) };
}

reply reply_parser::get_reply()
{
	return get_reply(std::make_unique<string_body>(take_payload()));
}

parse_result reply_parser::parse_initial_line(char ch)
{
	parse_result result = indeterminate;

	// a state machine to parse the initial reply line
	// which consists of:
	// HTTP/1.{0,1} XXX status-message

	switch (m_state)
	{
		// we're parsing the initial HTTP/1.x here
		case 0:
			if (ch == 'H')
				++m_state;
			else
				result = false;
			break;
		case 1:
			if (ch == 'T')
				++m_state;
			else
				result = false;
			break;
		case 2:
			if (ch == 'T')
				++m_state;
			else
				result = false;
			break;
		case 3:
			if (ch == 'P')
				++m_state;
			else
				result = false;
			break;
		case 4:
			if (ch == '/')
				++m_state;
			else
				result = false;
			break;
		case 5:
			if (ch == '1')
				++m_state;
			else
				result = false;
			break;
		case 6:
			if (ch == '.')
				++m_state;
			else
				result = false;
			break;
		case 7:
			if (ch == '1' or ch == '0')
			{
				m_http_version_minor = ch - '0';
				++m_state;
			}
			else
				result = false;
			break;

		case 8:
			if (ch == ' ')
				++m_state;
			else
				result = false;
			break;

		// we're parsing the result code here (three digits)
		case 9:
			if (std::isdigit(static_cast<unsigned char>(ch)))
			{
				m_status = 100 * (ch - '0');
				++m_state;
			}
			else
				result = false;
			break;

		case 10:
			if (std::isdigit(static_cast<unsigned char>(ch)))
			{
				m_status += 10 * (ch - '0');
				++m_state;
			}
			else
				result = false;
			break;

		case 11:
			if (std::isdigit(static_cast<unsigned char>(ch)))
			{
				m_status += 1 * (ch - '0');
				++m_state;
			}
			else
				result = false;
			break;

		// the reason phrase may be missing altogether
		case 12:
			if (ch == ' ')
				++m_state;
			else if (ch == '\r')
				m_state = 14;
			else
				result = false;
			break;

		// we're parsing the status message here
		case 13:
			if (ch == '\r')
				++m_state;
			else
				m_reason += ch;
			break;

		case 14:
			if (ch == '\n')
			{
				m_state = 0;
				m_parser = &parser::parse_header_lines;
			}
			else
				result = false;
			break;
	}

	return result;
}

} // namespace soapclient::http
