// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>
#include <climits>
#include <iostream>
#include <iterator>
#include <vector>

#include <expat.h>

#include <soapclient/xml/document.hpp>

namespace soapclient::xml
{

namespace
{

// --------------------------------------------------------------------
// The expat callbacks build the element tree. Expat is created without
// namespace processing so qualified names and xmlns attributes arrive
// exactly as they were written.

struct expat_handler
{
	expat_handler(element& root)
		: m_root(root) {}

	static void XML_StartElementHandler(void* userData, const XML_Char* name, const XML_Char** atts)
	{
		static_cast<expat_handler*>(userData)->start_element(name, atts);
	}

	static void XML_EndElementHandler(void* userData, const XML_Char* name)
	{
		static_cast<expat_handler*>(userData)->end_element(name);
	}

	static void XML_CharacterDataHandler(void* userData, const XML_Char* s, int len)
	{
		static_cast<expat_handler*>(userData)->character_data(s, len);
	}

	void start_element(const XML_Char* name, const XML_Char** atts)
	{
		element& parent = m_stack.empty() ? m_root : *m_stack.back();
		element& e = parent.emplace_back(name);

		for (const XML_Char** att = atts; att[0] != nullptr and att[1] != nullptr; att += 2)
			e.set_attribute(att[0], att[1]);

		m_stack.push_back(&e);
	}

	void end_element(const XML_Char* /*name*/)
	{
		if (m_stack.empty())
			return;

		element* e = m_stack.back();
		m_stack.pop_back();

		// whitespace used for indenting is not content
		const std::string& content = e->get_content();
		if (not e->empty() and std::all_of(content.begin(), content.end(), [](char ch) { return ch == ' ' or ch == '\t' or ch == '\n' or ch == '\r'; }))
			e->set_content({});
	}

	void character_data(const XML_Char* s, int len)
	{
		if (not m_stack.empty())
			m_stack.back()->add_text(std::string(s, len));
	}

	element& m_root;
	std::vector<element*> m_stack;
};

} // namespace

// --------------------------------------------------------------------

document::document(const std::string& s)
{
	read(s, &charset_resolver::instance());
}

document::document(std::istream& is)
{
	is >> *this;
}

void document::read(std::string_view text, const charset_resolver* resolver)
{
	clear();

	m_declared_encoding = sniff_declared_encoding(text);

	if (resolver != nullptr and not m_declared_encoding.empty() and not is_utf8_label(m_declared_encoding))
	{
		auto decoder = resolver->get_decoder(m_declared_encoding);
		std::string utf8 = decoder->decode(text);

		// the declaration still names the original encoding, tell expat to ignore it
		parse(utf8, "UTF-8");
	}
	else
		parse(text, nullptr);
}

void document::parse(std::string_view text, const char* encoding)
{
	XML_Parser p = XML_ParserCreate(encoding);

	if (p == nullptr)
		throw exception("failed to create expat parser object");

	expat_handler handler(*this);

	XML_SetUserData(p, &handler);
	XML_SetElementHandler(p, expat_handler::XML_StartElementHandler, expat_handler::XML_EndElementHandler);
	XML_SetCharacterDataHandler(p, expat_handler::XML_CharacterDataHandler);

	const size_t kChunkSize = INT_MAX / 2;

	try
	{
		do
		{
			size_t k = std::min(text.length(), kChunkSize);
			bool last = k == text.length();

			if (XML_Parse(p, text.data(), static_cast<int>(k), last) != XML_STATUS_OK)
			{
				throw parse_error(XML_ErrorString(XML_GetErrorCode(p)),
					XML_GetCurrentLineNumber(p), XML_GetCurrentColumnNumber(p));
			}

			text.remove_prefix(k);
		}
		while (not text.empty());
	}
	catch (const std::exception&)
	{
		XML_ParserFree(p);
		throw;
	}

	XML_ParserFree(p);
}

// --------------------------------------------------------------------

void document::write(std::ostream& os, format_info fmt) const
{
	if (m_write_xml_decl)
	{
		os << R"(<?xml version="1.0" encoding="UTF-8"?>)";
		if (fmt.indent)
			os << std::endl;
	}

	for (auto& e : *this)
		e.write(os, fmt);
}

std::ostream& operator<<(std::ostream& os, const document& doc)
{
	doc.write(os, doc.m_fmt);
	return os;
}

std::istream& operator>>(std::istream& is, document& doc)
{
	std::string text{ std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>() };
	doc.read(text, &charset_resolver::instance());
	return is;
}

namespace literals
{
	document operator""_xml(const char* text, size_t length)
	{
		document doc;
		doc.read(std::string_view(text, length), &charset_resolver::instance());
		return doc;
	}
} // namespace literals

} // namespace soapclient::xml
