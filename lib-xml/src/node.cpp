// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>
#include <iostream>
#include <tuple>

#include <soapclient/xml/node.hpp>

namespace soapclient::xml
{

// --------------------------------------------------------------------

namespace
{
	using unicode = char32_t;

	const unicode kReplacementCharacter = 0xFFFD;

	/// \brief decode the character starting at \a s[i], returns the character
	/// and its length in bytes. Invalid sequences decode as one byte U+FFFD
	std::tuple<unicode,size_t> decode_char(const std::string& s, size_t i)
	{
		unicode result = static_cast<unsigned char>(s[i]);
		size_t length = 1, n = 0;
		unsigned char lo = 0x80, hi = 0xbf;

		if (result < 0x80)
			return { result, 1 };

		if (result >= 0xc2 and result <= 0xdf)
		{
			n = 1;
			result &= 0x1f;
		}
		else if (result >= 0xe0 and result <= 0xef)
		{
			n = 2;
			if (result == 0xe0)
				lo = 0xa0;			// overlong
			else if (result == 0xed)
				hi = 0x9f;			// surrogates
			result &= 0x0f;
		}
		else if (result >= 0xf0 and result <= 0xf4)
		{
			n = 3;
			if (result == 0xf0)
				lo = 0x90;			// overlong
			else if (result == 0xf4)
				hi = 0x8f;			// beyond U+10FFFF
			result &= 0x07;
		}
		else
			return { kReplacementCharacter, 1 };

		for (; length <= n; ++length)
		{
			if (i + length >= s.length())
				return { kReplacementCharacter, 1 };

			unsigned char ch = static_cast<unsigned char>(s[i + length]);
			if (ch < lo or ch > hi)
				return { kReplacementCharacter, 1 };

			lo = 0x80;
			hi = 0xbf;

			result = (result << 6) | (ch & 0x3f);
		}

		return { result, length };
	}

	bool is_xml_char(unicode uc)
	{
		return uc == 0x09 or uc == 0x0a or uc == 0x0d or
			(uc >= 0x20 and uc <= 0xd7ff) or
			(uc >= 0xe000 and uc <= 0xfffd) or
			(uc >= 0x10000 and uc <= 0x10ffff);
	}

} // namespace

void write_string(std::ostream& os, const std::string& s, bool escape_whitespace, bool escape_quot)
{
	for (size_t i = 0; i < s.length(); )
	{
		auto [uc, length] = decode_char(s, i);

		switch (uc)
		{
			case '&':	os << "&amp;"; break;
			case '<':	os << "&lt;"; break;
			case '>':	os << "&gt;"; break;
			case '\"':	if (escape_quot)		os << "&quot;"; else os << '"'; break;
			case '\n':	if (escape_whitespace)	os << "&#10;"; else os << '\n'; break;
			case '\r':	if (escape_whitespace)	os << "&#13;"; else os << '\r'; break;
			case '\t':	if (escape_whitespace)	os << "&#9;"; else os << '\t'; break;
			default:
				if (uc == kReplacementCharacter or not is_xml_char(uc))
					os << "\xef\xbf\xbd";
				else
					os.write(s.data() + i, length);
				break;
		}

		i += length;
	}
}

std::pair<std::string,std::string> split_qname(const std::string& qname)
{
	auto s = qname.find(':');
	if (s == std::string::npos)
		return { "", qname };
	return { qname.substr(0, s), qname.substr(s + 1) };
}

// --------------------------------------------------------------------

void attribute::write(std::ostream& os, format_info fmt) const
{
	os << m_qname << "=\"";
	write_string(os, m_value, fmt.escape_white_space, true);
	os << '"';
}

// --------------------------------------------------------------------

attribute_set::attribute_set(std::initializer_list<attribute> attrs)
{
	for (auto& a : attrs)
		emplace(a.get_qname(), a.value());
}

attribute_set::iterator attribute_set::find(const std::string& qname)
{
	return std::find_if(m_attributes.begin(), m_attributes.end(),
		[&qname](const attribute& a) { return a.get_qname() == qname; });
}

attribute_set::const_iterator attribute_set::find(const std::string& qname) const
{
	return std::find_if(m_attributes.begin(), m_attributes.end(),
		[&qname](const attribute& a) { return a.get_qname() == qname; });
}

void attribute_set::emplace(const std::string& qname, const std::string& value)
{
	auto i = find(qname);
	if (i != m_attributes.end())
		i->value(value);
	else
		m_attributes.emplace_back(qname, value);
}

void attribute_set::erase(const std::string& qname)
{
	auto i = find(qname);
	if (i != m_attributes.end())
		m_attributes.erase(i);
}

bool attribute_set::operator==(const attribute_set& as) const
{
	// attribute order is not significant in XML
	bool result = m_attributes.size() == as.m_attributes.size();

	for (auto a = m_attributes.begin(); result and a != m_attributes.end(); ++a)
	{
		auto b = as.find(a->get_qname());
		result = b != as.end() and b->value() == a->value();
	}

	return result;
}

// --------------------------------------------------------------------

bool element::operator==(const element& e) const
{
	bool result = m_qname == e.m_qname and
		m_content == e.m_content and
		m_attributes == e.m_attributes and
		m_nodes.size() == e.m_nodes.size();

	for (auto a = m_nodes.begin(), b = e.m_nodes.begin(); result and a != m_nodes.end(); ++a, ++b)
		result = *a == *b;

	return result;
}

std::string element::get_attribute(const std::string& qname) const
{
	std::string result;

	auto a = m_attributes.find(qname);
	if (a != m_attributes.end())
		result = a->value();

	return result;
}

void element::set_attribute(const std::string& qname, const std::string& value)
{
	m_attributes.emplace(qname, value);
}

std::string element::namespace_for_prefix(const std::string& prefix) const
{
	return get_attribute(prefix.empty() ? "xmlns" : "xmlns:" + prefix);
}

element* element::find_first(const std::string& qname)
{
	auto i = std::find_if(m_nodes.begin(), m_nodes.end(), [&qname](const element& e) { return name_matches(e, qname); });
	return i == m_nodes.end() ? nullptr : &*i;
}

const element* element::find_first(const std::string& qname) const
{
	auto i = std::find_if(m_nodes.begin(), m_nodes.end(), [&qname](const element& e) { return name_matches(e, qname); });
	return i == m_nodes.end() ? nullptr : &*i;
}

void element::clear()
{
	m_attributes.clear();
	m_content.clear();
	m_nodes.clear();
}

void element::write(std::ostream& os, format_info fmt) const
{
	if (fmt.indent)
		os << std::string(fmt.indent_width * fmt.indent_level, ' ');

	os << '<' << m_qname;

	for (auto& attr : m_attributes)
	{
		os << ' ';
		attr.write(os, fmt);
	}

	if (fmt.collapse_tags and m_content.empty() and m_nodes.empty())
		os << "/>";
	else
	{
		os << '>';

		write_string(os, m_content, fmt.escape_white_space, fmt.escape_double_quote);

		if (not m_nodes.empty())
		{
			format_info sub_fmt = fmt;
			++sub_fmt.indent_level;

			for (auto& n : m_nodes)
			{
				if (fmt.indent)
					os << std::endl;
				n.write(os, sub_fmt);
			}

			if (fmt.indent)
				os << std::endl << std::string(fmt.indent_width * fmt.indent_level, ' ');
		}

		os << "</" << m_qname << '>';
	}
}

std::ostream& operator<<(std::ostream& os, const element& e)
{
	format_info fmt;
	e.write(os, fmt);
	return os;
}

// --------------------------------------------------------------------

bool name_matches(const element& e, const std::string& name)
{
	bool result = e.get_qname() == name;

	if (not result and name.find(':') == std::string::npos)
		result = e.name() == name;

	return result;
}

} // namespace soapclient::xml
