// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapclient::xml::document class

#include <soapclient/config.hpp>

#include <iosfwd>
#include <string_view>

#include <soapclient/xml/charset.hpp>
#include <soapclient/xml/serialize.hpp>

namespace soapclient::xml
{

/// \brief the exception thrown when the expat parser reports an error
class parse_error : public exception
{
  public:
	parse_error(const std::string& message, long line, long column)
		: exception(message + " at line " + std::to_string(line) + " column " + std::to_string(column))
		, m_line(line), m_column(column) {}

	long get_line() const		{ return m_line; }
	long get_column() const		{ return m_column; }

  private:
	long m_line, m_column;
};

/// soapclient::xml::document is the class that contains a parsed XML file.
/// You can create an empty document and add elements to it, or you can
/// create it by specifying a string containing XML or an std::istream
/// to parse.
///
/// The document itself is an element without a name, its only child is
/// the root element.
///
/// Parsing is done by expat. When the XML declaration names an encoding
/// other than UTF-8 and a charset_resolver was given, the text is first
/// converted to UTF-8 with the decoder the resolver returns. Without a
/// resolver, expat's built in support for UTF-8, UTF-16, ISO-8859-1 and
/// US-ASCII is all there is.

class document : public element
{
  public:
	/// \brief Constructor for an empty document.
	document() = default;

	document(const document&) = default;
	document(document&&) = default;
	document& operator=(const document&) = default;
	document& operator=(document&&) = default;

	/// \brief Constructor that will parse the XML passed in argument \a s
	document(const std::string& s);

	/// \brief Constructor that will parse the XML read from \a is
	document(std::istream& is);

	/// \brief parse \a text, using \a resolver for declared encodings other than UTF-8
	void read(std::string_view text, const charset_resolver* resolver = nullptr);

	/// \brief whether to write a XML declaration
	bool writes_xml_decl() const							{ return m_write_xml_decl; }
	/// \brief if \a w is true, an XML declaration will be written
	void set_write_xml_decl(bool w)							{ m_write_xml_decl = w; }

	/// \brief the encoding found in the XML declaration of the parsed text
	const std::string& get_declared_encoding() const		{ return m_declared_encoding; }

	/// \brief collapse means replacing e.g. `<foo></foo>` with `<foo/>`
	bool collapses_empty_tags() const						{ return m_fmt.collapse_tags; }
	void set_collapse_empty_tags(bool c)					{ m_fmt.collapse_tags = c; }

	/// \brief the root element, nullptr if the document is empty
	element* child()										{ return empty() ? nullptr : &front(); }
	const element* child() const							{ return empty() ? nullptr : &front(); }

	/// \brief Serialization support
	template <typename T>
	void serialize(const char* name, const T& data); ///< Serialize \a data into a document containing \a name as root node

	/// \brief Serialization support
	template <typename T>
	void deserialize(const char* name, T& data); ///< Deserialize root node with name \a name into \a data.

	void write(std::ostream& os, format_info fmt) const override;

	/// \brief Write out the document
	friend std::ostream& operator<<(std::ostream& os, const document& doc);

	/// \brief Read in a document
	friend std::istream& operator>>(std::istream& is, document& doc);

  private:
	void parse(std::string_view text, const char* encoding);

	bool m_write_xml_decl = false;
	std::string m_declared_encoding;
	format_info m_fmt;
};

namespace literals
{
	document operator""_xml(const char* text, size_t length);
}

// --------------------------------------------------------------------

template <typename T>
void document::serialize(const char* name, const T& data)
{
	serializer sr(*this);
	sr.serialize_element(name, data);
}

template <typename T>
void document::deserialize(const char* name, T& data)
{
	if (child() == nullptr)
		throw exception("empty document");

	if (not name_matches(*child(), name))
		throw exception("root mismatch, expected " + std::string(name) + " but found " + child()->get_qname());

	deserializer sr(*this);
	sr.deserialize_element(name, data);
}

} // namespace soapclient::xml
