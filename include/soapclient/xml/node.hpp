// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// the core of the XML layer: element and attribute
///
/// The model is deliberately small. An element has a qualified name, an
/// ordered list of attributes, text content and child elements. Comments
/// and processing instructions are not kept. That is all a SOAP message needs.

#include <soapclient/config.hpp>

#include <initializer_list>
#include <iosfwd>
#include <list>
#include <string>
#include <utility>
#include <vector>

#include <soapclient/exception.hpp>

namespace soapclient::xml
{

class element;

// --------------------------------------------------------------------

/// \brief Settings used when writing out XML
struct format_info
{
	bool indent = false;
	int indent_width = 0;
	int indent_level = 0;
	bool collapse_tags = true;
	bool escape_white_space = false;
	bool escape_double_quote = true;
};

/// \brief write \a s to \a os escaping the characters that need it.
///
/// Bytes that are not valid UTF-8 and characters that XML 1.0 does not
/// allow, like most control characters, are written as U+FFFD.
void write_string(std::ostream& os, const std::string& s, bool escape_whitespace, bool escape_quot);

/// \brief split a qualified name into prefix and local name
std::pair<std::string,std::string> split_qname(const std::string& qname);

// --------------------------------------------------------------------

/// \brief An attribute of an element, a qualified name and a value

class attribute
{
  public:
	attribute(const std::string& qname, const std::string& value)
		: m_qname(qname), m_value(value) {}

	attribute(const attribute&) = default;
	attribute(attribute&&) = default;
	attribute& operator=(const attribute&) = default;
	attribute& operator=(attribute&&) = default;

	bool operator==(const attribute& a) const { return m_qname == a.m_qname and m_value == a.m_value; }
	bool operator!=(const attribute& a) const { return not operator==(a); }

	/// \brief the qualified name, including the prefix if any
	const std::string& get_qname() const			{ return m_qname; }
	void set_qname(const std::string& qname)		{ m_qname = qname; }

	/// \brief the name without the prefix
	std::string name() const						{ return split_qname(m_qname).second; }
	std::string get_prefix() const					{ return split_qname(m_qname).first; }

	const std::string& value() const				{ return m_value; }
	void value(const std::string& v)				{ m_value = v; }

	/// \brief returns true if this attribute declares a namespace
	bool is_namespace() const
	{
		return m_qname == "xmlns" or m_qname.compare(0, 6, "xmlns:") == 0;
	}

	void write(std::ostream& os, format_info fmt) const;

  private:
	std::string m_qname;
	std::string m_value;
};

// --------------------------------------------------------------------

/// \brief the ordered set of attributes of an element
///
/// Attributes are written in the order they were added, setting an
/// attribute that already exists replaces its value in place.

class attribute_set
{
  public:
	using container_type = std::vector<attribute>;
	using iterator = container_type::iterator;
	using const_iterator = container_type::const_iterator;

	attribute_set() = default;
	attribute_set(std::initializer_list<attribute> attrs);

	iterator begin()							{ return m_attributes.begin(); }
	iterator end()								{ return m_attributes.end(); }
	const_iterator begin() const				{ return m_attributes.begin(); }
	const_iterator end() const					{ return m_attributes.end(); }

	size_t size() const							{ return m_attributes.size(); }
	bool empty() const							{ return m_attributes.empty(); }

	bool contains(const std::string& qname) const	{ return find(qname) != end(); }

	iterator find(const std::string& qname);
	const_iterator find(const std::string& qname) const;

	/// \brief add an attribute or replace the value of an existing one
	void emplace(const std::string& qname, const std::string& value);

	void erase(const std::string& qname);
	void clear()								{ m_attributes.clear(); }

	bool operator==(const attribute_set& as) const;
	bool operator!=(const attribute_set& as) const	{ return not operator==(as); }

  private:
	container_type m_attributes;
};

// --------------------------------------------------------------------

/// \brief the element class modelling a XML element
///
/// Child elements are kept in a std::list, references to children remain
/// valid when more children are added.

class element
{
  public:
	using container_type = std::list<element>;
	using value_type = element;
	using iterator = container_type::iterator;
	using const_iterator = container_type::const_iterator;

	element() = default;

	element(const std::string& qname)
		: m_qname(qname) {}

	element(const std::string& qname, std::initializer_list<attribute> attributes)
		: m_qname(qname), m_attributes(attributes) {}

	element(const element&) = default;
	element(element&&) = default;
	element& operator=(const element&) = default;
	element& operator=(element&&) = default;

	virtual ~element() = default;

	bool operator==(const element& e) const;
	bool operator!=(const element& e) const			{ return not operator==(e); }

	/// \brief the qualified name of this element
	const std::string& get_qname() const			{ return m_qname; }
	void set_qname(const std::string& qname)		{ m_qname = qname; }

	/// \brief the name without the prefix
	std::string name() const						{ return split_qname(m_qname).second; }
	std::string get_prefix() const					{ return split_qname(m_qname).first; }

	// attributes

	attribute_set& attributes()						{ return m_attributes; }
	const attribute_set& attributes() const			{ return m_attributes; }

	/// \brief return the value of attribute \a qname or an empty string
	std::string get_attribute(const std::string& qname) const;
	void set_attribute(const std::string& qname, const std::string& value);

	/// \brief return the namespace declared for \a prefix on this element, empty if none
	std::string namespace_for_prefix(const std::string& prefix) const;

	// content

	/// \brief the text content of this element
	const std::string& get_content() const			{ return m_content; }
	void set_content(const std::string& content)	{ m_content = content; }
	void add_text(const std::string& s)				{ m_content.append(s); }

	// child elements

	iterator begin()								{ return m_nodes.begin(); }
	iterator end()									{ return m_nodes.end(); }
	const_iterator begin() const					{ return m_nodes.begin(); }
	const_iterator end() const						{ return m_nodes.end(); }

	element& front()								{ return m_nodes.front(); }
	const element& front() const					{ return m_nodes.front(); }
	element& back()									{ return m_nodes.back(); }
	const element& back() const						{ return m_nodes.back(); }

	size_t size() const								{ return m_nodes.size(); }
	bool empty() const								{ return m_nodes.empty(); }

	element& emplace_back(const std::string& qname)	{ return m_nodes.emplace_back(qname); }
	element& emplace_back(const std::string& qname, std::initializer_list<attribute> attributes)
	{
		return m_nodes.emplace_back(qname, attributes);
	}

	element& push_back(const element& e)			{ return m_nodes.emplace_back(e); }
	element& push_back(element&& e)					{ return m_nodes.emplace_back(std::move(e)); }

	iterator erase(iterator pos)					{ return m_nodes.erase(pos); }

	/// \brief find the first child with qualified name \a qname, or with local
	/// name \a qname in case \a qname has no prefix
	element* find_first(const std::string& qname);
	const element* find_first(const std::string& qname) const;

	/// \brief remove content, attributes and children
	void clear();

	/// \brief write the element, its attributes and its children
	virtual void write(std::ostream& os, format_info fmt) const;

	friend std::ostream& operator<<(std::ostream& os, const element& e);

  private:
	std::string m_qname;
	attribute_set m_attributes;
	std::string m_content;
	container_type m_nodes;
};

/// \brief returns true if element \a e is named \a name, \a name
/// matches either the qualified name or, if it has no prefix, the local name
bool name_matches(const element& e, const std::string& name);

} // namespace soapclient::xml
