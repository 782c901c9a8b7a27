//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// Selecting a text decoder based on the encoding declared in an XML prolog

#include <soapclient/config.hpp>

#include <memory>
#include <string>
#include <string_view>

#include <soapclient/exception.hpp>

namespace soapclient::xml
{

/// \brief thrown when no decoder exists for a charset label
class unknown_charset : public exception
{
  public:
	unknown_charset(const std::string& label)
		: exception("unsupported charset '" + label + "'") {}
};

/// \brief A text_decoder converts text in some encoding into UTF-8
class text_decoder
{
  public:
	virtual ~text_decoder() = default;

	/// \brief return the UTF-8 representation of \a text, throws on invalid input
	virtual std::string decode(std::string_view text) const = 0;
};

/// \brief charset_resolver returns a text_decoder for a label as found in
/// the encoding attribute of an XML declaration.

class charset_resolver
{
  public:
	virtual ~charset_resolver() = default;

	/// \brief return a decoder for \a label, throws unknown_charset if there is none
	virtual std::unique_ptr<text_decoder> get_decoder(const std::string& label) const = 0;

	/// \brief the resolver used by default, backed by Boost.Locale
	static const charset_resolver& instance();
};

/// \brief the charset_resolver implementation using boost::locale::conv
class locale_charset_resolver : public charset_resolver
{
  public:
	std::unique_ptr<text_decoder> get_decoder(const std::string& label) const override;
};

/// \brief return the value of the encoding pseudo attribute in the XML declaration
/// at the start of \a text, or an empty string if there is none
std::string sniff_declared_encoding(std::string_view text);

/// \brief returns true if \a label names UTF-8 (or its subset US-ASCII)
bool is_utf8_label(const std::string& label);

} // namespace soapclient::xml
