//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <regex>

#include <boost/algorithm/string.hpp>
#include <boost/locale/encoding.hpp>

#include <soapclient/xml/charset.hpp>

namespace ba = boost::algorithm;
namespace conv = boost::locale::conv;

namespace soapclient::xml
{

namespace
{
	struct charset_alias
	{
		const char* label;
		const char* charset;
	} kCharsetAliases[] = {
		// the latin-1 labels decode as windows-1252, as browsers do
		{ "latin1", "windows-1252" },
		{ "l1", "windows-1252" },
		{ "iso-8859-1", "windows-1252" },
		{ "iso8859-1", "windows-1252" },
		{ "iso88591", "windows-1252" },
		{ "iso_8859-1", "windows-1252" },
		{ "iso_8859-1:1987", "windows-1252" },
		{ "iso-ir-100", "windows-1252" },
		{ "csisolatin1", "windows-1252" },
		{ "cp819", "windows-1252" },
		{ "ibm819", "windows-1252" },
		{ "cp1252", "windows-1252" },
		{ "x-cp1252", "windows-1252" },
		{ "cp1251", "windows-1251" },
		{ "x-cp1251", "windows-1251" },
		{ "sjis", "Shift_JIS" },
		{ "shift-jis", "Shift_JIS" },
		{ "x-sjis", "Shift_JIS" },
		{ "utf16", "UTF-16" },
		{ "unicode", "UTF-16" },
	};

	std::string charset_for_label(const std::string& label)
	{
		std::string result = ba::trim_copy(label);

		for (auto& alias : kCharsetAliases)
		{
			if (ba::iequals(result, alias.label))
			{
				result = alias.charset;
				break;
			}
		}

		return result;
	}

	class locale_text_decoder : public text_decoder
	{
	  public:
		locale_text_decoder(const std::string& charset)
			: m_charset(charset) {}

		std::string decode(std::string_view text) const override
		{
			try
			{
				return conv::to_utf<char>(text.data(), text.data() + text.length(), m_charset, conv::stop);
			}
			catch (const conv::conversion_error&)
			{
				throw exception("invalid " + m_charset + " encoded text");
			}
		}

	  private:
		std::string m_charset;
	};

} // namespace

// --------------------------------------------------------------------

const charset_resolver& charset_resolver::instance()
{
	static locale_charset_resolver s_instance;
	return s_instance;
}

std::unique_ptr<text_decoder> locale_charset_resolver::get_decoder(const std::string& label) const
{
	std::string charset = charset_for_label(label);

	if (charset.empty())
		throw unknown_charset(label);

	// try a conversion once, boost::locale only reports unknown charsets on first use
	try
	{
		conv::to_utf<char>(std::string(" "), charset, conv::stop);
	}
	catch (const conv::invalid_charset_error&)
	{
		throw unknown_charset(label);
	}
	catch (const conv::conversion_error&)
	{
		throw unknown_charset(label);
	}

	return std::make_unique<locale_text_decoder>(charset);
}

// --------------------------------------------------------------------

std::string sniff_declared_encoding(std::string_view text)
{
	static const std::regex kEncodingRx(R"(^<\?xml\s[^>]*?encoding\s*=\s*["']([A-Za-z][A-Za-z0-9._:-]*)["'])");

	std::string result;

	// skip a UTF-8 byte order mark
	if (text.length() >= 3 and text.compare(0, 3, "\xEF\xBB\xBF") == 0)
		text.remove_prefix(3);

	if (text.compare(0, 5, "<?xml") == 0)
	{
		auto e = text.find("?>");
		std::string prolog(text.substr(0, e == std::string_view::npos ? text.length() : e));

		std::smatch m;
		if (std::regex_search(prolog, m, kEncodingRx))
			result = m[1].str();
	}

	return result;
}

bool is_utf8_label(const std::string& label)
{
	return ba::iequals(label, "utf-8") or ba::iequals(label, "utf8") or
		ba::iequals(label, "us-ascii") or ba::iequals(label, "ascii");
}

} // namespace soapclient::xml
