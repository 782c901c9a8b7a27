//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <soapclient/config.hpp>

#include <soapclient/soap/http-error.hpp>

namespace soapclient::soap
{

namespace
{

const char kHex[] = "0123456789abcdef";

// the length of the valid UTF-8 sequence starting at \a i, 0 if there is none
size_t utf8_sequence_length(const std::string& s, size_t i)
{
	auto ch = static_cast<unsigned char>(s[i]);

	size_t n;
	char32_t cp;

	if (ch < 0x80)
		return 1;
	else if ((ch & 0xe0) == 0xc0)
	{
		n = 2;
		cp = ch & 0x1f;
	}
	else if ((ch & 0xf0) == 0xe0)
	{
		n = 3;
		cp = ch & 0x0f;
	}
	else if ((ch & 0xf8) == 0xf0)
	{
		n = 4;
		cp = ch & 0x07;
	}
	else
		return 0;

	if (i + n > s.length())
		return 0;

	for (size_t j = 1; j < n; ++j)
	{
		auto cc = static_cast<unsigned char>(s[i + j]);
		if ((cc & 0xc0) != 0x80)
			return 0;
		cp = (cp << 6) | (cc & 0x3f);
	}

	// overlong forms, surrogates and values beyond the unicode range
	if ((n == 2 and cp < 0x80) or (n == 3 and cp < 0x800) or (n == 4 and cp < 0x10000) or
		(cp >= 0xd800 and cp <= 0xdfff) or cp > 0x10ffff)
		return 0;

	return n;
}

} // namespace

std::string quote(const std::string& s)
{
	std::string result;
	result.reserve(s.length() + 2);

	result += '"';

	for (size_t i = 0; i < s.length();)
	{
		auto ch = static_cast<unsigned char>(s[i]);

		size_t n = utf8_sequence_length(s, i);
		if (n > 1)
		{
			result.append(s, i, n);
			i += n;
			continue;
		}

		++i;

		switch (ch)
		{
			case '"':	result += "\\\""; break;
			case '\\':	result += "\\\\"; break;
			case '\a':	result += "\\a"; break;
			case '\b':	result += "\\b"; break;
			case '\f':	result += "\\f"; break;
			case '\n':	result += "\\n"; break;
			case '\r':	result += "\\r"; break;
			case '\t':	result += "\\t"; break;
			case '\v':	result += "\\v"; break;
			default:
				if (ch < 0x20 or ch >= 0x7f)
				{
					result += "\\x";
					result += kHex[ch >> 4];
					result += kHex[ch & 0x0f];
				}
				else
					result += static_cast<char>(ch);
				break;
		}
	}

	result += '"';

	return result;
}

} // namespace soapclient::soap
