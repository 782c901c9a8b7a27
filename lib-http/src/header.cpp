// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>

#include <boost/algorithm/string.hpp>

#include <soapclient/http/header.hpp>

namespace ba = boost::algorithm;

namespace soapclient::http
{

std::string get_header(const header_list& headers, const std::string& name)
{
	std::string result;

	auto h = std::find_if(headers.begin(), headers.end(),
		[&name](const header& h) { return ba::iequals(h.name, name); });
	if (h != headers.end())
		result = h->value;

	return result;
}

bool has_header(const header_list& headers, const std::string& name)
{
	return std::any_of(headers.begin(), headers.end(),
		[&name](const header& h) { return ba::iequals(h.name, name); });
}

void set_header(header_list& headers, const std::string& name, const std::string& value)
{
	auto h = std::find_if(headers.begin(), headers.end(),
		[&name](const header& h) { return ba::iequals(h.name, name); });

	if (h == headers.end())
		headers.push_back({ name, value });
	else
	{
		h->value = value;

		headers.erase(std::remove_if(h + 1, headers.end(),
			[&name](const header& h) { return ba::iequals(h.name, name); }), headers.end());
	}
}

void remove_header(header_list& headers, const std::string& name)
{
	headers.erase(std::remove_if(headers.begin(), headers.end(),
		[&name](const header& h) { return ba::iequals(h.name, name); }), headers.end());
}

} // namespace soapclient::http
