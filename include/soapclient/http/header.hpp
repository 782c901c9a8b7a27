// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapclient::http::header class

#include <soapclient/config.hpp>

#include <string>
#include <vector>

namespace soapclient::http
{

/// The header object contains the header lines as found in a
/// HTTP Request or Reply. The lines are parsed into name / value pairs.

struct header
{
	std::string	name;
	std::string	value;
};

using header_list = std::vector<header>;

/// \brief return the value of the first header named \a name (case insensitive), or an empty string
std::string get_header(const header_list& headers, const std::string& name);

/// \brief returns true if a header named \a name is present
bool has_header(const header_list& headers, const std::string& name);

/// \brief replace all headers named \a name with a single one
void set_header(header_list& headers, const std::string& name, const std::string& value);

/// \brief remove all headers named \a name
void remove_header(header_list& headers, const std::string& name);

} // namespace soapclient::http
