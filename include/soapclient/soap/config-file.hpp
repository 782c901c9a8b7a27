//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// reading a client_config from an INI style configuration file
///
/// \code
/// url = http://example.com/service
/// namespace = http://example.com/ns
/// timeout = 5000
///
/// [namespaces]
/// tns0 = http://example.com/types
///
/// [auth]
/// namespace = http://example.com/auth
/// username = scott
/// password = tiger
/// \endcode

#include <soapclient/config.hpp>

#include <iosfwd>

#include <boost/program_options.hpp>

#include <soapclient/soap/client-config.hpp>

namespace soapclient::soap
{

/// \brief the options understood in a configuration file, usable on a command line as well
boost::program_options::options_description client_config_options();

/// \brief build a client_config from the values stored in \a vm
client_config make_client_config(const boost::program_options::variables_map& vm);

/// \brief read a client_config from \a is, throws soapclient::exception on errors
client_config read_client_config(std::istream& is);

} // namespace soapclient::soap
