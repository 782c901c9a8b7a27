// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

/// \file
/// Generic configuration file, contains the version and defaults shared by all parts of libsoapclient

#pragma once

#include <cstddef>
#include <type_traits>

/// The current version of libsoapclient

#define SOAPCLIENT_VERSION		 "1.0.0"
#define SOAPCLIENT_VERSION_MAJOR 1
#define SOAPCLIENT_VERSION_MINOR 0
#define SOAPCLIENT_VERSION_PATCH 0

/// The User-Agent the command line tool uses when none was specified

#ifndef SOAPCLIENT_DEFAULT_USER_AGENT
#define SOAPCLIENT_DEFAULT_USER_AGENT "libsoapclient/" SOAPCLIENT_VERSION
#endif

/// The maximum number of bytes read from the body of a reply that
/// does not have status 200. Error pages can be huge.

#ifndef SOAPCLIENT_ERROR_BODY_LIMIT
#define SOAPCLIENT_ERROR_BODY_LIMIT (1024 * 1024)
#endif

// see if we're using Visual C++, if so we have to include
// some VC specific include files to make the standard C++
// keywords work.

#if defined(_MSC_VER)
#	if defined(_MSC_EXTENSIONS)		// why is it an extension to leave out something?
#		define and		&&
#		define and_eq	&=
#		define bitand	&
#		define bitor	|
#		define compl	~
#		define not		!
#		define not_eq	!=
#		define or		||
#		define or_eq	|=
#		define xor		^
#		define xor_eq	^=
#	endif // _MSC_EXTENSIONS

#	pragma warning (disable : 4355)	// this is used in Base Initializer list
#	pragma warning (disable : 4996)	// unsafe function or variable
#	pragma warning (disable : 4068)	// unknown pragma
#	pragma warning (disable : 4800)	// BOOL conversion

#endif
