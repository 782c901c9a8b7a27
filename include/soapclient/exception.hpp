// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapclient::exception, base class for exceptions thrown by libsoapclient,
/// and the exceptions that classify a failed round trip

#include <soapclient/config.hpp>

#include <exception>
#include <string>

namespace soapclient
{

/// \brief base class of the exceptions thrown by libsoapclient
class exception : public std::exception
{
  public:
	/// \brief Create an exception with the message in \a message
	exception(const std::string& message)
		: m_message(message) {}

	virtual ~exception() throw() {}

	virtual const char* what() const throw() { return m_message.c_str(); }

  protected:
	std::string m_message;
};

/// \brief The request object could not be written as XML
class serialization_error : public exception
{
  public:
	serialization_error(const std::string& message)
		: exception("serialization error: " + message) {}
};

/// \brief The HTTP exchange could not complete, e.g. DNS or connection failure
class transport_error : public exception
{
  public:
	transport_error(const std::string& message)
		: exception(message) {}
};

/// \brief The HTTP exchange was aborted because its context was cancelled
/// or its deadline expired
class cancelled_error : public transport_error
{
  public:
	cancelled_error(const std::string& message)
		: transport_error(message) {}
};

/// \brief The reply could not be parsed into the expected envelope
class deserialization_error : public exception
{
  public:
	deserialization_error(const std::string& message)
		: exception("deserialization error: " + message) {}
};

} // namespace soapclient
