//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapclient::soap::client, sends SOAP requests and reads the replies

#include <soapclient/config.hpp>

#include <experimental/type_traits>
#include <functional>
#include <sstream>
#include <string>
#include <type_traits>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include <soapclient/exception.hpp>
#include <soapclient/soap/client-config.hpp>
#include <soapclient/soap/envelope.hpp>
#include <soapclient/soap/http-error.hpp>
#include <soapclient/soap/xml-typer.hpp>
#include <soapclient/xml/document.hpp>

namespace soapclient::soap
{

/// \brief strip the namespace and template arguments from the demangled type name \a name
std::string unqualified_type_name(const std::string& name);

template<typename T>
using soap_action_function = decltype(T::soap_action());

/// \brief The action name for requests of type T
///
/// This is the result of a static member function soap_action() when T
/// has one, the name of the type without namespace otherwise.

template<typename T>
std::string soap_action_name()
{
	if constexpr (std::experimental::is_detected_v<soap_action_function, T>)
		return T::soap_action();
	else
		return unqualified_type_name(boost::core::demangle(typeid(T).name()));
}

/// \brief A SOAP client, sends a request wrapped in an envelope and reads
/// the reply into a response object.
///
/// The request is any object with a serialize member, an xml::element or
/// nullptr for an empty Body. The response object is read from the
/// children of the soapenv:Body element in the reply, using the same
/// serialize member.
///
/// Before the request is written, set_xml_type() is called on every object
/// in the request that has such a member function, see xml_typer.
///
/// Failures are reported by throwing serialization_error, transport_error
/// (cancelled_error when the context was done), http_error or
/// deserialization_error.
///
/// \code
/// soapclient::soap::client c({ "http://example.com/service", "my-agent", "http://example.com/ns" });
/// GetUser request{ 42 };
/// GetUserResponse response;
/// c.round_trip(request, response);
/// \endcode

class client
{
  public:
	using header_setter = std::function<void(http::request&)>;

	explicit client(client_config config)
		: m_config(std::move(config)) {}

	client(const client&) = delete;
	client& operator=(const client&) = delete;

	const client_config& get_config() const			{ return m_config; }

	/// \brief Round trip with SOAPAction set to the name of the request type
	template<typename In, typename Out>
	void round_trip(In&& in, Out&& out) const
	{
		using request_type = std::remove_cv_t<std::remove_reference_t<In>>;

		std::string action;
		if constexpr (not std::is_null_pointer_v<request_type>)
			action = soap_action_name<request_type>();

		do_round_trip(action, [this, action, has_body = not std::is_null_pointer_v<request_type>](http::request& req)
		{
			set_soap11_headers(req, action, has_body);
		}, in, out);
	}

	/// \brief Round trip with \a action as SOAPAction
	template<typename In, typename Out>
	void round_trip_with_action(const std::string& action, In&& in, Out&& out) const
	{
		using request_type = std::remove_cv_t<std::remove_reference_t<In>>;

		do_round_trip(action, [this, action, has_body = not std::is_null_pointer_v<request_type>](http::request& req)
		{
			set_soap11_headers(req, action, has_body);
		}, in, out);
	}

	/// \brief SOAP 1.2 round trip, \a action is passed in the Content-Type
	template<typename In, typename Out>
	void round_trip_soap12(const std::string& action, In&& in, Out&& out) const
	{
		do_round_trip(action, [action](http::request& req)
		{
			set_soap12_headers(req, action);
		}, in, out);
	}

	/// \brief Write the envelope around \a in as it would be sent
	template<typename In>
	std::string make_payload(In& in) const
	{
		using request_type = std::remove_cv_t<std::remove_reference_t<In>>;

		std::string result;

		try
		{
			envelope<request_type> env(m_config, in);

			xml::document doc;
			doc.serialize(kEnvelopeElementName, env);

			std::ostringstream os;
			os << doc;
			result = os.str();
		}
		catch (const std::exception& e)
		{
			throw serialization_error(e.what());
		}

		return result;
	}

  private:
	template<typename In, typename Out>
	void do_round_trip(const std::string& action, header_setter set_headers, In& in, Out& out) const
	{
		set_xml_type(in);

		std::string payload = make_payload(in);

		execute(action, set_headers, std::move(payload), [&out](const xml::element& body)
		{
			xml::deserializer ds(body);
			ds.deserialize_element(".", out);
		});
	}

	/// \brief send \a payload, check the reply and pass the Body element to \a decode
	void execute(const std::string& action, const header_setter& set_headers, std::string payload,
		const std::function<void(const xml::element&)>& decode) const;

	void set_soap11_headers(http::request& req, const std::string& action, bool has_body) const;
	static void set_soap12_headers(http::request& req, const std::string& action);

	client_config m_config;
};

} // namespace soapclient::soap
