//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// the SOAP Header as configured for a client, and the predefined auth_header

#include <soapclient/config.hpp>

#include <memory>
#include <string>
#include <type_traits>

#include <soapclient/xml/serialize.hpp>

namespace soapclient::soap
{

/// \brief The XML Schema instance namespace, the usual value for the xsi namespace
inline constexpr const char kXSINamespace[] = "http://www.w3.org/2001/XMLSchema-instance";

/// \brief The SOAP 1.1 envelope namespace
inline constexpr const char kEnvelopeNamespace[] = "http://schemas.xmlsoap.org/soap/envelope/";

/// \brief header holds any serializable object, it is written as the
/// content of the soapenv:Header element of each request.
///
/// The object is copied when the header is created. An empty header
/// means no soapenv:Header element is written at all.

class header
{
  public:
	header() = default;

	template<typename T, std::enable_if_t<not std::is_same_v<std::decay_t<T>, header>, int> = 0>
	header(T&& value)
		: m_impl(std::make_shared<holder<std::decay_t<T>>>(std::forward<T>(value)))
	{
	}

	header(const header&) = default;
	header(header&&) = default;
	header& operator=(const header&) = default;
	header& operator=(header&&) = default;

	bool empty() const						{ return not m_impl; }
	explicit operator bool() const			{ return not empty(); }

	/// \brief write the content of the header object into \a e
	void write(xml::element& e) const
	{
		if (m_impl)
			m_impl->write(e);
	}

  private:
	struct holder_base
	{
		virtual ~holder_base() = default;
		virtual void write(xml::element& e) const = 0;
	};

	template<typename T>
	struct holder : public holder_base
	{
		holder(T value)
			: m_value(std::move(value)) {}

		void write(xml::element& e) const override
		{
			xml::serializer sr(e);
			sr.serialize_element(m_value);
		}

		T m_value;
	};

	std::shared_ptr<const holder_base> m_impl;
};

/// \brief A header conveying credentials for authentication
///
/// Written as `xmlns:ns` attribute with `ns:username` and `ns:password` elements.

struct auth_header
{
	std::string name_space;
	std::string username;
	std::string password;

	template<typename Archive>
	void serialize(Archive& ar, unsigned long /*version*/)
	{
		ar & xml::make_attribute_nvp("xmlns:ns", name_space)
		   & xml::make_element_nvp("ns:username", username)
		   & xml::make_element_nvp("ns:password", password);
	}
};

} // namespace soapclient::soap

namespace soapclient::xml
{

/// a soap::header only knows how to write itself
template<>
struct type_serializer<soap::header>
{
	static void serialize_child(element& n, const char* name, const soap::header& value)
	{
		if (value.empty())
			return;

		if (names_self(name))
			value.write(n);
		else
			value.write(n.emplace_back(name));
	}
};

} // namespace soapclient::xml
