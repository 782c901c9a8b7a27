//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// The SOAP envelope written for each request

#include <soapclient/config.hpp>

#include <array>
#include <string>

#include <soapclient/soap/client-config.hpp>
#include <soapclient/soap/header.hpp>
#include <soapclient/xml/serialize.hpp>

namespace soapclient::soap
{

/// \brief The number of namespace slots, named tns0 up to tns14
inline constexpr size_t kNamespaceSlotCount = 15;

/// \brief The attributes, the header and the namespace slots of an envelope
///
/// Empty values for the tns, urn, xsi and slot namespaces are not
/// written at all.

class envelope_base
{
  public:
	envelope_base() = default;

	/// \brief copy the namespaces and the header from \a config, filling in the defaults
	void configure(const client_config& config);

	/// \brief assign \a uri to slot \a key, returns false if \a key does not name a slot
	bool set_namespace_slot(const std::string& key, const std::string& uri);

	/// \brief the namespace in slot \a index, empty if it was not set
	const std::string& get_namespace_slot(size_t index) const	{ return m_slots.at(index); }

	/// \brief the attribute name for slot \a index, e.g. xmlns:tns3
	static const char* slot_attribute_name(size_t index);

	const std::string& get_envelope_namespace() const	{ return m_envelope_namespace; }
	const std::string& get_name_space() const			{ return m_name_space; }
	const std::string& get_tns_namespace() const		{ return m_tns_namespace; }
	const std::string& get_urn_namespace() const		{ return m_urn_namespace; }
	const std::string& get_xsi_namespace() const		{ return m_xsi_namespace; }
	const soap::header& get_header() const				{ return m_header; }

  protected:
	template<typename Archive>
	void serialize_attributes(Archive& ar)
	{
		ar & xml::make_attribute_nvp("xmlns:soapenv", m_envelope_namespace)
		   & xml::make_attribute_nvp("xmlns", m_name_space)
		   & xml::make_attribute_nvp("xmlns:tns", m_tns_namespace, true)
		   & xml::make_attribute_nvp("xmlns:urn", m_urn_namespace, true)
		   & xml::make_attribute_nvp("xmlns:xsi", m_xsi_namespace, true);

		for (size_t i = 0; i < kNamespaceSlotCount; ++i)
			ar & xml::make_attribute_nvp(slot_attribute_name(i), m_slots[i], true);

		ar & xml::make_element_nvp("soapenv:Header", m_header);
	}

	std::string m_envelope_namespace;
	std::string m_name_space;
	std::string m_tns_namespace;
	std::string m_urn_namespace;
	std::string m_xsi_namespace;
	std::array<std::string, kNamespaceSlotCount> m_slots;
	soap::header m_header;
};

/// \brief The envelope around the request \a Body
///
/// The root element is always soapenv:Envelope, the request is written
/// as the content of soapenv:Body. The envelope refers to the request,
/// it cannot outlive it.

template<typename Body>
class envelope : public envelope_base
{
  public:
	explicit envelope(const Body& body)
		: m_body(body) {}

	envelope(const client_config& config, const Body& body)
		: m_body(body)
	{
		configure(config);
	}

	template<typename Archive>
	void serialize(Archive& ar, unsigned long /*version*/)
	{
		serialize_attributes(ar);
		ar & xml::make_element_nvp("soapenv:Body", m_body);
	}

	const Body& get_body() const		{ return m_body; }

  private:
	const Body& m_body;
};

/// \brief The root element name of an envelope
inline constexpr const char kEnvelopeElementName[] = "soapenv:Envelope";

} // namespace soapclient::soap
