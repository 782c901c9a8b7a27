//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <soapclient/config.hpp>

#include <soapclient/soap/envelope.hpp>

namespace soapclient::soap
{

namespace
{

const char* const kSlotAttributeNames[kNamespaceSlotCount] = {
	"xmlns:tns0", "xmlns:tns1", "xmlns:tns2", "xmlns:tns3", "xmlns:tns4",
	"xmlns:tns5", "xmlns:tns6", "xmlns:tns7", "xmlns:tns8", "xmlns:tns9",
	"xmlns:tns10", "xmlns:tns11", "xmlns:tns12", "xmlns:tns13", "xmlns:tns14"
};

} // namespace

const char* envelope_base::slot_attribute_name(size_t index)
{
	return kSlotAttributeNames[index];
}

bool envelope_base::set_namespace_slot(const std::string& key, const std::string& uri)
{
	bool result = false;

	for (size_t i = 0; i < kNamespaceSlotCount; ++i)
	{
		// skip the "xmlns:" prefix
		if (key == kSlotAttributeNames[i] + 6)
		{
			m_slots[i] = uri;
			result = true;
			break;
		}
	}

	return result;
}

void envelope_base::configure(const client_config& config)
{
	m_envelope_namespace = config.envelope_namespace.empty() ? kEnvelopeNamespace : config.envelope_namespace;
	m_name_space = config.name_space.empty() ? config.url : config.name_space;
	m_tns_namespace = config.tns_namespace;
	m_urn_namespace = config.urn_namespace;
	m_xsi_namespace = config.xsi_namespace;
	m_header = config.header;

	for (auto& [key, uri] : config.used_namespaces)
		set_namespace_slot(key, uri);
}

} // namespace soapclient::soap
