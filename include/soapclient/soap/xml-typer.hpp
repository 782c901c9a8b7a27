//          Copyright Maarten L. Hekkelman, 2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapclient::soap::xml_typer, the archive that gives each
/// object in a request a chance to annotate itself before it is written

#include <soapclient/config.hpp>

#include <string>
#include <type_traits>
#include <variant>

#include <soapclient/type-traits.hpp>
#include <soapclient/xml/node.hpp>
#include <soapclient/xml/serialize.hpp>

namespace soapclient::soap
{

/// \brief xml_typer is the third archive, next to serializer and deserializer.
///
/// It walks an object graph using the same serialize members and calls
/// `void set_xml_type()` on each object reached through a pointer or
/// through a member, if the object's type has such a member function.
///
/// - empty pointers, smart pointers and optionals are skipped
/// - a variant is walked as the alternative it holds
/// - the elements of arrays and containers are walked in order
/// - strings, maps, scalars and XML elements are not walked into
///
/// No state is kept between calls, each walk reaches the same objects.

struct xml_typer
{
	template<typename T>
	xml_typer& operator&(const name_value_pair<T>& rhs)
	{
		visit_pointer(&rhs.value());
		return *this;
	}

	template<typename T>
	xml_typer& operator&(const xml::element_nvp<T>& rhs)
	{
		visit_pointer(&rhs.value());
		return *this;
	}

	template<typename T>
	xml_typer& operator&(const xml::attribute_nvp<T>& rhs)
	{
		visit_pointer(&rhs.value());
		return *this;
	}

	/// \brief call set_xml_type on \a *p if it has one, then walk into it
	template<typename T>
	void visit_pointer(T* p)
	{
		if (p == nullptr)
			return;

		if constexpr (not std::is_const_v<T> and has_set_xml_type_v<T>)
			p->set_xml_type();

		visit_value(*p);
	}

	template<typename T>
	void visit_value(T& v)
	{
		using value_type = std::remove_cv_t<T>;

		if constexpr (std::is_const_v<T>)
			return;
		else if constexpr (std::is_base_of_v<xml::element, value_type> or std::is_same_v<value_type, std::string>)
			return;
		else if constexpr (is_pointer_like_v<value_type>)
		{
			if (v)
				visit_pointer(&*v);
		}
		else if constexpr (is_variant_v<value_type>)
			std::visit([this](auto& alternative) { visit_value(alternative); }, v);
		else if constexpr (std::is_array_v<value_type>)
		{
			for (auto& e : v)
				visit_value(e);
		}
		else if constexpr (is_sequence_type_v<value_type>)
		{
			// the elements of a std::vector<bool> are not objects
			if constexpr (not std::is_same_v<typename value_type::value_type, bool>)
			{
				for (auto& e : v)
					visit_value(e);
			}
		}
		else if constexpr (has_serialize_v<value_type, xml_typer>)
			v.serialize(*this, 0UL);
	}
};

/// \brief Call set_xml_type on \a in and on every object reachable from it
template<typename T>
void set_xml_type(T& in)
{
	xml_typer typer;
	typer.visit_pointer(&in);
}

} // namespace soapclient::soap
