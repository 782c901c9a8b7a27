// Copyright Maarten L. Hekkelman, Radboud University 2008-2013.
//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// serializer and deserializer, the Archive classes that turn objects
/// into XML elements and back.

#include <soapclient/config.hpp>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstring>
#include <memory>
#include <optional>
#include <variant>

#include <soapclient/exception.hpp>
#include <soapclient/nvp.hpp>
#include <soapclient/type-traits.hpp>
#include <soapclient/value-serializer.hpp>
#include <soapclient/xml/node.hpp>

namespace soapclient::xml
{

struct serializer;
struct deserializer;

/// \brief name/value pair for a member that is written as child element
template<typename T>
struct element_nvp : public name_value_pair<T>
{
	explicit element_nvp(const char* name, T& v) : name_value_pair<T>(name, v) {}
	element_nvp(const element_nvp& rhs) : name_value_pair<T>(rhs) {}
};

/// \brief name/value pair for a member that is written as attribute
///
/// When \a omit_empty is true the attribute is not written at all if
/// its value is the empty string.

template<typename T>
struct attribute_nvp : public name_value_pair<T>
{
	explicit attribute_nvp(const char* name, T& v, bool omit_empty = false)
		: name_value_pair<T>(name, v), m_omit_empty(omit_empty) {}
	attribute_nvp(const attribute_nvp& rhs) : name_value_pair<T>(rhs), m_omit_empty(rhs.m_omit_empty) {}

	bool omit_empty() const		{ return m_omit_empty; }

  private:
	bool m_omit_empty;
};

template<typename T>
inline element_nvp<T> make_element_nvp(const char* name, T& v)
{
	return element_nvp<T>(name, v);
}

template<typename T>
inline attribute_nvp<T> make_attribute_nvp(const char* name, T& v, bool omit_empty = false)
{
	return attribute_nvp<T>(name, v, omit_empty);
}

#define SOAPCLIENT_ELEMENT_NAME_VALUE(name)			soapclient::xml::make_element_nvp(#name, name)
#define SOAPCLIENT_ATTRIBUTE_NAME_VALUE(name)		soapclient::xml::make_attribute_nvp(#name, name)

/// an empty name or "." means the node itself
inline bool names_self(const char* name)
{
	assert(name);
	return name[0] == 0 or std::strcmp(name, ".") == 0;
}

/// serializer and deserializer are classes that can be used
/// to initiate the serialization. They are the Archive classes that are
/// the first parameter to the templated function 'serialize' in the classes
/// that can be serialized. (See boost::serialization for more info).

/// serializer is the class that initiates the serialization process.

struct serializer
{
	serializer(element& node) : m_node(node) {}

	template<typename T>
	serializer& operator&(const name_value_pair<T>& rhs)
	{
		return serialize_element(rhs.name(), rhs.value());
	}

	template<typename T>
	serializer& operator&(const element_nvp<T>& rhs)
	{
		return serialize_element(rhs.name(), rhs.value());
	}

	template<typename T>
	serializer& operator&(const attribute_nvp<T>& rhs)
	{
		return serialize_attribute(rhs.name(), rhs.value(), rhs.omit_empty());
	}

	template<typename T>
	serializer& serialize_element(const T& data);

	template<typename T>
	serializer& serialize_element(const char* name, const T& data);

	template<typename T>
	serializer& serialize_attribute(const char* name, const T& data, bool omit_empty = false);

	element& m_node;
};

/// deserializer is the class that initiates the deserialization process.
///
/// Names without a prefix match elements and attributes on their local
/// name, a server is free to choose its own prefixes.

struct deserializer
{
	deserializer(const element& node) : m_node(node) {}

	template<typename T>
	deserializer& operator&(const name_value_pair<T>& rhs)
	{
		return deserialize_element(rhs.name(), rhs.value());
	}

	template<typename T>
	deserializer& operator&(const element_nvp<T>& rhs)
	{
		return deserialize_element(rhs.name(), rhs.value());
	}

	template<typename T>
	deserializer& operator&(const attribute_nvp<T>& rhs)
	{
		return deserialize_attribute(rhs.name(), rhs.value());
	}

	template<typename T>
	deserializer& deserialize_element(T& data);

	template<typename T>
	deserializer& deserialize_element(const char* name, T& data);

	template<typename T>
	deserializer& deserialize_attribute(const char* name, T& data);

	const element& m_node;
};

// --------------------------------------------------------------------

template<typename T, typename = void>
struct type_serializer
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using value_serializer_type = value_serializer<value_type>;

	static constexpr const char* type_name() { return value_serializer_type::type_name(); }

	static std::string serialize_value(const T& value)
	{
		return value_serializer_type::to_string(value);
	}

	static T deserialize_value(const std::string& value)
	{
		return value_serializer_type::from_string(value);
	}

	static void serialize_child(element& n, const char* name, const value_type& value)
	{
		if (names_self(name))
			n.set_content(value_serializer_type::to_string(value));
		else
			n.emplace_back(name).set_content(value_serializer_type::to_string(value));
	}

	static void deserialize_child(const element& n, const char* name, value_type& value)
	{
		value = {};

		if (names_self(name))
			value = value_serializer_type::from_string(n.get_content());
		else
		{
			auto e = n.find_first(name);
			if (e != nullptr)
				value = value_serializer_type::from_string(e->get_content());
		}
	}
};

template<typename T, size_t N>
struct type_serializer<T[N]>
{
	using value_type = std::remove_cv_t<std::remove_reference_t<T>>;
	using type_serializer_type = type_serializer<value_type>;

	static constexpr const char* type_name() { return type_serializer_type::type_name(); }

	static void serialize_child(element& n, const char* name, const value_type(&value)[N])
	{
		for (const value_type& v : value)
			type_serializer_type::serialize_child(n, name, v);
	}

	static void deserialize_child(const element& n, const char* name, value_type(&value)[N])
	{
		size_t ix = 0;
		for (auto& e: n)
		{
			if (not name_matches(e, name))
				continue;

			value_type v = {};
			type_serializer_type::deserialize_child(e, ".", v);

			value[ix] = std::move(v);
			++ix;

			if (ix >= N)
				break;
		}
	}
};

template<typename T>
struct type_serializer<T, std::enable_if_t<std::is_enum_v<T>>>
	: public value_serializer<T>
{
	using value_type = T;
	using value_serializer_type = value_serializer<T>;
	using value_serializer_type::type_name;

	static std::string serialize_value(const T& value)
	{
		return value_serializer_type::to_string(value);
	}

	static T deserialize_value(const std::string& value)
	{
		return value_serializer_type::from_string(value);
	}

	static void serialize_child(element& n, const char* name, const value_type& value)
	{
		if (names_self(name))
			n.set_content(value_serializer_type::to_string(value));
		else
			n.emplace_back(name).set_content(value_serializer_type::to_string(value));
	}

	static void deserialize_child(const element& n, const char* name, value_type& value)
	{
		value = value_type();

		if (names_self(name))
			value = value_serializer_type::from_string(n.get_content());
		else
		{
			auto e = n.find_first(name);
			if (e != nullptr)
				value = value_serializer_type::from_string(e->get_content());
		}
	}
};

template<typename T>
struct type_serializer<T, std::enable_if_t<has_serialize_v<T,serializer>>>
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;

	static void serialize_child(element& n, const char* name, const value_type& value)
	{
		if (names_self(name))
		{
			serializer sr(n);
			const_cast<value_type&>(value).serialize(sr, 0UL);
		}
		else
		{
			element& e = n.emplace_back(name);
			serializer sr(e);
			const_cast<value_type&>(value).serialize(sr, 0UL);
		}
	}

	static void deserialize_child(const element& n, const char* name, value_type& value)
	{
		value = value_type();

		if (names_self(name))
		{
			deserializer sr(n);
			value.serialize(sr, 0UL);
		}
		else
		{
			auto e = n.find_first(name);
			if (e != nullptr)
			{
				deserializer sr(*e);
				value.serialize(sr, 0UL);
			}
		}
	}
};

template<typename T>
struct type_serializer<std::optional<T>>
{
	using value_type = T;
	using container_type = std::optional<value_type>;
	using type_serializer_type = type_serializer<value_type>;

	static void serialize_child(element& n, const char* name, const container_type& value)
	{
		if (value)
			type_serializer_type::serialize_child(n, name, *value);
	}

	static void deserialize_child(const element& n, const char* name, container_type& value)
	{
		value.reset();

		auto e = n.find_first(name);
		if (e != nullptr)
		{
			value_type v = {};
			type_serializer_type::deserialize_child(*e, ".", v);
			value.emplace(std::move(v));
		}
	}
};

/// smart pointers are written when not empty, and allocated when the
/// element is found during deserialization

template<typename P>
struct pointer_type_serializer
{
	using container_type = P;
	using value_type = typename P::element_type;
	using type_serializer_type = type_serializer<value_type>;

	static void serialize_child(element& n, const char* name, const container_type& value)
	{
		if (value)
			type_serializer_type::serialize_child(n, name, *value);
	}

	static void deserialize_child(const element& n, const char* name, container_type& value)
	{
		value.reset();

		auto e = n.find_first(name);
		if (e != nullptr)
		{
			value.reset(new value_type{});
			type_serializer_type::deserialize_child(*e, ".", *value);
		}
	}
};

template<typename T>
struct type_serializer<std::unique_ptr<T>> : public pointer_type_serializer<std::unique_ptr<T>> {};

template<typename T>
struct type_serializer<std::shared_ptr<T>> : public pointer_type_serializer<std::shared_ptr<T>> {};

/// a variant is written as the alternative it holds. When reading, the
/// alternative that is currently held is filled in.

template<typename... Ts>
struct type_serializer<std::variant<Ts...>>
{
	using container_type = std::variant<Ts...>;

	static void serialize_child(element& n, const char* name, const container_type& value)
	{
		std::visit([&n, name](auto& v)
		{
			using alternative_type = std::remove_cv_t<std::remove_reference_t<decltype(v)>>;
			type_serializer<alternative_type>::serialize_child(n, name, v);
		}, value);
	}

	static void deserialize_child(const element& n, const char* name, container_type& value)
	{
		std::visit([&n, name](auto& v)
		{
			using alternative_type = std::remove_cv_t<std::remove_reference_t<decltype(v)>>;
			type_serializer<alternative_type>::deserialize_child(n, name, v);
		}, value);
	}
};

/// std::nullptr_t stands for no value at all, only the element is written
template<>
struct type_serializer<std::nullptr_t>
{
	static void serialize_child(element& n, const char* name, std::nullptr_t)
	{
		if (not names_self(name))
			n.emplace_back(name);
	}

	static void deserialize_child(const element&, const char*, std::nullptr_t&)
	{
	}
};

/// XML passed as is. The attributes, text and children of the value are
/// copied into the element, which allows passing a parsed document as
/// the content of an element.

template<typename T>
struct type_serializer<T, std::enable_if_t<std::is_base_of_v<element, T>>>
{
	static void copy_into(element& e, const element& value)
	{
		for (auto& a : value.attributes())
			e.set_attribute(a.get_qname(), a.value());
		e.add_text(value.get_content());
		for (auto& c : value)
			e.push_back(c);
	}

	static void serialize_child(element& n, const char* name, const element& value)
	{
		if (names_self(name))
			copy_into(n, value);
		else
			copy_into(n.emplace_back(name), value);
	}

	static void deserialize_child(const element& n, const char* name, T& value)
	{
		value.clear();

		const element* e = names_self(name) ? &n : n.find_first(name);
		if (e != nullptr)
			copy_into(value, *e);
	}
};

// nice trick to enforce order in template selection
template<unsigned N> struct priority_tag : priority_tag < N - 1 > {};
template<> struct priority_tag<0> {};

template<typename T>
struct type_serializer<T, std::enable_if_t<is_serializable_array_type_v<T,serializer>>>
{
	using container_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using value_type = value_type_t<container_type>;
	using type_serializer_type = type_serializer<value_type>;

	static void serialize_child(element& n, const char* name, const container_type& value)
	{
		for (const value_type& v : value)
			type_serializer_type::serialize_child(n, name, v);
	}

	template<size_t N>
	static auto deserialize_array(const element& n, const char* name,
		std::array<value_type, N>& value, priority_tag<2>)
	{
		size_t ix = 0;
		for (auto& e: n)
		{
			if (not name_matches(e, name))
				continue;

			value_type v = {};
			type_serializer_type::deserialize_child(e, ".", v);

			value[ix] = std::move(v);
			++ix;

			if (ix >= N)
				break;
		}
	}

	template<typename A>
	static auto deserialize_array(const element& n, const char* name, A& arr, priority_tag<1>)
		-> decltype(
			arr.reserve(std::declval<typename container_type::size_type>()),
			void()
		)
	{
		arr.clear();
		arr.reserve(n.size());

		for (auto& e: n)
		{
			if (not name_matches(e, name))
				continue;

			value_type v = {};
			type_serializer_type::deserialize_child(e, ".", v);

			arr.emplace_back(std::move(v));
		}
	}

	static void deserialize_array(const element& n, const char* name, container_type& arr, priority_tag<0>)
	{
		arr.clear();

		for (auto& e: n)
		{
			if (not name_matches(e, name))
				continue;

			value_type v = {};
			type_serializer_type::deserialize_child(e, ".", v);

			arr.emplace_back(std::move(v));
		}
	}

	static void deserialize_child(const element& n, const char* name, container_type& value)
	{
		type_serializer::deserialize_array(n, name, value, priority_tag<2>{});
	}
};

// And finally, the implementation of serializer and deserializer.

template<typename T>
serializer& serializer::serialize_element(const T& value)
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using type_serializer = type_serializer<value_type>;

	type_serializer::serialize_child(m_node, "", value);

	return *this;
}

template<typename T>
serializer& serializer::serialize_element(const char* name, const T& value)
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using type_serializer = type_serializer<value_type>;

	type_serializer::serialize_child(m_node, name, value);

	return *this;
}

template<typename T>
serializer& serializer::serialize_attribute(const char* name, const T& value, bool omit_empty)
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using type_serializer = type_serializer<value_type>;

	std::string s = type_serializer::serialize_value(value);
	if (not s.empty() or not omit_empty)
		m_node.attributes().emplace(name, s);

	return *this;
}

template<typename T>
deserializer& deserializer::deserialize_element(T& value)
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using type_serializer = type_serializer<value_type>;

	type_serializer::deserialize_child(m_node, "", value);

	return *this;
}

template<typename T>
deserializer& deserializer::deserialize_element(const char* name, T& value)
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using type_serializer = type_serializer<value_type>;

	type_serializer::deserialize_child(m_node, name, value);

	return *this;
}

template<typename T>
deserializer& deserializer::deserialize_attribute(const char* name, T& value)
{
	using value_type = typename std::remove_const_t<typename std::remove_reference_t<T>>;
	using type_serializer = type_serializer<value_type>;

	auto a = m_node.attributes().find(name);

	// fall back to the local name for unprefixed names
	if (a == m_node.attributes().end() and std::strchr(name, ':') == nullptr)
	{
		a = std::find_if(m_node.attributes().begin(), m_node.attributes().end(),
			[name](const attribute& attr) { return not attr.is_namespace() and attr.name() == name; });
	}

	if (a != m_node.attributes().end() and not a->value().empty())
		value = type_serializer::deserialize_value(a->value());

	return *this;
}

} // namespace soapclient::xml
