//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of various classes that help classify data used to select the correct conversion routines

#include <soapclient/config.hpp>

#include <experimental/type_traits>
#include <memory>
#include <optional>
#include <variant>

#include <soapclient/value-serializer.hpp>

/// \brief Templates to help selecting the correct serialization class.

namespace soapclient
{

template <typename T>
using value_type_t = typename T::value_type;

template <typename T>
using key_type_t = typename T::key_type;

template <typename T>
using mapped_type_t = typename T::mapped_type;

template <typename T>
using iterator_t = typename T::iterator;

template<typename T, typename = void>
struct is_complete_type : std::false_type {};

template<typename T>
struct is_complete_type<T, decltype(void(sizeof(T)))> : std::true_type {};

template<typename T>
inline constexpr bool is_complete_type_v = is_complete_type<T>::value;

template<typename T>
using std_string_npos_t = decltype(T::npos);

template<typename T>
using serialize_value_t = decltype(std::declval<value_serializer<T>&>().from_string(std::declval<const std::string&>()));

template<typename T, typename Archive>
using serialize_function = decltype(std::declval<T&>().serialize(std::declval<Archive&>(), std::declval<unsigned long>()));

template<typename T, typename Archive, typename = void>
struct has_serialize : std::false_type {};

template<typename T, typename Archive>
struct has_serialize<T, Archive, typename std::enable_if_t<std::is_class_v<T>>>
{
	static constexpr bool value = std::experimental::is_detected_v<serialize_function,T,Archive>;
};

template<typename T, typename S>
inline constexpr bool has_serialize_v = has_serialize<T, S>::value;

template<typename T, typename S>
struct is_serializable_type
{
	using value_type = std::remove_const_t<typename std::remove_reference_t<T>>;
	static constexpr bool value =
		std::experimental::is_detected_v<serialize_value_t,value_type> or
		has_serialize_v<value_type,S>;
};

template<typename T, typename S>
inline constexpr bool is_serializable_type_v = is_serializable_type<T,S>::value;

template<typename T>
inline constexpr bool is_type_with_value_serializer_v = std::experimental::is_detected_v<serialize_value_t,T>;

template<typename T, typename S, typename = void>
struct is_serializable_array_type : std::false_type {};

template<typename T, typename S>
struct is_serializable_array_type<T, S,
	std::enable_if_t<
		std::experimental::is_detected_v<value_type_t, T> and
		std::experimental::is_detected_v<iterator_t, T> and
		not std::experimental::is_detected_v<std_string_npos_t, T>>>
{
	static constexpr bool value = is_serializable_type_v<typename T::value_type,S>;
};

template<typename T, typename S>
inline constexpr bool is_serializable_array_type_v = is_serializable_array_type<T,S>::value;

// --------------------------------------------------------------------
// traits used by the xml typer

/// \brief detects the `void set_xml_type()` member used to annotate a node before serialization
template<typename T>
using set_xml_type_function = decltype(std::declval<T&>().set_xml_type());

template<typename T>
inline constexpr bool has_set_xml_type_v = std::experimental::is_detected_v<set_xml_type_function, T>;

/// \brief pointer like types, these are skipped when empty
template<typename T>
struct is_pointer_like : std::false_type {};

template<typename T>
struct is_pointer_like<T*> : std::true_type {};

template<typename T, typename D>
struct is_pointer_like<std::unique_ptr<T,D>> : std::true_type {};

template<typename T>
struct is_pointer_like<std::shared_ptr<T>> : std::true_type {};

template<typename T>
struct is_pointer_like<std::optional<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_pointer_like_v = is_pointer_like<T>::value;

template<typename T>
struct is_variant : std::false_type {};

template<typename... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};

template<typename T>
inline constexpr bool is_variant_v = is_variant<T>::value;

/// \brief containers, anything with a value_type and an iterator that is not a string
template<typename T, typename = void>
struct is_sequence_type : std::false_type {};

template<typename T>
struct is_sequence_type<T,
	std::enable_if_t<
		std::experimental::is_detected_v<value_type_t, T> and
		std::experimental::is_detected_v<iterator_t, T> and
		not std::experimental::is_detected_v<std_string_npos_t, T> and
		not std::experimental::is_detected_v<mapped_type_t, T>>> : std::true_type {};

template<typename T>
inline constexpr bool is_sequence_type_v = is_sequence_type<T>::value;

} // namespace soapclient
