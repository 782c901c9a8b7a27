//        Copyright Maarten L. Hekkelman, 2014-2024
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/*! \file soapclient/value-serializer.hpp
    \brief File containing the conversion of simple values to and from strings

    Element content and attribute values in SOAP messages are text. The
    conversion of the basic C++ types to and from that text is found here.
*/

#include <soapclient/config.hpp>

#include <charconv>
#include <cstdint>
#include <map>
#include <sstream>
#include <string>
#include <system_error>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <soapclient/exception.hpp>

namespace soapclient
{

// --------------------------------------------------------------------
/// \brief A template boilerplate for conversion of basic types to or
/// from strings.
///
/// Each specialization should provide a static to_string and a from_string
/// method as well as a type_name method. The type_name is the XML schema
/// type, it ends up in xsi:type attributes set by set_xml_type hooks.

template <typename T, typename = void>
struct value_serializer;

/// @ref value_serializer implementation for booleans
template <>
struct value_serializer<bool>
{
	static constexpr const char *type_name() { return "xsd:boolean"; }
	static std::string to_string(bool value) { return value ? "true" : "false"; }
	static bool from_string(const std::string &value) { return value == "true" or value == "1" or value == "yes"; }
};

/// @ref value_serializer implementation for std::strings
template <>
struct value_serializer<std::string>
{
	static constexpr const char *type_name() { return "xsd:string"; }
	static std::string to_string(const std::string &value) { return value; }
	static std::string from_string(const std::string &value) { return value; }
};

template<typename T>
struct char_conv_serializer
{
	using value_type = T;

	static constexpr const char *derived_type_name()
	{
		using value_serializer_type = value_serializer<value_type>;
		return value_serializer_type::type_name();
	}

	static std::string to_string(value_type value) { return std::to_string(value); }
	static value_type from_string(const std::string &value)
	{
		value_type result{};

		auto r = std::from_chars(value.data(), value.data() + value.length(), result);

		if (r.ec != std::errc{} or r.ptr != value.data() + value.length())
			throw std::system_error(std::make_error_code(r.ec == std::errc{} ? std::errc::invalid_argument : r.ec),
				"Error converting value '" + value + "' to type " + derived_type_name());

		return result;
	}
};

/// @ref value_serializer implementation for small int8_t
template <>
struct value_serializer<int8_t> : char_conv_serializer<int8_t>
{
	static constexpr const char *type_name() { return "xsd:byte"; }
};

/// @ref value_serializer implementation for uint8_t
template <>
struct value_serializer<uint8_t> : char_conv_serializer<uint8_t>
{
	static constexpr const char *type_name() { return "xsd:unsignedByte"; }
};

/// @ref value_serializer implementation for int16_t
template <>
struct value_serializer<int16_t> : char_conv_serializer<int16_t>
{
	static constexpr const char *type_name() { return "xsd:short"; }
};

/// @ref value_serializer implementation for uint16_t
template <>
struct value_serializer<uint16_t> : char_conv_serializer<uint16_t>
{
	static constexpr const char *type_name() { return "xsd:unsignedShort"; }
};

/// @ref value_serializer implementation for int32_t
template <>
struct value_serializer<int32_t> : char_conv_serializer<int32_t>
{
	static constexpr const char *type_name() { return "xsd:int"; }
};

/// @ref value_serializer implementation for uint32_t
template <>
struct value_serializer<uint32_t> : char_conv_serializer<uint32_t>
{
	static constexpr const char *type_name() { return "xsd:unsignedInt"; }
};

/// @ref value_serializer implementation for int64_t
template <>
struct value_serializer<int64_t> : char_conv_serializer<int64_t>
{
	static constexpr const char *type_name() { return "xsd:long"; }
};

/// @ref value_serializer implementation for uint64_t
template <>
struct value_serializer<uint64_t> : char_conv_serializer<uint64_t>
{
	static constexpr const char *type_name() { return "xsd:unsignedLong"; }
};

/// @ref value_serializer implementation for float
template <>
struct value_serializer<float>
{
	static constexpr const char *type_name() { return "xsd:float"; }
	static std::string to_string(float value)
	{
		std::ostringstream s;
		s << value;
		return s.str();
	}
	static float from_string(const std::string &value) { return std::stof(value); }
};

/// @ref value_serializer implementation for double
template <>
struct value_serializer<double>
{
	static constexpr const char *type_name() { return "xsd:double"; }
	static std::string to_string(double value)
	{
		std::ostringstream s;
		s << value;
		return s.str();
	}
	static double from_string(const std::string &value) { return std::stod(value); }
};

/// \brief value_serializer for enum values
///
/// This class is used to (de-)serialize enum values. To map enum
/// values to a string you should use init() with the name of the
/// type and the name/value pairs, or use the singleton instance
/// accessible through instance() and call the operator() members
/// assigning each of the enum values their respective string.

template <typename T>
struct value_serializer<T, std::enable_if_t<std::is_enum_v<T>>>
{
	std::string m_type_name;

	using value_map_type = std::map<T, std::string>;
	using value_map_value_type = typename value_map_type::value_type;

	value_map_type m_value_map;

	/// \brief Initialize a new instance of value_serializer for this enum, with name and a set of name/value pairs
	static void init(const char *name, std::initializer_list<value_map_value_type> values)
	{
		instance(name).m_value_map = value_map_type(values);
	}

	/// \brief Initialize a new anonymous instance of value_serializer for this enum with a set of name/value pairs
	static void init(std::initializer_list<value_map_value_type> values)
	{
		instance().m_value_map = value_map_type(values);
	}

	static value_serializer &instance(const char *name = nullptr)
	{
		static value_serializer s_instance;
		if (name and s_instance.m_type_name.empty())
			s_instance.m_type_name = name;
		return s_instance;
	}

	value_serializer &operator()(T v, const std::string &name)
	{
		m_value_map[v] = name;
		return *this;
	}

	value_serializer &operator()(const std::string &name, T v)
	{
		m_value_map[v] = name;
		return *this;
	}

	static const char *type_name()
	{
		return instance().m_type_name.c_str();
	}

	static std::string to_string(T value)
	{
		return instance().m_value_map[value];
	}

	static T from_string(const std::string &value)
	{
		T result = {};
		for (auto &t : instance().m_value_map)
			if (t.second == value)
			{
				result = t.first;
				break;
			}
		return result;
	}

	static bool empty()
	{
		return instance().m_value_map.empty();
	}
};

// --------------------------------------------------------------------
// date/time support, using boost::posix_time

/// \brief to_string/from_string for boost::posix_time::ptime
/// time is always assumed to be UTC and written as YYYY-MM-DDThh:mm:ss

template <>
struct value_serializer<boost::posix_time::ptime>
{
	static constexpr const char *type_name() { return "xsd:dateTime"; }

	static std::string to_string(const boost::posix_time::ptime &v)
	{
		return boost::posix_time::to_iso_extended_string(v);
	}

	/// from_string accepts YYYY-MM-DDThh:mm:ss with optional fraction and a trailing Z
	static boost::posix_time::ptime from_string(const std::string &s)
	{
		std::string v = s;
		if (not v.empty() and (v.back() == 'Z' or v.back() == 'z'))
			v.pop_back();

		auto t = v.find('T');
		if (t != std::string::npos)
			v[t] = ' ';

		try
		{
			return boost::posix_time::time_from_string(v);
		}
		catch (const std::exception &)
		{
			throw exception("invalid formatted date/time '" + s + "'");
		}
	}
};

/// \brief to_string/from_string for boost::gregorian::date, written as YYYY-MM-DD

template <>
struct value_serializer<boost::gregorian::date>
{
	static constexpr const char *type_name() { return "xsd:date"; }

	static std::string to_string(const boost::gregorian::date &v)
	{
		return boost::gregorian::to_iso_extended_string(v);
	}

	static boost::gregorian::date from_string(const std::string &s)
	{
		try
		{
			return boost::gregorian::from_simple_string(s);
		}
		catch (const std::exception &)
		{
			throw exception("invalid formatted date '" + s + "'");
		}
	}
};

} // namespace soapclient
