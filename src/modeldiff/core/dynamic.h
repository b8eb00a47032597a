#ifndef MODELDIFF_CORE_DYNAMIC_H
#define MODELDIFF_CORE_DYNAMIC_H

#include <ostream>

#include <modeldiff/core/exception.h>
#include <modeldiff/core/type_definitions.h>

namespace modeldiff {

// DYNAMIC VALUES - Dynamic values are values whose structure is determined at
// run-time rather than compile time.

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
MODELDIFF_DEFINE_EXCEPTION(type_mismatch)
MODELDIFF_DEFINE_ERROR_INFO(value_type, expected_value_type)
MODELDIFF_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<integer>
{
    static value_type const value = value_type::INTEGER;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::FLOAT;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_map>
{
    static value_type const value = value_type::MAP;
};

// MAPS

// This queries a map for a field with a key matching the given string.
// If the field is not present in the map, an exception is thrown.
dynamic const&
get_field(dynamic_map const& r, string const& field);

MODELDIFF_DEFINE_EXCEPTION(missing_field)
MODELDIFF_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the map.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);

// VALUES

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T const&>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&>(v.contents());
}
// Same, but with move semantics.
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::any_cast<T&&>(std::move(v).contents());
}

// Is :v an array or a map?
inline bool
is_composite(dynamic const& v)
{
    return v.type() == value_type::ARRAY || v.type() == value_type::MAP;
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v);

void
swap(dynamic& a, dynamic& b);

bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);
bool
operator<(dynamic const& a, dynamic const& b);
bool
operator<=(dynamic const& a, dynamic const& b);
bool
operator>(dynamic const& a, dynamic const& b);
bool
operator>=(dynamic const& a, dynamic const& b);

// Apply the functor fn to the value v.
// fn must have the function call operator overloaded for all supported
// types (including nil). If it doesn't, you'll get a compile-time error.
template<class Fn>
auto
apply_to_dynamic(Fn&& fn, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(v));
        case value_type::INTEGER:
            return fn(cast<integer>(v));
        case value_type::FLOAT:
            return fn(cast<double>(v));
        case value_type::STRING:
            return fn(cast<string>(v));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(v));
        case value_type::MAP:
            return fn(cast<dynamic_map>(v));
    }
}

// Apply the functor fn to two values of the same type.
// If a and b are not the same type, this throws a type_mismatch exception.
template<class Fn>
auto
apply_to_dynamic_pair(Fn&& fn, dynamic const& a, dynamic const& b)
{
    check_type(a.type(), b.type());
    switch (a.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil, nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(a), cast<bool>(b));
        case value_type::INTEGER:
            return fn(cast<integer>(a), cast<integer>(b));
        case value_type::FLOAT:
            return fn(cast<double>(a), cast<double>(b));
        case value_type::STRING:
            return fn(cast<string>(a), cast<string>(b));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(a), cast<dynamic_array>(b));
        case value_type::MAP:
            return fn(cast<dynamic_map>(a), cast<dynamic_map>(b));
    }
}

} // namespace modeldiff

#endif
