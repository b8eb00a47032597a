#include <modeldiff/core/dynamic.h>

#include <algorithm>

#include <modeldiff/core/utilities.h>
#include <modeldiff/encodings/yaml.h>

namespace modeldiff {

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::INTEGER:
            s << "integer";
            break;
        case value_type::FLOAT:
            s << "float";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::MAP:
            s << "map";
            break;
        default:
            MODELDIFF_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        MODELDIFF_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as a map.
    if (list.size() != 0
        && std::all_of(list.begin(), list.end(), [](dynamic const& v) {
               return v.type() == value_type::ARRAY
                      && cast<dynamic_array>(v).size() == 2
                      && cast<dynamic_array>(v)[0].type()
                             == value_type::STRING;
           }))
    {
        dynamic_map map;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            map[array[0]] = array[1];
        }
        *this = std::move(map);
    }
    else
    {
        *this = dynamic_array(list);
    }
}

void
dynamic::set(nil_t _)
{
    type_ = value_type::NIL;
    value_.reset();
}
void
dynamic::set(bool v)
{
    type_ = value_type::BOOLEAN;
    value_ = v;
}
void
dynamic::set(integer v)
{
    type_ = value_type::INTEGER;
    value_ = v;
}
void
dynamic::set(double v)
{
    type_ = value_type::FLOAT;
    value_ = v;
}
void
dynamic::set(string const& v)
{
    type_ = value_type::STRING;
    value_ = v;
}
void
dynamic::set(string&& v)
{
    type_ = value_type::STRING;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_array const& v)
{
    type_ = value_type::ARRAY;
    value_ = v;
}
void
dynamic::set(dynamic_array&& v)
{
    type_ = value_type::ARRAY;
    value_ = std::move(v);
}
void
dynamic::set(dynamic_map const& v)
{
    type_ = value_type::MAP;
    value_ = v;
}
void
dynamic::set(dynamic_map&& v)
{
    type_ = value_type::MAP;
    value_ = std::move(v);
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.type_, b.type_);
    swap(a.value_, b.value_);
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    os << value_to_diagnostic_yaml(v);
    return os;
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x == y; }, a, b);
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

bool
operator<(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return a.type() < b.type();
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x < y; }, a, b);
}
bool
operator<=(dynamic const& a, dynamic const& b)
{
    return !(b < a);
}
bool
operator>(dynamic const& a, dynamic const& b)
{
    return b < a;
}
bool
operator>=(dynamic const& a, dynamic const& b)
{
    return !(a < b);
}

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        MODELDIFF_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto i = r.find(dynamic(field));
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

} // namespace modeldiff
