#ifndef MODELDIFF_CORE_TYPE_DEFINITIONS_H
#define MODELDIFF_CORE_TYPE_DEFINITIONS_H

#include <any>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace modeldiff {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

inline bool
operator==(nil_t, nil_t)
{
    return true;
}
inline bool
operator!=(nil_t, nil_t)
{
    return false;
}
inline bool
operator<(nil_t, nil_t)
{
    return false;
}

struct dynamic;

// The order of these cases defines how values of different types compare.
enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    ARRAY, // dynamic_array - array of dynamic values
    MAP, // dynamic_map - collection of named dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

// Maps are represented as std::maps and can be manipulated as such.
// Since std::map is ordered, iterating over a map always visits its keys in
// sorted order.
typedef std::map<dynamic, dynamic> dynamic_map;

// A dynamic is a value whose structure is determined at run-time rather than
// compile time. Every document that passes through modeldiff is one.
struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
        set(nil);
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v)
    {
        set(v);
    }
    dynamic(bool v)
    {
        set(v);
    }
    dynamic(integer v)
    {
        set(v);
    }
    dynamic(int v)
    {
        set(integer(v));
    }
    dynamic(double v)
    {
        set(v);
    }
    dynamic(string const& v)
    {
        set(v);
    }
    dynamic(string&& v)
    {
        set(std::move(v));
    }
    dynamic(char const* v)
    {
        set(string(v));
    }
    dynamic(dynamic_array const& v)
    {
        set(v);
    }
    dynamic(dynamic_array&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_map const& v)
    {
        set(v);
    }
    dynamic(dynamic_map&& v)
    {
        set(std::move(v));
    }

    // Construct from an initializer list.
    // A list made up entirely of string-keyed pairs is treated as a map.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    value_type
    type() const
    {
        return type_;
    }

    // Get the contents.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any const&
    contents() const&
    {
        return value_;
    }
    std::any&
    contents() &
    {
        return value_;
    }
    std::any&&
    contents() &&
    {
        return std::move(value_);
    }

 private:
    void
    set(nil_t _);
    void
    set(bool v);
    void
    set(integer v);
    void
    set(double v);
    void
    set(string const& v);
    void
    set(string&& v);
    void
    set(dynamic_array const& v);
    void
    set(dynamic_array&& v);
    void
    set(dynamic_map const& v);
    void
    set(dynamic_map&& v);

    friend void
    swap(dynamic& a, dynamic& b);

    value_type type_;
    std::any value_;
};

} // namespace modeldiff

#endif
