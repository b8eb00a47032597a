#ifndef MODELDIFF_CORE_UTILITIES_H
#define MODELDIFF_CORE_UTILITIES_H

#include <modeldiff/core/exception.h>

#include <boost/lexical_cast.hpp>
#include <boost/optional/optional_io.hpp>

namespace modeldiff {

using boost::lexical_cast;

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
MODELDIFF_DEFINE_EXCEPTION(invalid_enum_value)
MODELDIFF_DEFINE_ERROR_INFO(string, enum_id)
MODELDIFF_DEFINE_ERROR_INFO(int, enum_value)

} // namespace modeldiff

#endif
