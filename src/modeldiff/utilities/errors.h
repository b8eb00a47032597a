#ifndef MODELDIFF_UTILITIES_ERRORS_H
#define MODELDIFF_UTILITIES_ERRORS_H

#include <modeldiff/core/exception.h>

namespace modeldiff {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
MODELDIFF_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace modeldiff

#endif
