#ifndef MODELDIFF_UTILITIES_TEXT_H
#define MODELDIFF_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <modeldiff/core/exception.h>

namespace modeldiff {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
MODELDIFF_DEFINE_EXCEPTION(parsing_error)
MODELDIFF_DEFINE_ERROR_INFO(string, expected_format)
MODELDIFF_DEFINE_ERROR_INFO(string, parsed_text)
MODELDIFF_DEFINE_ERROR_INFO(string, parsing_error)

// Get the first :length characters of :text.
// This counts UTF-8 code points rather than bytes, so a multibyte character
// is never split.
string
utf8_prefix(string const& text, size_t length);

// Get the length of :text in characters (UTF-8 code points).
size_t
utf8_length(string const& text);

} // namespace modeldiff

#endif
