#ifndef MODELDIFF_CONFIG_H
#define MODELDIFF_CONFIG_H

#include <modeldiff/core.h>
#include <modeldiff/fs/types.h>

namespace modeldiff {

// diff_config holds the tunable parameters of a document comparison.
// It's passed explicitly into every comparison; there is no global instance.
struct diff_config
{
    // the maximum number of column labels listed in a single added, removed
    // or modified columns entry
    size_t column_label_limit = 5;
    // how many characters of a newly added description are quoted
    size_t description_preview_length = 100;
    // strings longer than this (in characters) are summarized by length
    // rather than quoted when they change
    size_t long_string_threshold = 50;
    // the label used for pages and elements that don't have a name
    string unnamed_placeholder = "Unnamed";
    // the tag used for elements that don't have a kind
    string default_element_kind = "element";
};

bool
operator==(diff_config const& a, diff_config const& b);
bool
operator!=(diff_config const& a, diff_config const& b);

// Read a diff_config from a dynamic map. Fields that are missing keep their
// default values. Unknown fields are ignored (with a warning).
diff_config
read_diff_config(dynamic const& v);

// Write a diff_config to a dynamic map.
dynamic
to_dynamic(diff_config const& config);

// Load a diff_config from a YAML (or JSON) file.
diff_config
load_diff_config(file_path const& path);

// If a configuration is malformed, this exception is thrown.
MODELDIFF_DEFINE_EXCEPTION(invalid_config)
MODELDIFF_DEFINE_ERROR_INFO(string, config_field)

// the location (relative to the XDG config directories) of the default
// configuration file
extern char const* const default_config_file;

} // namespace modeldiff

#endif
