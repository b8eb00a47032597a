#ifndef MODELDIFF_FS_TYPES_H
#define MODELDIFF_FS_TYPES_H

#include <filesystem>

#include <modeldiff/core.h>

namespace modeldiff {

// (Note that file_path is of course slightly incorrect because the path could
// refer to a directory, but it's a lot easier to read and this seems like a
// pretty common usage.)
typedef std::filesystem::path file_path;

} // namespace modeldiff

#endif
