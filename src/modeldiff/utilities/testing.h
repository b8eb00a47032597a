#ifndef MODELDIFF_UTILITIES_TESTING_H
#define MODELDIFF_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <modeldiff/fs/types.h>

namespace modeldiff {

// Get an empty directory for a test to work in.
// The directory lives under the system's temporary directory and is cleared
// each time this is called with the same :name.
inline file_path
get_test_scratch_dir(string const& name)
{
    auto dir = std::filesystem::temp_directory_path() / "modeldiff-tests"
               / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace modeldiff

#endif
