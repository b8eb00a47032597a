#include <modeldiff/fs/file_io.h>

#include <modeldiff/utilities/errors.h>
#include <modeldiff/utilities/testing.h>

using namespace modeldiff;

template<class File>
void
test_bad_open_file(std::ios::openmode mode)
{
    file_path path("/very/likely/to-be/bad/file/path/asfqwfa/--test");

    File file;
    try
    {
        open_file(file, path, mode);
        FAIL("no exception thrown");
    }
    catch (open_file_error& e)
    {
        REQUIRE(get_required_error_info<file_path_info>(e) == path);
        REQUIRE(get_required_error_info<open_mode_info>(e) == mode);
        get_required_error_info<internal_error_message_info>(e);
    }
}

TEST_CASE("file open errors", "[fs][file_io]")
{
    test_bad_open_file<std::ifstream>(std::ios::in);
    test_bad_open_file<std::ofstream>(
        std::ios::binary | std::ios::out | std::ios::trunc);
}

TEST_CASE("file error bits set", "[fs][file_io]")
{
    auto path = get_test_scratch_dir("file_io") / "empty_file.txt";
    dump_string_to_file(path, "");
    std::ifstream fs;
    open_file(fs, path, std::ios::in);
    int i;
    REQUIRE_THROWS(fs >> i);
}

TEST_CASE("read_file_contents", "[fs][file_io]")
{
    auto dir = get_test_scratch_dir("file_io");
    auto path = dir / "read_file_contents.txt";
    auto text = "some simple\n  text\n";
    dump_string_to_file(path, text);
    REQUIRE(read_file_contents(path) == text);

    // Writing again replaces the contents.
    dump_string_to_file(path, "{}");
    REQUIRE(read_file_contents(path) == "{}");

    dump_string_to_file(path, "");
    REQUIRE(read_file_contents(path) == "");

    REQUIRE_THROWS_AS(read_file_contents(dir / "missing.json"), open_file_error);
}
