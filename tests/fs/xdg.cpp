#include <modeldiff/fs/xdg.h>

#include <modeldiff/fs/file_io.h>
#include <modeldiff/utilities/environment.h>
#include <modeldiff/utilities/testing.h>

using namespace modeldiff;

TEST_CASE("XDG user config dir", "[fs][xdg]")
{
    set_environment_variable("HOME", "");
    set_environment_variable("XDG_CONFIG_HOME", "");
    REQUIRE_THROWS_AS(xdg::get_user_config_dir(), missing_environment_variable);

    set_environment_variable("HOME", "/home");
    REQUIRE(xdg::get_user_config_dir() == "/home/.config");

    // Check that relative paths are ignored.
    set_environment_variable("XDG_CONFIG_HOME", "abc/def");
    REQUIRE(xdg::get_user_config_dir() == "/home/.config");

    set_environment_variable("XDG_CONFIG_HOME", "/config");
    REQUIRE(xdg::get_user_config_dir() == "/config");
}

TEST_CASE("XDG system config dirs", "[fs][xdg]")
{
    set_environment_variable("XDG_CONFIG_DIRS", "");
    REQUIRE(
        xdg::get_system_config_dirs()
        == std::vector<file_path>({file_path("/etc/xdg")}));

    set_environment_variable("XDG_CONFIG_DIRS", "/etc/abc");
    REQUIRE(
        xdg::get_system_config_dirs()
        == std::vector<file_path>({file_path("/etc/abc")}));

    set_environment_variable("XDG_CONFIG_DIRS", "/etc/abc:/def");
    REQUIRE(
        xdg::get_system_config_dirs()
        == std::vector<file_path>({file_path("/etc/abc"), file_path("/def")}));

    // Check that relative paths are ignored.
    set_environment_variable("XDG_CONFIG_DIRS", "/etc/abc:de/f");
    REQUIRE(
        xdg::get_system_config_dirs()
        == std::vector<file_path>({file_path("/etc/abc")}));
}

TEST_CASE("XDG config item search", "[fs][xdg]")
{
    auto dir = get_test_scratch_dir("xdg");
    auto user_dir = dir / "user";
    auto system_dir = dir / "system";
    std::filesystem::create_directories(user_dir / "model-diff");
    std::filesystem::create_directories(system_dir / "model-diff");

    set_environment_variable("HOME", dir.string());
    set_environment_variable("XDG_CONFIG_HOME", user_dir.string());
    set_environment_variable("XDG_CONFIG_DIRS", system_dir.string());

    file_path item("model-diff/config.yml");
    REQUIRE(xdg::find_config_item(item) == none);

    // System locations are used when the user doesn't have the item.
    dump_string_to_file(system_dir / item, "column_label_limit: 2\n");
    REQUIRE(xdg::find_config_item(item) == some(system_dir / item));

    // The user location takes precedence.
    dump_string_to_file(user_dir / item, "column_label_limit: 3\n");
    REQUIRE(xdg::find_config_item(item) == some(user_dir / item));

    // Without a home directory, only the system locations are searched.
    set_environment_variable("HOME", "");
    set_environment_variable("XDG_CONFIG_HOME", "");
    REQUIRE(xdg::find_config_item(item) == some(system_dir / item));
}
