#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include <filesystem>
#include <system_error>

#include "utils/log.hpp"
#include "utils/settings.hpp"

int main(int argc, char** argv) {
    // Keep a settings file in the working directory from leaking into the tests.
    const auto settings_file = std::filesystem::temp_directory_path() / "cradle_tests_settings.json";
    std::error_code ec;
    std::filesystem::remove(settings_file, ec);
    cradle::settings::set_path(settings_file);
    cradle::log::set_level(cradle::log::Level::Warn);

    doctest::Context context(argc, argv);
    return context.run();
}
