#pragma once

#include <filesystem>
#include <string_view>

namespace cradle::settings {

// Settings live in one JSON document addressed by dotted keys
// ("transitions.cross_dissolve.duration"). The file is read lazily on first use.
std::filesystem::path path();
void set_path(const std::filesystem::path& file);
void reload();

bool load_bool(std::string_view key, bool default_value);
void save_bool(std::string_view key, bool value);
double load_number(std::string_view key, double default_value);
void save_number(std::string_view key, double value);

}
