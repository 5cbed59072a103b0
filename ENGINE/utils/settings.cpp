#include "utils/settings.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"

namespace cradle::settings {

namespace {

constexpr const char* kDefaultSettingsFile = "cradle_settings.json";

struct State {
    std::filesystem::path file{};
    bool path_overridden = false;
    nlohmann::json cache = nlohmann::json::object();
    bool loaded = false;
};

std::mutex& settings_mutex() {
    static std::mutex mutex;
    return mutex;
}

State& state() {
    static State s;
    return s;
}

std::filesystem::path resolve_path() {
    State& s = state();
    if (s.path_overridden) {
        return s.file;
    }
    if (const char* env = std::getenv("CRADLE_SETTINGS_FILE")) {
        if (*env) {
            return std::filesystem::path(env);
        }
    }
    return std::filesystem::path(kDefaultSettingsFile);
}

nlohmann::json read_document(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        if (ec) {
            log::warn("[Settings] exists(" + file.string() + ") failed: " + ec.message());
        }
        return nlohmann::json::object();
    }
    std::ifstream in(file);
    if (!in.is_open()) {
        log::warn("[Settings] Failed to open '" + file.string() + "' for reading");
        return nlohmann::json::object();
    }
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    nlohmann::json parsed = nlohmann::json::parse(contents, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        log::warn("[Settings] '" + file.string() + "' is not a JSON object; using defaults");
        return nlohmann::json::object();
    }
    return parsed;
}

bool write_document(const std::filesystem::path& file, const nlohmann::json& doc) {
    std::error_code ec;
    const auto parent = file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            log::warn("[Settings] Failed to create parent directory for '" + file.string() + "': " + ec.message());
            return false;
        }
    }
    const std::filesystem::path tmp = file.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            log::warn("[Settings] Failed to open temp file '" + tmp.string() + "' for writing");
            return false;
        }
        out << doc.dump(4);
        out.flush();
        if (!out.good()) {
            log::warn("[Settings] Stream error while writing '" + tmp.string() + "'");
            return false;
        }
    }
    std::filesystem::rename(tmp, file, ec);
    if (ec) {
        log::warn("[Settings] rename('" + tmp.string() + "' -> '" + file.string() + "') failed: " + ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

void ensure_loaded() {
    State& s = state();
    if (s.loaded) {
        return;
    }
    s.loaded = true;
    s.cache = read_document(resolve_path());
}

std::vector<std::string> split_key(std::string_view key) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : key) {
        if (ch == '.') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

const nlohmann::json* find_node(std::string_view key) {
    const auto parts = split_key(key);
    if (parts.empty()) {
        return nullptr;
    }
    const nlohmann::json* node = &state().cache;
    for (const auto& part : parts) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

template <typename T>
void store_value(std::string_view key, T value) {
    const auto parts = split_key(key);
    if (parts.empty()) {
        return;
    }
    nlohmann::json* node = &state().cache;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        nlohmann::json& next = (*node)[parts[i]];
        if (!next.is_object()) {
            next = nlohmann::json::object();
        }
        node = &next;
    }
    (*node)[parts.back()] = value;
    write_document(resolve_path(), state().cache);
}

}

std::filesystem::path path() {
    std::lock_guard<std::mutex> lock(settings_mutex());
    return resolve_path();
}

void set_path(const std::filesystem::path& file) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    State& s = state();
    s.file = file;
    s.path_overridden = !file.empty();
    s.loaded = false;
    s.cache = nlohmann::json::object();
}

void reload() {
    std::lock_guard<std::mutex> lock(settings_mutex());
    state().loaded = false;
    ensure_loaded();
}

bool load_bool(std::string_view key, bool default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node || !node->is_boolean()) {
        return default_value;
    }
    return node->get<bool>();
}

void save_bool(std::string_view key, bool value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    store_value(key, value);
}

double load_number(std::string_view key, double default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node) {
        return default_value;
    }
    if (node->is_number()) {
        return node->get<double>();
    }
    if (node->is_string()) {
        const std::string text = node->get<std::string>();
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (!text.empty() && end == text.c_str() + text.size()) {
            return parsed;
        }
        log::warn("[Settings] '" + std::string(key) + "' is not numeric: " + text);
    }
    return default_value;
}

void save_number(std::string_view key, double value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    store_value(key, value);
}

}
