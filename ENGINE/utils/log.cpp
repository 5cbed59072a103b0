#include "utils/log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace {

using cradle::log::Level;

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

Level& global_level() {
    static Level lvl = Level::Info;
    return lvl;
}

std::atomic<bool>& env_init_flag() {
    static std::atomic<bool> f{false};
    return f;
}

std::unique_ptr<std::ofstream>& file_sink() {
    static std::unique_ptr<std::ofstream> f{};
    return f;
}

cradle::log::Sink& custom_sink() {
    static cradle::log::Sink sink{};
    return sink;
}

std::chrono::steady_clock::time_point& time_origin() {
    static auto t0 = std::chrono::steady_clock::now();
    return t0;
}

bool env_flag_set(const char* v) {
    return v && (*v == '1' || *v == 'y' || *v == 'Y' || *v == 't' || *v == 'T');
}

Level parse_level_env(std::string_view v) {
    auto lower = std::string(v);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return Level::Info;
}

void init_from_env_once() {
    bool expected = false;
    if (!env_init_flag().compare_exchange_strong(expected, true)) {
        return;
    }
    if (const char* v = std::getenv("CRADLE_LOG_LEVEL")) {
        global_level() = parse_level_env(v);
    }

    const char* file = std::getenv("CRADLE_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        if (env_flag_set(std::getenv("CRADLE_LOG_APPEND"))) mode |= std::ios::app; else mode |= std::ios::trunc;
        auto ofs = std::make_unique<std::ofstream>(file, mode);
        if (ofs->good()) {
            file_sink() = std::move(ofs);
        }
    }
}

void log_line_impl(Level level, const std::string& message) {
    init_from_env_once();
    cradle::log::Sink sink;
    {
        std::lock_guard<std::mutex> lock(log_mutex());
        if (static_cast<int>(level) > static_cast<int>(global_level())) {
            return;
        }
        sink = custom_sink();
    }
    if (sink) {
        sink(level, message);
        return;
    }

    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - time_origin()).count();
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss << '[' << cradle::log::level_name(level) << "] +" << std::setprecision(3) << secs << "s: " << message << '\n';
    const std::string line = ss.str();

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ostream& os = (level == Level::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
    if (file_sink()) {
        (*file_sink()) << line;
        file_sink()->flush();
    }
}

}

namespace cradle::log {

void set_level(Level level) {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    global_level() = level;
}

Level level() {
    init_from_env_once();
    std::lock_guard<std::mutex> lock(log_mutex());
    return global_level();
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
        default:           return "INFO";
    }
}

void reset_time_origin() {
    std::lock_guard<std::mutex> lock(log_mutex());
    time_origin() = std::chrono::steady_clock::now();
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(log_mutex());
    custom_sink() = std::move(sink);
}

void error(const std::string& message) { log_line_impl(Level::Error, message); }
void warn (const std::string& message) { log_line_impl(Level::Warn,  message); }
void info (const std::string& message) { log_line_impl(Level::Info,  message); }
void debug(const std::string& message) { log_line_impl(Level::Debug, message); }

ScopedSink::ScopedSink(Sink sink) {
    std::lock_guard<std::mutex> lock(log_mutex());
    previous_ = custom_sink();
    custom_sink() = std::move(sink);
}

ScopedSink::~ScopedSink() {
    std::lock_guard<std::mutex> lock(log_mutex());
    custom_sink() = std::move(previous_);
}

}
