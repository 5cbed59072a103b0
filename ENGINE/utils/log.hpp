#pragma once

#include <functional>
#include <string>

namespace cradle::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level level);
Level level();
const char* level_name(Level level);

void reset_time_origin();

// Replaces console/file output. Passing an empty sink restores the default.
void set_sink(Sink sink);

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

class ScopedSink {
public:
    explicit ScopedSink(Sink sink);
    ~ScopedSink();

    ScopedSink(const ScopedSink&) = delete;
    ScopedSink& operator=(const ScopedSink&) = delete;

private:
    Sink previous_{};
};

}
