#include "doctest/doctest.h"

#include <string>
#include <utility>
#include <vector>

#include "utils/log.hpp"

using cradle::log::Level;

namespace {

struct RestoreLevel {
    Level previous = cradle::log::level();
    ~RestoreLevel() { cradle::log::set_level(previous); }
};

}

TEST_CASE("Messages above the current level are dropped") {
    RestoreLevel restore;
    std::vector<std::pair<Level, std::string>> lines;
    cradle::log::ScopedSink sink([&](Level level, const std::string& message) { lines.emplace_back(level, message); });

    cradle::log::set_level(Level::Warn);
    cradle::log::error("boom");
    cradle::log::warn("careful");
    cradle::log::info("hello");
    cradle::log::debug("details");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0].first == Level::Error);
    CHECK(lines[0].second == "boom");
    CHECK(lines[1].first == Level::Warn);

    cradle::log::set_level(Level::Debug);
    cradle::log::debug("details");
    CHECK(lines.size() == 3);
}

TEST_CASE("Scoped sinks restore the previous sink") {
    RestoreLevel restore;
    cradle::log::set_level(Level::Info);
    int outer = 0;
    int inner = 0;
    cradle::log::ScopedSink outer_sink([&](Level, const std::string&) { ++outer; });
    {
        cradle::log::ScopedSink inner_sink([&](Level, const std::string&) { ++inner; });
        cradle::log::info("to inner");
    }
    cradle::log::info("to outer");
    CHECK(inner == 1);
    CHECK(outer == 1);
}

TEST_CASE("Level names") {
    CHECK(std::string(cradle::log::level_name(Level::Error)) == "ERROR");
    CHECK(std::string(cradle::log::level_name(Level::Warn)) == "WARN");
    CHECK(std::string(cradle::log::level_name(Level::Info)) == "INFO");
    CHECK(std::string(cradle::log::level_name(Level::Debug)) == "DEBUG");
}
