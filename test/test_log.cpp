#include <catch2/catch_all.hpp>
#include <ms/log.h>

#include <cstdlib>
#include <vector>

using namespace ms;

TEST_CASE("Warnings go to the installed handler") {
    std::vector<log::Warning> seen;
    auto previous = log::set_warning_handler([&seen](const log::Warning& w) { seen.push_back(w); });
    log::warn("deprecation", "old behavior");
    log::warn("other", "second");
    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].category == "deprecation");
    REQUIRE(seen[0].message == "old behavior");

    auto mine = log::set_warning_handler(previous);
    REQUIRE(mine);
    log::warn("deprecation", "not recorded");
    REQUIRE(seen.size() == 2);
}

TEST_CASE("Debug output follows the environment") {
    unsetenv("MS_SCHEMA_DEBUG");
    REQUIRE_FALSE(log::debug_enabled());
    setenv("MS_SCHEMA_DEBUG", "1", 1);
    REQUIRE(log::debug_enabled());
    unsetenv("MS_SCHEMA_DEBUG");
}
