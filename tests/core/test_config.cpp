/**
 * @file test_config.cpp
 * @brief INI-style host configuration parsing.
 */

#include <catch2/catch_test_macros.hpp>

#include "scriptscene/core/config.hpp"

#include <sstream>

using namespace scriptscene;
using namespace scriptscene::core;

TEST_CASE("HostConfig defaults", "[core][config]") {
    HostConfig config;

    REQUIRE(config.logging.enabled);
    REQUIRE(config.logging.level == LogLevel::Info);
    REQUIRE(config.sandbox.max_memory_mb == 32);
    REQUIRE(config.sandbox.max_instructions_per_call == 5000000);
    REQUIRE(config.memory.max_array_items == 4096);
}

TEST_CASE("ConfigLoader reads every section", "[core][config]") {
    HostConfig config;
    ConfigLoader loader(config);

    std::istringstream in(R"(
# comment line
[logging]
enabled = yes
level = warn
file = "host.log"
tags.abi = off

[Sandbox]
max_memory_mb = 8
MAX_INSTRUCTIONS_PER_CALL = 1000 ; trailing comment
max_execution_time_sec = 0.25

[memory]
guest_heap_bytes = 4096
guest_heap_limit_bytes = 65536
max_string_bytes = 128
max_array_items = 16

[host]
tick_rate = 60
ticks = 12
)");
    loader.load_from_stream(in);

    REQUIRE(config.logging.level == LogLevel::Warning);
    REQUIRE(config.logging.file == "host.log");
    REQUIRE(config.logging.tags.at("abi") == false);

    REQUIRE(config.sandbox.max_memory_mb == 8);
    REQUIRE(config.sandbox.max_instructions_per_call == 1000);
    REQUIRE(config.sandbox.max_execution_time_sec == 0.25);

    REQUIRE(config.memory.guest_heap_bytes == 4096);
    REQUIRE(config.memory.guest_heap_limit_bytes == 65536);
    REQUIRE(config.memory.max_string_bytes == 128);
    REQUIRE(config.memory.max_array_items == 16);

    REQUIRE(config.host.tick_rate == 60.0f);
    REQUIRE(config.host.ticks == 12);
}

TEST_CASE("ConfigLoader keeps defaults for malformed values", "[core][config]") {
    HostConfig config;
    ConfigLoader loader(config);

    std::istringstream in(
        "[memory]\n"
        "max_array_items = lots\n"
        "guest_heap_bytes = -5\n"
        "[host]\n"
        "ticks = 3x\n"
        "no equals sign here\n");
    loader.load_from_stream(in);

    const HostConfig defaults;
    REQUIRE(config.memory.max_array_items == defaults.memory.max_array_items);
    REQUIRE(config.memory.guest_heap_bytes == defaults.memory.guest_heap_bytes);
    REQUIRE(config.host.ticks == defaults.host.ticks);
}

TEST_CASE("ConfigLoader raises the heap limit to the initial size", "[core][config]") {
    HostConfig config;
    ConfigLoader loader(config);

    std::istringstream in("[memory]\nguest_heap_bytes = 1048576\nguest_heap_limit_bytes = 1024\n");
    loader.load_from_stream(in);

    REQUIRE(config.memory.guest_heap_limit_bytes == 1048576);
}

TEST_CASE("ConfigLoader reports a missing file", "[core][config]") {
    HostConfig config;
    ConfigLoader loader(config);

    std::string error;
    REQUIRE_FALSE(loader.load_from_file("/nonexistent/scripthost.ini", &error));
    REQUIRE_FALSE(error.empty());
    REQUIRE(config.host.ticks == HostConfig{}.host.ticks);
}
