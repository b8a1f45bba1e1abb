/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2024-Present The devdns Authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include "test_helper.hxx"

#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

TEST_CASE("unit: log levels from strings", "[unit]")
{
    using devdns::core::logger::level;
    using devdns::core::logger::level_from_str;

    CHECK(level_from_str("trace") == level::trace);
    CHECK(level_from_str("debug") == level::debug);
    CHECK(level_from_str("info") == level::info);
    CHECK(level_from_str("warning") == level::warn);
    CHECK(level_from_str("error") == level::err);
    CHECK(level_from_str("critical") == level::critical);
    CHECK(level_from_str("off") == level::off);
}

TEST_CASE("unit: file logger writes formatted messages", "[unit]")
{
    using Catch::Matchers::ContainsSubstring;

    std::random_device rd;
    auto path = std::filesystem::temp_directory_path() / ("devdns-log-" + std::to_string(rd()) + ".txt");

    devdns::core::logger::configuration configuration{};
    configuration.filename = path.string();
    configuration.console = false;
    configuration.log_level = devdns::core::logger::level::info;
    REQUIRE_FALSE(devdns::core::logger::create_file_logger(configuration).has_value());
    REQUIRE(devdns::core::logger::is_initialized());

    CHECK(devdns::core::logger::should_log(devdns::core::logger::level::warn));
    CHECK_FALSE(devdns::core::logger::should_log(devdns::core::logger::level::debug));

    DEVDNS_LOG_INFO("host and port already in use, host: {}, port: {}", "0.0.0.0", 53);
    DEVDNS_LOG_DEBUG("this message is filtered out: {}", 42);
    devdns::core::logger::flush();

    std::stringstream contents;
    {
        std::ifstream input(path);
        contents << input.rdbuf();
    }
    CHECK_THAT(contents.str(), ContainsSubstring("host and port already in use, host: 0.0.0.0, port: 53"));
    CHECK_THAT(contents.str(), !ContainsSubstring("filtered out"));

    devdns::core::logger::create_blackhole_logger();
    std::error_code ignore_ec;
    std::filesystem::remove(path, ignore_ec);
}
