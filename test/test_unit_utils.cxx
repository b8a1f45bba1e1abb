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

#include "core/utils/hostname.hxx"
#include "core/utils/json.hxx"
#include "core/utils/movable_function.hxx"

#include <devdns/error_codes.hxx>

#include <tao/json.hpp>

#include <memory>
#include <sstream>

TEST_CASE("unit: transformer to deduplicate JSON keys", "[unit]")
{
    using Catch::Matchers::ContainsSubstring;

    std::string input{ R"({"port":"wrong","port":5353})" };

    CHECK_THROWS_WITH(tao::json::from_string(input), ContainsSubstring("duplicate JSON object key \"port\""));

    auto result = devdns::core::utils::json::parse(input);
    INFO(devdns::core::utils::json::generate(result));
    CHECK(result.is_object());
    CHECK(result.find("port") != nullptr);
    CHECK(result["port"].is_integer());
    CHECK(result["port"].as<std::int64_t>() == 5353);
}

TEST_CASE("unit: string representation of the error codes", "[unit]")
{
    std::error_code rc = devdns::errc::network::upstream_failure;
    CHECK(rc.category().name() == std::string("devdns.network"));
    CHECK(rc.value() == 1002);
    std::stringstream ss;
    ss << rc;
    CHECK(ss.str() == "devdns.network:1002");

    CHECK(std::error_code(devdns::errc::common::unambiguous_timeout).message() == "unambiguous_timeout (14)");
    CHECK(std::error_code(devdns::errc::discovery::orchestrator_unavailable).category().name() ==
          std::string("devdns.discovery"));
    CHECK(std::error_code(devdns::errc::configuration::invalid_json).category().name() ==
          std::string("devdns.configuration"));
}

TEST_CASE("unit: hostname normalization", "[unit]")
{
    using devdns::core::utils::normalize_hostname;

    CHECK(normalize_hostname("API.Dev.Local") == "api.dev.local");
    CHECK(normalize_hostname("api.dev.local.") == "api.dev.local");
    CHECK(normalize_hostname("  api.dev.local \t") == "api.dev.local");
    CHECK(normalize_hostname("") == "");
    CHECK(normalize_hostname(".") == "");
}

TEST_CASE("unit: IPv4 address detection", "[unit]")
{
    using devdns::core::utils::is_ipv4_address;

    CHECK(is_ipv4_address("127.0.0.1"));
    CHECK(is_ipv4_address("172.17.0.2"));
    CHECK_FALSE(is_ipv4_address(""));
    CHECK_FALSE(is_ipv4_address("::1"));
    CHECK_FALSE(is_ipv4_address("256.0.0.1"));
    CHECK_FALSE(is_ipv4_address("db.local"));
}

TEST_CASE("unit: movable function accepts move-only callables", "[unit]")
{
    auto value = std::make_unique<int>(42);
    devdns::core::utils::movable_function<int()> fn = [value = std::move(value)]() {
        return *value;
    };
    REQUIRE(fn);
    CHECK(fn() == 42);

    auto other = std::move(fn);
    CHECK_FALSE(fn);
    CHECK(other() == 42);
}
