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
#include "utils/fakes.hxx"

#include "core/discovery/discovery_source.hxx"
#include "core/local_table.hxx"
#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"
#include "core/resolution_engine.hxx"

#include <devdns/error_codes.hxx>

#include <catch2/matchers/catch_matchers_string.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using devdns::core::resolution_answer;
using devdns::core::resolution_engine;
using test::utils::fake_discovery_provider;
using test::utils::fake_upstream;

namespace
{
auto
resolve(resolution_engine& engine, const std::string& hostname) -> std::vector<resolution_answer>
{
    std::optional<std::vector<resolution_answer>> answers{};
    engine.resolve(hostname, [&answers](std::vector<resolution_answer>&& result) {
        answers = std::move(result);
    });
    REQUIRE(answers.has_value());
    return answers.value();
}

auto
make_local_table() -> std::shared_ptr<devdns::core::local_table>
{
    devdns::core::local_config config{};
    config.records = { { "db.local", "127.0.0.1" }, { "shared.dev.local", "127.0.0.2" } };
    return std::make_shared<devdns::core::local_table>(config);
}

auto
make_discovery(asio::io_context& ctx) -> std::shared_ptr<devdns::core::discovery::discovery_source>
{
    auto provider = std::make_shared<fake_discovery_provider>();
    provider->entries = { { "api.dev.local", "172.17.0.2" }, { "shared.dev.local", "172.17.0.9" } };
    auto source = std::make_shared<devdns::core::discovery::discovery_source>(ctx, provider, std::chrono::minutes{ 1 });
    bool ready = false;
    source->start([&ready]() { ready = true; });
    REQUIRE(ready);
    return source;
}
} // namespace

TEST_CASE("unit: discovery entries win over every other source", "[unit]")
{
    test::utils::init_logger();

    asio::io_context ctx;
    auto primary = std::make_shared<fake_upstream>("8.8.8.8:53", std::vector<std::string>{ "93.184.216.34" });
    auto engine = std::make_shared<resolution_engine>(make_discovery(ctx), make_local_table(), primary, nullptr);

    auto answers = resolve(*engine, "shared.dev.local");
    REQUIRE(answers.size() == 1);
    CHECK(answers[0].name == "shared.dev.local");
    CHECK(answers[0].address == "172.17.0.9");
    CHECK(answers[0].ttl == 300);

    answers = resolve(*engine, "API.dev.local.");
    REQUIRE(answers.size() == 1);
    CHECK(answers[0].address == "172.17.0.2");
    CHECK(primary->queries.empty());
}

TEST_CASE("unit: local entries shadow upstream servers", "[unit]")
{
    test::utils::init_logger();

    auto primary = std::make_shared<fake_upstream>("8.8.8.8:53", std::vector<std::string>{ "93.184.216.34" });
    auto secondary = std::make_shared<fake_upstream>("1.1.1.1:53", std::vector<std::string>{ "93.184.216.35" });
    auto engine = std::make_shared<resolution_engine>(nullptr, make_local_table(), primary, secondary);

    auto answers = resolve(*engine, "db.local");
    REQUIRE(answers.size() == 1);
    CHECK(answers[0] == resolution_answer{ "db.local", "127.0.0.1", 300 });
    CHECK(primary->queries.empty());
    CHECK(secondary->queries.empty());
}

TEST_CASE("unit: primary answers are returned as is", "[unit]")
{
    test::utils::init_logger();

    auto primary = std::make_shared<fake_upstream>("8.8.8.8:53", std::vector<std::string>{ "140.82.112.3", "140.82.112.4" });
    auto secondary = std::make_shared<fake_upstream>("1.1.1.1:53", std::vector<std::string>{ "93.184.216.35" });
    auto engine = std::make_shared<resolution_engine>(nullptr, make_local_table(), primary, secondary);

    auto answers = resolve(*engine, "github.com");
    REQUIRE(answers.size() == 2);
    CHECK(answers[0].address == "140.82.112.3");
    CHECK(answers[1].address == "140.82.112.4");
    CHECK(primary->queries == std::vector<std::string>{ "github.com" });
    CHECK(secondary->queries.empty());
}

TEST_CASE("unit: secondary is asked when primary has no answers", "[unit]")
{
    test::utils::init_logger();

    auto secondary = std::make_shared<fake_upstream>("1.1.1.1:53", std::vector<std::string>{ "93.184.216.35" });

    SECTION("primary failed")
    {
        auto primary = std::make_shared<fake_upstream>(
          "8.8.8.8:53", std::vector<std::string>{}, devdns::errc::common::unambiguous_timeout);
        auto engine = std::make_shared<resolution_engine>(nullptr, make_local_table(), primary, secondary);
        auto answers = resolve(*engine, "example.com");
        REQUIRE(answers.size() == 1);
        CHECK(answers[0].address == "93.184.216.35");
        CHECK(primary->queries.size() == 1);
    }

    SECTION("primary returned empty answer")
    {
        auto primary = std::make_shared<fake_upstream>("8.8.8.8:53");
        auto engine = std::make_shared<resolution_engine>(nullptr, make_local_table(), primary, secondary);
        auto answers = resolve(*engine, "example.com");
        REQUIRE(answers.size() == 1);
        CHECK(answers[0].address == "93.184.216.35");
    }

    SECTION("no primary configured")
    {
        auto engine = std::make_shared<resolution_engine>(nullptr, make_local_table(), nullptr, secondary);
        auto answers = resolve(*engine, "example.com");
        REQUIRE(answers.size() == 1);
    }

    CHECK(secondary->queries == std::vector<std::string>{ "example.com" });
}

TEST_CASE("unit: no source knows the hostname", "[unit]")
{
    test::utils::init_logger();

    SECTION("no upstream servers")
    {
        auto engine = std::make_shared<resolution_engine>(nullptr, make_local_table(), nullptr, nullptr);
        CHECK(resolve(*engine, "unknown.local").empty());
    }

    SECTION("both upstream servers fail")
    {
        auto primary = std::make_shared<fake_upstream>(
          "8.8.8.8:53", std::vector<std::string>{}, devdns::errc::network::upstream_failure);
        auto secondary = std::make_shared<fake_upstream>(
          "1.1.1.1:53", std::vector<std::string>{}, devdns::errc::common::unambiguous_timeout);
        auto engine = std::make_shared<resolution_engine>(nullptr, make_local_table(), primary, secondary);
        CHECK(resolve(*engine, "unknown.local").empty());
        CHECK(primary->queries.size() == 1);
        CHECK(secondary->queries.size() == 1);
    }
}

TEST_CASE("unit: failed secondary lookup is not logged as resolved", "[unit]")
{
    using Catch::Matchers::ContainsSubstring;

    auto captured = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
    devdns::core::logger::configuration configuration{};
    configuration.console = false;
    configuration.log_level = devdns::core::logger::level::debug;
    configuration.sink = captured;
    REQUIRE_FALSE(devdns::core::logger::create_file_logger(configuration).has_value());

    auto primary = std::make_shared<fake_upstream>("8.8.8.8:53");
    auto secondary = std::make_shared<fake_upstream>(
      "1.1.1.1:53", std::vector<std::string>{}, devdns::errc::common::unambiguous_timeout);
    auto engine = std::make_shared<resolution_engine>(nullptr, nullptr, primary, secondary);
    CHECK(resolve(*engine, "unknown.local").empty());
    devdns::core::logger::flush();

    std::string messages{};
    for (const auto& line : captured->last_formatted()) {
        messages += line;
    }
    CHECK_THAT(messages, ContainsSubstring("error secondary dns response: 1.1.1.1:53"));
    CHECK_THAT(messages, ContainsSubstring("no source has answers for \"unknown.local\""));
    CHECK_THAT(messages, !ContainsSubstring("from secondary upstream"));

    devdns::core::logger::create_blackhole_logger();
}
