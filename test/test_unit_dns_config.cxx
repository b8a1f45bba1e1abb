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

#include "core/io/dns_config.hxx"

#include <devdns/error_codes.hxx>

using devdns::core::io::dns::dns_config;

TEST_CASE("unit: nameserver without port", "[unit]")
{
    auto config = dns_config::parse("8.8.8.8");
    EXPECT_SUCCESS(config);
    CHECK(config->nameserver() == "8.8.8.8");
    CHECK(config->port() == 53);
    CHECK(config->timeout() == dns_config::default_timeout);
    CHECK(config->to_string() == "8.8.8.8:53");
}

TEST_CASE("unit: nameserver with port", "[unit]")
{
    auto config = dns_config::parse("1.1.1.1:5353", std::chrono::milliseconds{ 250 });
    EXPECT_SUCCESS(config);
    CHECK(config->nameserver() == "1.1.1.1");
    CHECK(config->port() == 5353);
    CHECK(config->timeout() == std::chrono::milliseconds{ 250 });
    CHECK(config->to_string() == "1.1.1.1:5353");
}

TEST_CASE("unit: IPv6 nameserver", "[unit]")
{
    SECTION("bare address")
    {
        auto config = dns_config::parse("::1");
        EXPECT_SUCCESS(config);
        CHECK(config->nameserver() == "::1");
        CHECK(config->port() == 53);
    }

    SECTION("bracketed with port")
    {
        auto config = dns_config::parse("[::1]:5300");
        EXPECT_SUCCESS(config);
        CHECK(config->nameserver() == "::1");
        CHECK(config->port() == 5300);
        CHECK(config->to_string() == "[::1]:5300");
    }
}

TEST_CASE("unit: invalid nameservers", "[unit]")
{
    for (const auto* input : { "", "dns.google", "8.8.8.8:", "8.8.8.8:0", "8.8.8.8:65536", "8.8.8.8:dns", "[::1", "[::1]53" }) {
        INFO(input);
        auto config = dns_config::parse(input);
        REQUIRE_FALSE(config);
        CHECK(config.error() == devdns::errc::common::invalid_argument);
    }
}
