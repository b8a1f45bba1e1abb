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

#pragma once

#include "core/discovery/discovery_provider.hxx"
#include "core/io/upstream.hxx"

#include <devdns/error_codes.hxx>

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace test::utils
{
/**
 * Upstream nameserver that answers every query with the same result.
 */
class fake_upstream : public devdns::core::io::upstream
{
public:
    explicit fake_upstream(std::string address, std::vector<std::string> addresses = {}, std::error_code ec = {})
      : address_{ std::move(address) }
      , addresses_{ std::move(addresses) }
      , ec_{ ec }
    {
    }

    void resolve(const std::string& hostname,
                 devdns::core::utils::movable_function<void(devdns::core::io::upstream_result&&)>&& handler) override
    {
        queries.emplace_back(hostname);
        devdns::core::io::upstream_result result{};
        result.ec = ec_;
        for (const auto& address : addresses_) {
            result.answers.push_back({ hostname, address, devdns::core::answer_ttl });
        }
        handler(std::move(result));
    }

    [[nodiscard]] auto address() const -> std::string override
    {
        return address_;
    }

    std::vector<std::string> queries{};

private:
    std::string address_;
    std::vector<std::string> addresses_;
    std::error_code ec_;
};

/**
 * Orchestrator that returns whatever the test put into it. With hold enabled, the result of a
 * fetch is delivered only when release() is called.
 */
class fake_discovery_provider : public devdns::core::discovery::discovery_provider
{
public:
    using entries_type = devdns::core::discovery::discovery_snapshot::entries_type;

    void fetch(devdns::core::utils::movable_function<void(std::error_code, entries_type&&)>&& handler) override
    {
        ++fetches;
        if (hold) {
            pending_ = std::move(handler);
            return;
        }
        deliver(std::move(handler));
    }

    [[nodiscard]] auto endpoint() const -> std::string override
    {
        return "fake://orchestrator";
    }

    void release()
    {
        if (pending_) {
            auto handler = std::move(pending_);
            deliver(std::move(handler));
        }
    }

    [[nodiscard]] auto has_pending() const -> bool
    {
        return static_cast<bool>(pending_);
    }

    entries_type entries{};
    std::error_code ec{};
    bool hold{ false };
    std::size_t fetches{ 0 };

private:
    void deliver(devdns::core::utils::movable_function<void(std::error_code, entries_type&&)>&& handler)
    {
        if (ec) {
            return handler(ec, {});
        }
        auto copy = entries;
        handler({}, std::move(copy));
    }

    devdns::core::utils::movable_function<void(std::error_code, entries_type&&)> pending_{};
};
} // namespace test::utils
