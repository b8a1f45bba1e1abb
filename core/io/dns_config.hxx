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

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace devdns::core::io::dns
{
/**
 * Address of one upstream recursive nameserver.
 */
class dns_config
{
public:
  static constexpr std::uint16_t default_port = 53;
  static constexpr std::chrono::milliseconds default_timeout{ 5'000 };

  dns_config() = default;

  dns_config(std::string nameserver,
             std::uint16_t port,
             std::chrono::milliseconds timeout = default_timeout)
    : nameserver_{ std::move(nameserver) }
    , port_{ port }
    , timeout_{ timeout }
  {
  }

  /**
   * Parses "address" or "address:port" where address is an IPv4 address, or "[address]:port" for
   * IPv6.
   *
   * @return errc::common::invalid_argument if the address is not an IP address or the port is not
   * a number in 1..65535
   */
  static auto parse(std::string_view input,
                    std::chrono::milliseconds timeout = default_timeout)
    -> tl::expected<dns_config, std::error_code>;

  [[nodiscard]] auto port() const -> std::uint16_t
  {
    return port_;
  }

  [[nodiscard]] auto nameserver() const -> const std::string&
  {
    return nameserver_;
  }

  [[nodiscard]] auto timeout() const -> std::chrono::milliseconds
  {
    return timeout_;
  }

  /**
   * "nameserver:port", used in log messages
   */
  [[nodiscard]] auto to_string() const -> std::string;

private:
  std::string nameserver_{};
  std::uint16_t port_{ default_port };
  std::chrono::milliseconds timeout_{ default_timeout };
};
} // namespace devdns::core::io::dns
