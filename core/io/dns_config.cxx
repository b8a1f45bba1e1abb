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
#include "dns_config.hxx"

#include <devdns/error_codes.hxx>

#include <asio/ip/address.hpp>
#include <fmt/core.h>

#include <charconv>

namespace devdns::core::io::dns
{
namespace
{
auto
parse_port(std::string_view input) -> tl::expected<std::uint16_t, std::error_code>
{
  std::uint32_t port = 0;
  const auto* end = input.data() + input.size();
  if (auto [ptr, ec] = std::from_chars(input.data(), end, port);
      ec != std::errc{} || ptr != end || port == 0 || port > 65535) {
    return tl::unexpected(errc::common::invalid_argument);
  }
  return static_cast<std::uint16_t>(port);
}
} // namespace

auto
dns_config::parse(std::string_view input, std::chrono::milliseconds timeout)
  -> tl::expected<dns_config, std::error_code>
{
  std::string_view host = input;
  std::uint16_t port = default_port;

  if (!input.empty() && input.front() == '[') {
    auto close = input.find(']');
    if (close == std::string_view::npos) {
      return tl::unexpected(errc::common::invalid_argument);
    }
    host = input.substr(1, close - 1);
    if (auto rest = input.substr(close + 1); !rest.empty()) {
      if (rest.front() != ':') {
        return tl::unexpected(errc::common::invalid_argument);
      }
      auto parsed = parse_port(rest.substr(1));
      if (!parsed) {
        return tl::unexpected(parsed.error());
      }
      port = parsed.value();
    }
  } else if (auto colon = input.find(':');
             colon != std::string_view::npos && input.find(':', colon + 1) == std::string_view::npos) {
    host = input.substr(0, colon);
    auto parsed = parse_port(input.substr(colon + 1));
    if (!parsed) {
      return tl::unexpected(parsed.error());
    }
    port = parsed.value();
  }

  std::error_code ec;
  auto address = asio::ip::make_address(std::string{ host }, ec);
  if (ec) {
    return tl::unexpected(errc::common::invalid_argument);
  }
  return dns_config{ address.to_string(), port, timeout };
}

auto
dns_config::to_string() const -> std::string
{
  if (nameserver_.find(':') != std::string::npos) {
    return fmt::format("[{}]:{}", nameserver_, port_);
  }
  return fmt::format("{}:{}", nameserver_, port_);
}
} // namespace devdns::core::io::dns
