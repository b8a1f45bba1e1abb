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

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace devdns::core
{
struct local_config {
  /**
   * hostname -> IPv4 address
   */
  std::map<std::string, std::string> records{};

  /**
   * Optional file in hosts(5) format. Inline records take precedence over its entries.
   */
  std::optional<std::string> hosts_file{};
};

/**
 * Static hostname table, built once and never refreshed.
 */
class local_table
{
public:
  explicit local_table(const local_config& config);

  /**
   * Case-insensitive exact match, a trailing dot on the hostname is ignored.
   */
  [[nodiscard]] auto resolve(std::string_view hostname) const -> std::optional<std::string>;

  [[nodiscard]] auto size() const -> std::size_t
  {
    return entries_.size();
  }

private:
  std::map<std::string, std::string, std::less<>> entries_{};
};

/**
 * Parses the contents of a hosts(5) file, keeping IPv4 entries only. When a name appears on
 * several lines, the first one wins.
 */
auto
parse_hosts_file(std::string_view contents) -> std::map<std::string, std::string, std::less<>>;
} // namespace devdns::core
