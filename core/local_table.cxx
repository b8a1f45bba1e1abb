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
#include "local_table.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/hostname.hxx"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace devdns::core
{
namespace
{
auto
next_token(std::string_view& line) -> std::string_view
{
  auto begin = line.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos) {
    line = {};
    return {};
  }
  line.remove_prefix(begin);
  auto end = line.find_first_of(" \t\r");
  auto token = line.substr(0, end);
  line.remove_prefix(end == std::string_view::npos ? line.size() : end);
  return token;
}

auto
read_hosts_file(const std::string& path) -> std::optional<std::string>
{
  if (std::error_code ec{}; !std::filesystem::exists(path, ec) || ec) {
    return {};
  }
  std::ifstream input(path);
  if (!input.good()) {
    return {};
  }
  std::stringstream contents;
  contents << input.rdbuf();
  return contents.str();
}
} // namespace

auto
parse_hosts_file(std::string_view contents) -> std::map<std::string, std::string, std::less<>>
{
  std::map<std::string, std::string, std::less<>> entries{};
  while (!contents.empty()) {
    auto eol = contents.find('\n');
    auto line = contents.substr(0, eol);
    contents.remove_prefix(eol == std::string_view::npos ? contents.size() : eol + 1);

    if (auto comment = line.find('#'); comment != std::string_view::npos) {
      line = line.substr(0, comment);
    }
    auto address = next_token(line);
    if (address.empty() || !utils::is_ipv4_address(address)) {
      continue;
    }
    for (auto name = next_token(line); !name.empty(); name = next_token(line)) {
      entries.emplace(utils::normalize_hostname(name), std::string{ address });
    }
  }
  return entries;
}

local_table::local_table(const local_config& config)
{
  for (const auto& [name, address] : config.records) {
    if (!utils::is_ipv4_address(address)) {
      DEVDNS_LOG_WARNING("local record \"{}\" has invalid IPv4 address \"{}\", skipping", name, address);
      continue;
    }
    if (auto key = utils::normalize_hostname(name); !key.empty()) {
      entries_.insert_or_assign(std::move(key), address);
    }
  }

  if (config.hosts_file) {
    if (auto contents = read_hosts_file(config.hosts_file.value()); contents) {
      auto from_file = parse_hosts_file(contents.value());
      DEVDNS_LOG_DEBUG("loaded {} entries from hosts file \"{}\"", from_file.size(), config.hosts_file.value());
      // inline records win
      entries_.merge(from_file);
    } else {
      DEVDNS_LOG_WARNING("unable to read hosts file \"{}\", using inline records only",
                         config.hosts_file.value());
    }
  }
  DEVDNS_LOG_DEBUG("local table has {} entries", entries_.size());
}

auto
local_table::resolve(std::string_view hostname) const -> std::optional<std::string>
{
  if (auto it = entries_.find(utils::normalize_hostname(hostname)); it != entries_.end()) {
    return it->second;
  }
  return {};
}
} // namespace devdns::core
