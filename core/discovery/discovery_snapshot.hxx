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

#include <chrono>
#include <map>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace devdns::core::discovery
{
/**
 * Hostname to IPv4 mapping built from one successful orchestrator query. Published as
 * shared_ptr<const discovery_snapshot> and never modified afterwards.
 */
struct discovery_snapshot {
  using entries_type = std::map<std::string, std::string, std::less<>>;

  entries_type entries{};
  std::chrono::system_clock::time_point refreshed_at{};

  /**
   * @param hostname normalized hostname
   */
  [[nodiscard]] auto find(std::string_view hostname) const -> std::optional<std::string>
  {
    if (auto it = entries.find(hostname); it != entries.end()) {
      return it->second;
    }
    return {};
  }
};
} // namespace devdns::core::discovery
