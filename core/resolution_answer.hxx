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

#include <cstdint>
#include <string>

namespace devdns::core
{
/**
 * TTL advertised for every answer. None of the sources tracks real record lifetimes.
 */
constexpr std::uint32_t answer_ttl{ 300 };

struct resolution_answer {
  std::string name{};
  std::string address{};
  std::uint32_t ttl{ answer_ttl };

  auto operator==(const resolution_answer& other) const -> bool
  {
    return name == other.name && address == other.address && ttl == other.ttl;
  }
};
} // namespace devdns::core
