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

#include "core/resolution_answer.hxx"
#include "core/utils/movable_function.hxx"

#include <string>
#include <system_error>
#include <vector>

namespace devdns::core::io
{
/**
 * Outcome of asking one upstream nameserver. The error belongs to this provider only and never
 * aborts the resolution of the query.
 */
struct upstream_result {
  std::error_code ec{};
  std::vector<resolution_answer> answers{};
};

class upstream
{
public:
  virtual ~upstream() = default;

  /**
   * Asks the nameserver for the A records of the hostname. The handler is always invoked exactly
   * once, errors are reported through upstream_result::ec.
   */
  virtual void resolve(const std::string& hostname,
                       utils::movable_function<void(upstream_result&&)>&& handler) = 0;

  /**
   * Human readable address of the nameserver
   */
  [[nodiscard]] virtual auto address() const -> std::string = 0;
};
} // namespace devdns::core::io
