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

#include "core/discovery/discovery_source.hxx"
#include "core/io/upstream.hxx"
#include "core/utils/movable_function.hxx"
#include "local_table.hxx"
#include "resolution_answer.hxx"

#include <memory>
#include <string>
#include <vector>

namespace devdns::core
{
/**
 * Answers a hostname from the first source that knows it, in fixed order:
 *
 *   1. discovery snapshot (if enabled)
 *   2. local table
 *   3. primary upstream nameserver (if configured)
 *   4. secondary upstream nameserver (if configured), only when the primary produced no answers
 *
 * Discovery and local entries shadow public DNS entirely.
 */
class resolution_engine : public std::enable_shared_from_this<resolution_engine>
{
public:
  resolution_engine(std::shared_ptr<discovery::discovery_source> discovery,
                    std::shared_ptr<local_table> local,
                    std::shared_ptr<io::upstream> primary,
                    std::shared_ptr<io::upstream> secondary);

  /**
   * The handler is invoked exactly once. An empty list means that no source knows the hostname.
   */
  void resolve(const std::string& hostname,
               utils::movable_function<void(std::vector<resolution_answer>&&)>&& handler);

private:
  void resolve_with_secondary(const std::string& hostname,
                              utils::movable_function<void(std::vector<resolution_answer>&&)>&& handler);

  std::shared_ptr<discovery::discovery_source> discovery_;
  std::shared_ptr<local_table> local_;
  std::shared_ptr<io::upstream> primary_;
  std::shared_ptr<io::upstream> secondary_;
};
} // namespace devdns::core
