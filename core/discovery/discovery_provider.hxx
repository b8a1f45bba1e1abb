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

#include "core/utils/movable_function.hxx"
#include "discovery_snapshot.hxx"

#include <string>
#include <system_error>

namespace devdns::core::discovery
{
/**
 * Source of the hostname to address mapping of the running services.
 */
class discovery_provider
{
public:
  virtual ~discovery_provider() = default;

  /**
   * Queries the orchestrator for all known hostnames. The handler is invoked exactly once, with
   * the complete mapping on success, or with an error and an empty mapping.
   */
  virtual void fetch(
    utils::movable_function<void(std::error_code, discovery_snapshot::entries_type&&)>&& handler) = 0;

  /**
   * Human readable description of the orchestrator endpoint, used in log messages
   */
  [[nodiscard]] virtual auto endpoint() const -> std::string = 0;
};
} // namespace devdns::core::discovery
