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
#include "discovery_provider.hxx"
#include "discovery_snapshot.hxx"

#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace asio
{
class io_context;
} // namespace asio

namespace devdns::core::discovery
{
/**
 * Keeps a snapshot of the orchestrator's hostnames fresh in the background.
 *
 * The snapshot is replaced as a whole with a single atomic store, so a lookup sees either the
 * previous or the next snapshot. A failed refresh leaves the current snapshot in place.
 */
class discovery_source : public std::enable_shared_from_this<discovery_source>
{
public:
  discovery_source(asio::io_context& ctx,
                   std::shared_ptr<discovery_provider> provider,
                   std::chrono::milliseconds refresh_interval);

  /**
   * Performs the initial fetch, invokes on_ready once it is finished (successfully or not) and
   * then refreshes every refresh_interval until closed. on_ready is not invoked when the source
   * is closed before the initial fetch completes.
   */
  void start(utils::movable_function<void()>&& on_ready);

  /**
   * Lookup against the current snapshot.
   */
  [[nodiscard]] auto resolve(std::string_view hostname) const -> std::optional<std::string>;

  /**
   * @return current snapshot, or nullptr before the first successful refresh and after close
   */
  [[nodiscard]] auto snapshot() const -> std::shared_ptr<const discovery_snapshot>;

  /**
   * Cancels the refresh timer. Fetches still in flight complete, but their results are dropped.
   * Safe to call more than once.
   */
  void close();

  [[nodiscard]] auto is_closed() const -> bool
  {
    return closed_;
  }

  /**
   * Number of fetches that completed, successfully or not, since start.
   */
  [[nodiscard]] auto refresh_attempts() const -> std::uint64_t
  {
    return refresh_attempts_;
  }

private:
  void refresh(utils::movable_function<void()>&& on_complete);
  void schedule_refresh();

  std::shared_ptr<discovery_provider> provider_;
  std::chrono::milliseconds refresh_interval_;
  asio::steady_timer refresh_timer_;
  std::shared_ptr<const discovery_snapshot> snapshot_{};
  std::atomic_bool closed_{ false };
  std::atomic_uint64_t refresh_attempts_{ 0 };
};
} // namespace devdns::core::discovery
