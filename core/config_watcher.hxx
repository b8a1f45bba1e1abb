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

#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace asio
{
class io_context;
} // namespace asio

namespace devdns::core
{
enum class config_event {
  added,
  changed,
  removed,
};

auto
to_string(config_event event) -> std::string;

/**
 * Watches the configuration file by polling its status. The state found on start() is the
 * baseline and is not reported.
 */
class config_watcher : public std::enable_shared_from_this<config_watcher>
{
public:
  config_watcher(asio::io_context& ctx, std::filesystem::path path, std::chrono::milliseconds interval);

  void start(utils::movable_function<void(config_event)>&& handler);

  /**
   * Stops polling, no events are reported afterwards. Safe to call more than once.
   */
  void close();

  [[nodiscard]] auto is_closed() const -> bool
  {
    return closed_;
  }

  [[nodiscard]] auto path() const -> const std::filesystem::path&
  {
    return path_;
  }

private:
  struct file_status {
    std::filesystem::file_time_type last_write_time{};
    std::uintmax_t size{};

    auto operator==(const file_status& other) const -> bool
    {
      return last_write_time == other.last_write_time && size == other.size;
    }
  };

  [[nodiscard]] auto read_status() const -> std::optional<file_status>;
  void schedule_poll();
  void poll();

  std::filesystem::path path_;
  std::chrono::milliseconds interval_;
  asio::steady_timer poll_timer_;
  utils::movable_function<void(config_event)> handler_{};
  std::optional<file_status> last_status_{};
  bool closed_{ false };
};
} // namespace devdns::core
