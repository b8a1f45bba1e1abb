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

#include "config_watcher.hxx"
#include "configuration.hxx"
#include "core/utils/movable_function.hxx"
#include "server_handle.hxx"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace asio
{
class io_context;
} // namespace asio

namespace devdns::core
{
enum class lifecycle_state {
  stopped,
  running,
  stopping,
};

auto
to_string(lifecycle_state state) -> std::string;

/**
 * Owns at most one running server and replaces it as a whole whenever the configuration changes.
 * The previous server is always closed before the next one binds, so a reload may reuse the same
 * host and port.
 */
class lifecycle_manager
{
public:
  explicit lifecycle_manager(asio::io_context& ctx, server_collaborators collaborators = {});
  lifecycle_manager(const lifecycle_manager&) = delete;
  lifecycle_manager& operator=(const lifecycle_manager&) = delete;
  ~lifecycle_manager();

  /**
   * Builds and starts a server for the configuration. A running server is closed first.
   *
   * Throws std::system_error when the socket cannot be bound, the manager is stopped in that case.
   */
  void start(const configuration& config);

  /**
   * Closes the running server (if any) and starts a new one for the configuration.
   */
  void reload(const configuration& config);

  /**
   * Closes the running server. Does nothing when already stopped.
   */
  void stop() noexcept;

  /**
   * Reacts to a change of the configuration file: starts on add, reloads on change (stops when
   * the new contents are invalid) and stops on removal. A bind failure is reported through the
   * fatal handler.
   */
  void on_config_event(config_event event, const std::filesystem::path& path);

  /**
   * Invoked with the bind error of a start triggered by a configuration file event.
   */
  void on_fatal(utils::movable_function<void(const std::system_error&, const configuration&)>&& handler)
  {
    fatal_handler_ = std::move(handler);
  }

  [[nodiscard]] auto state() const -> lifecycle_state
  {
    return state_;
  }

  /**
   * Port of the running server, or zero when stopped.
   */
  [[nodiscard]] auto port() const -> std::uint16_t;

  [[nodiscard]] auto handle() const -> const server_handle*
  {
    return handle_.get();
  }

private:
  asio::io_context& ctx_;
  server_collaborators collaborators_;
  std::unique_ptr<server_handle> handle_{};
  lifecycle_state state_{ lifecycle_state::stopped };
  utils::movable_function<void(const std::system_error&, const configuration&)> fatal_handler_{};
};
} // namespace devdns::core
