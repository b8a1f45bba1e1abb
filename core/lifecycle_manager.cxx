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

#include "lifecycle_manager.hxx"

#include "core/logger/logger.hxx"

#include <asio/io_context.hpp>

namespace devdns::core
{
auto
to_string(lifecycle_state state) -> std::string
{
  switch (state) {
    case lifecycle_state::stopped:
      return "stopped";
    case lifecycle_state::running:
      return "running";
    case lifecycle_state::stopping:
      return "stopping";
  }
  return "unknown";
}

lifecycle_manager::lifecycle_manager(asio::io_context& ctx, server_collaborators collaborators)
  : ctx_{ ctx }
  , collaborators_{ std::move(collaborators) }
{
}

lifecycle_manager::~lifecycle_manager()
{
  stop();
}

void
lifecycle_manager::start(const configuration& config)
{
  stop();

  DEVDNS_LOG_DEBUG("starting DNS server, config={}", to_string(config));
  auto handle = std::make_unique<server_handle>(ctx_, config, collaborators_);
  handle->start();
  handle_ = std::move(handle);
  state_ = lifecycle_state::running;
}

void
lifecycle_manager::reload(const configuration& config)
{
  DEVDNS_LOG_INFO("reloading DNS server");
  start(config);
}

void
lifecycle_manager::stop() noexcept
{
  if (state_ != lifecycle_state::running || !handle_) {
    return;
  }
  state_ = lifecycle_state::stopping;
  handle_->close();
  handle_.reset();
  state_ = lifecycle_state::stopped;
}

void
lifecycle_manager::on_config_event(config_event event, const std::filesystem::path& path)
{
  switch (event) {
    case config_event::added:
      DEVDNS_LOG_INFO("detect config file add, server start...");
      break;
    case config_event::changed:
      DEVDNS_LOG_INFO("detect config file change, server restart...");
      break;
    case config_event::removed:
      DEVDNS_LOG_INFO("detect config file removed, server close...");
      return stop();
  }

  stop();
  auto config = load_configuration(path);
  if (!config) {
    return;
  }
  try {
    start(config.value());
  } catch (const std::system_error& e) {
    if (fatal_handler_) {
      return fatal_handler_(e, config.value());
    }
    DEVDNS_LOG_ERROR("unable to start DNS server on {}:{}: {}", config->host, config->port, e.what());
  }
}

auto
lifecycle_manager::port() const -> std::uint16_t
{
  if (!handle_) {
    return 0;
  }
  return handle_->port();
}
} // namespace devdns::core
