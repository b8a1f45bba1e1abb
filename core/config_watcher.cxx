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

#include "config_watcher.hxx"

#include "core/logger/logger.hxx"

#include <asio/io_context.hpp>

#include <fmt/chrono.h>

namespace devdns::core
{
auto
to_string(config_event event) -> std::string
{
  switch (event) {
    case config_event::added:
      return "added";
    case config_event::changed:
      return "changed";
    case config_event::removed:
      return "removed";
  }
  return "unknown";
}

config_watcher::config_watcher(asio::io_context& ctx,
                               std::filesystem::path path,
                               std::chrono::milliseconds interval)
  : path_{ std::move(path) }
  , interval_{ interval }
  , poll_timer_{ ctx }
{
}

void
config_watcher::start(utils::movable_function<void(config_event)>&& handler)
{
  handler_ = std::move(handler);
  last_status_ = read_status();
  DEVDNS_LOG_DEBUG("watching config file {}, interval={}, exists={}",
                   path_.string(),
                   interval_,
                   last_status_.has_value());
  schedule_poll();
}

void
config_watcher::close()
{
  if (closed_) {
    return;
  }
  closed_ = true;
  poll_timer_.cancel();
  handler_ = nullptr;
}

auto
config_watcher::read_status() const -> std::optional<file_status>
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec) || ec) {
    return {};
  }
  file_status status{};
  status.last_write_time = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    return {};
  }
  status.size = std::filesystem::file_size(path_, ec);
  if (ec) {
    return {};
  }
  return status;
}

void
config_watcher::schedule_poll()
{
  poll_timer_.expires_after(interval_);
  poll_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted || self->closed_) {
      return;
    }
    self->poll();
  });
}

void
config_watcher::poll()
{
  auto current = read_status();
  std::optional<config_event> event{};
  if (current && !last_status_) {
    event = config_event::added;
  } else if (!current && last_status_) {
    event = config_event::removed;
  } else if (current && last_status_ && !(current.value() == last_status_.value())) {
    event = config_event::changed;
  }
  last_status_ = current;

  if (event) {
    DEVDNS_LOG_DEBUG("config file {} has been {}", path_.string(), to_string(event.value()));
    if (handler_) {
      auto handler = std::move(handler_);
      handler(event.value());
      if (!closed_) {
        handler_ = std::move(handler);
      }
    }
  }
  if (!closed_) {
    schedule_poll();
  }
}
} // namespace devdns::core
