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
#include "discovery_source.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/hostname.hxx"

#include <asio/io_context.hpp>

#include <fmt/chrono.h>

namespace devdns::core::discovery
{
discovery_source::discovery_source(asio::io_context& ctx,
                                   std::shared_ptr<discovery_provider> provider,
                                   std::chrono::milliseconds refresh_interval)
  : provider_{ std::move(provider) }
  , refresh_interval_{ refresh_interval }
  , refresh_timer_{ ctx }
{
}

void
discovery_source::start(utils::movable_function<void()>&& on_ready)
{
  DEVDNS_LOG_DEBUG("starting discovery from {}, refresh_interval={}",
                   provider_->endpoint(),
                   refresh_interval_);
  refresh([self = shared_from_this(), on_ready = std::move(on_ready)]() mutable {
    if (self->closed_) {
      return;
    }
    self->schedule_refresh();
    on_ready();
  });
}

auto
discovery_source::snapshot() const -> std::shared_ptr<const discovery_snapshot>
{
  return std::atomic_load(&snapshot_);
}

auto
discovery_source::resolve(std::string_view hostname) const -> std::optional<std::string>
{
  if (auto current = snapshot(); current) {
    return current->find(utils::normalize_hostname(hostname));
  }
  return {};
}

void
discovery_source::close()
{
  if (closed_.exchange(true)) {
    return;
  }
  DEVDNS_LOG_DEBUG("closing discovery from {}", provider_->endpoint());
  refresh_timer_.cancel();
  std::atomic_store(&snapshot_, std::shared_ptr<const discovery_snapshot>{});
}

void
discovery_source::schedule_refresh()
{
  refresh_timer_.expires_after(refresh_interval_);
  refresh_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted || self->closed_) {
      return;
    }
    self->refresh([self]() {
      if (!self->closed_) {
        self->schedule_refresh();
      }
    });
  });
}

void
discovery_source::refresh(utils::movable_function<void()>&& on_complete)
{
  provider_->fetch([self = shared_from_this(), on_complete = std::move(on_complete)](
                     std::error_code ec, discovery_snapshot::entries_type&& entries) mutable {
    ++self->refresh_attempts_;
    if (self->closed_) {
      DEVDNS_LOG_TRACE("discarding discovery result from {}, the source has been closed",
                       self->provider_->endpoint());
      return on_complete();
    }
    if (ec) {
      auto current = self->snapshot();
      DEVDNS_LOG_WARNING("unable to refresh discovery from {}: {}, keeping {} known hostname(s)",
                         self->provider_->endpoint(),
                         ec.message(),
                         current ? current->entries.size() : 0);
      return on_complete();
    }

    auto next = std::make_shared<discovery_snapshot>();
    next->entries = std::move(entries);
    next->refreshed_at = std::chrono::system_clock::now();
    DEVDNS_LOG_DEBUG("discovery refreshed from {}, {} hostname(s)",
                     self->provider_->endpoint(),
                     next->entries.size());
    std::atomic_store(&self->snapshot_, std::shared_ptr<const discovery_snapshot>{ std::move(next) });
    return on_complete();
  });
}
} // namespace devdns::core::discovery
