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

#include "server_handle.hxx"

#include "core/discovery/discovery_source.hxx"
#include "core/discovery/docker_discovery_provider.hxx"
#include "core/io/upstream_client.hxx"
#include "core/logger/logger.hxx"
#include "local_table.hxx"
#include "query_server.hxx"
#include "resolution_engine.hxx"

#include <asio/io_context.hpp>

namespace devdns::core
{
namespace
{
auto
make_upstream(asio::io_context& ctx,
              const std::optional<std::string>& address,
              std::chrono::milliseconds timeout,
              std::string_view role) -> std::shared_ptr<io::upstream>
{
  if (!address) {
    return nullptr;
  }
  auto config = io::dns::dns_config::parse(address.value(), timeout);
  if (!config) {
    DEVDNS_LOG_WARNING("ignoring {} DNS server \"{}\": {}", role, address.value(), config.error().message());
    return nullptr;
  }
  return std::make_shared<io::upstream_client>(ctx, std::move(config.value()));
}
} // namespace

server_handle::server_handle(asio::io_context& ctx, configuration config, server_collaborators collaborators)
  : ctx_{ ctx }
  , config_{ std::move(config) }
  , collaborators_{ std::move(collaborators) }
{
}

server_handle::~server_handle()
{
  close();
}

void
server_handle::start()
{
  auto local = std::make_shared<local_table>(config_.local);

  auto provider = collaborators_.discovery_provider;
  if (!provider && config_.docker.enable) {
    provider = std::make_shared<discovery::docker_discovery_provider>(
      ctx_,
      discovery::docker_discovery_options{ config_.docker.socket, config_.docker.address, config_.docker.timeout });
  }
  if (provider) {
    discovery_ = std::make_shared<discovery::discovery_source>(ctx_, provider, config_.docker.refresh);
  }

  auto primary = collaborators_.primary ? collaborators_.primary
                                        : make_upstream(ctx_, config_.dns.primary, config_.dns.timeout, "primary");
  auto secondary = collaborators_.secondary
                     ? collaborators_.secondary
                     : make_upstream(ctx_, config_.dns.secondary, config_.dns.timeout, "secondary");

  engine_ = std::make_shared<resolution_engine>(discovery_, local, std::move(primary), std::move(secondary));
  server_ = std::make_shared<query_server>(ctx_, engine_);
  try {
    server_->listen(config_.host, config_.port);
  } catch (const std::system_error&) {
    close();
    throw;
  }

  DEVDNS_LOG_INFO("DNS server listening on {}:{}, local entries: {}, discovery: {}",
                  config_.host,
                  port(),
                  local->size(),
                  discovery_ ? provider->endpoint() : std::string{ "disabled" });

  if (!discovery_) {
    return server_->start_receiving();
  }
  discovery_->start([server = server_]() {
    server->start_receiving();
  });
}

void
server_handle::close() noexcept
{
  if (closed_) {
    return;
  }
  closed_ = true;
  if (discovery_) {
    discovery_->close();
  }
  if (server_) {
    server_->close();
    DEVDNS_LOG_DEBUG("DNS server on {}:{} has been closed", config_.host, config_.port);
  }
}

auto
server_handle::port() const -> std::uint16_t
{
  if (!server_) {
    return 0;
  }
  return server_->local_endpoint().port();
}
} // namespace devdns::core
