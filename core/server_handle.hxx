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

#include "configuration.hxx"

#include <cstdint>
#include <memory>

namespace asio
{
class io_context;
} // namespace asio

namespace devdns::core
{
namespace discovery
{
class discovery_provider;
class discovery_source;
} // namespace discovery

namespace io
{
class upstream;
} // namespace io

class local_table;
class query_server;
class resolution_engine;

/**
 * Replacements for the collaborators that server_handle builds from the configuration.
 */
struct server_collaborators {
  /**
   * Used instead of the Docker provider, discovery is enabled whenever it is set.
   */
  std::shared_ptr<discovery::discovery_provider> discovery_provider{};
  std::shared_ptr<io::upstream> primary{};
  std::shared_ptr<io::upstream> secondary{};
};

/**
 * One running server instance built from one configuration: the bound UDP socket together with
 * the resolution sources that feed it.
 */
class server_handle
{
public:
  server_handle(asio::io_context& ctx, configuration config, server_collaborators collaborators = {});
  server_handle(const server_handle&) = delete;
  server_handle& operator=(const server_handle&) = delete;
  ~server_handle();

  /**
   * Builds the sources and binds the socket. Queries are served once the initial discovery
   * fetch has finished.
   *
   * Throws std::system_error when the socket cannot be bound.
   */
  void start();

  /**
   * Stops discovery refresh and closes the socket. Safe to call more than once.
   */
  void close() noexcept;

  [[nodiscard]] auto is_closed() const -> bool
  {
    return closed_;
  }

  /**
   * Port the socket is bound to, useful when the configuration asks for an ephemeral port.
   */
  [[nodiscard]] auto port() const -> std::uint16_t;

  [[nodiscard]] auto config() const -> const configuration&
  {
    return config_;
  }

  [[nodiscard]] auto discovery() const -> std::shared_ptr<discovery::discovery_source>
  {
    return discovery_;
  }

private:
  asio::io_context& ctx_;
  configuration config_;
  server_collaborators collaborators_;
  std::shared_ptr<discovery::discovery_source> discovery_{};
  std::shared_ptr<resolution_engine> engine_{};
  std::shared_ptr<query_server> server_{};
  bool closed_{ false };
};
} // namespace devdns::core
