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

#include "core/io/docker_client.hxx"
#include "discovery_provider.hxx"

#include <tao/json/forward.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace devdns::core::discovery
{
struct docker_discovery_options {
  std::string socket_path{ io::docker_client::default_socket_path };

  /**
   * Address that every discovered hostname resolves to, typically the address the reverse proxy
   * listens on. When empty, the address of the container itself is used.
   */
  std::optional<std::string> address{};

  std::chrono::milliseconds timeout{ io::docker_client::default_timeout };
};

/**
 * Builds the mapping from the Traefik router rules found in the labels of running Docker
 * containers.
 */
class docker_discovery_provider : public discovery_provider
{
public:
  docker_discovery_provider(asio::io_context& ctx, docker_discovery_options options);

  void fetch(utils::movable_function<void(std::error_code, discovery_snapshot::entries_type&&)>&&
               handler) override;

  [[nodiscard]] auto endpoint() const -> std::string override;

  /**
   * Converts the response of GET /containers/json into hostname to address entries.
   *
   * @return errc::discovery::malformed_payload if the document is not an array of container
   * objects
   */
  static auto entries_from_containers(const tao::json::value& containers,
                                      const std::optional<std::string>& address)
    -> tl::expected<discovery_snapshot::entries_type, std::error_code>;

private:
  io::docker_client client_;
  docker_discovery_options options_;
};
} // namespace devdns::core::discovery
