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
#include "http_message.hxx"

#include <chrono>
#include <string>
#include <system_error>

namespace asio
{
class io_context;
} // namespace asio

namespace devdns::core::io
{
/**
 * Minimal HTTP/1.1 client for the Docker Engine API, reachable over its Unix domain socket.
 */
class docker_client
{
public:
  static constexpr auto default_socket_path = "/var/run/docker.sock";
  static constexpr std::chrono::milliseconds default_timeout{ 5'000 };

  docker_client(asio::io_context& ctx,
                std::string socket_path = default_socket_path,
                std::chrono::milliseconds timeout = default_timeout);

  /**
   * Sends the request with "Connection: close" and reads the response until the peer closes the
   * stream or the response is complete.
   *
   * Errors: errc::discovery::orchestrator_unavailable when the socket cannot be connected,
   * errc::common::unambiguous_timeout when the deadline is reached, errc::common::parsing_failure
   * when the response is not valid HTTP, errc::network::protocol_error when the stream ends before
   * the response is complete.
   */
  void execute(http_request request,
               utils::movable_function<void(std::error_code, http_response&&)>&& handler);

  [[nodiscard]] auto socket_path() const -> const std::string&
  {
    return socket_path_;
  }

private:
  asio::io_context& ctx_;
  std::string socket_path_;
  std::chrono::milliseconds timeout_;
};
} // namespace devdns::core::io
