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

#include "core/io/dns_message.hxx"
#include "resolution_answer.hxx"

#include <asio/ip/udp.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace asio
{
class io_context;
} // namespace asio

namespace devdns::core
{
class resolution_engine;

/**
 * UDP front end. Every datagram is handled independently: receiving resumes as soon as a datagram
 * arrives, so responses may leave in a different order than the queries came in.
 */
class query_server : public std::enable_shared_from_this<query_server>
{
public:
  query_server(asio::io_context& ctx, std::shared_ptr<resolution_engine> engine);

  /**
   * Binds the socket. Throws std::system_error when the address is invalid or already in use.
   */
  void listen(const std::string& host, std::uint16_t port);

  void start_receiving();

  /**
   * Closes the socket. Resolutions in flight still complete, but their responses are dropped.
   */
  void close() noexcept;

  [[nodiscard]] auto is_open() const -> bool
  {
    return socket_.is_open();
  }

  [[nodiscard]] auto local_endpoint() const -> asio::ip::udp::endpoint;

  /**
   * Largest response sent over UDP, clients are not expected to support EDNS.
   */
  static constexpr std::size_t max_udp_payload_size{ 512 };

  /**
   * Builds the response to the query: id, opcode, RD bit and question are echoed, every answer
   * becomes an A/IN record of the first question's name. Answers that do not fit into
   * max_udp_payload_size are dropped and the TC bit is set.
   */
  static auto build_response(const io::dns::dns_message& query,
                             const std::vector<resolution_answer>& answers)
    -> io::dns::dns_message;

  /**
   * Response without answers carrying the given RCODE, e.g. FORMERR for a query without questions.
   */
  static auto build_error_response(const io::dns::dns_message& query,
                                   io::dns::response_code rcode) -> io::dns::dns_message;

private:
  void do_receive();
  void handle_query(std::vector<std::uint8_t>&& payload, const asio::ip::udp::endpoint& requester);
  void send(const io::dns::dns_message& response, const asio::ip::udp::endpoint& requester);

  std::shared_ptr<resolution_engine> engine_;
  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint requester_{};
  std::array<std::uint8_t, 65'535> recv_buf_{};
  std::atomic_bool closed_{ false };
};
} // namespace devdns::core
