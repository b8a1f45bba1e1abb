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

#include "query_server.hxx"

#include "core/io/dns_codec.hxx"
#include "core/logger/logger.hxx"
#include "resolution_engine.hxx"

#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>

#include <spdlog/fmt/bin_to_hex.h>

namespace devdns::core
{
query_server::query_server(asio::io_context& ctx, std::shared_ptr<resolution_engine> engine)
  : engine_{ std::move(engine) }
  , socket_{ ctx }
{
}

void
query_server::listen(const std::string& host, std::uint16_t port)
{
  const asio::ip::udp::endpoint endpoint(asio::ip::make_address(host), port);
  socket_.open(endpoint.protocol());
  try {
    socket_.bind(endpoint);
  } catch (const std::system_error&) {
    std::error_code ignore_ec;
    socket_.close(ignore_ec);
    throw;
  }
  DEVDNS_LOG_DEBUG("DNS server bound to {}:{}", host, local_endpoint().port());
}

auto
query_server::local_endpoint() const -> asio::ip::udp::endpoint
{
  std::error_code ec;
  auto endpoint = socket_.local_endpoint(ec);
  if (ec) {
    return {};
  }
  return endpoint;
}

void
query_server::start_receiving()
{
  if (closed_ || !socket_.is_open()) {
    return;
  }
  do_receive();
}

void
query_server::close() noexcept
{
  if (closed_.exchange(true)) {
    return;
  }
  std::error_code ignore_ec;
  socket_.close(ignore_ec);
}

void
query_server::do_receive()
{
  socket_.async_receive_from(
    asio::buffer(recv_buf_),
    requester_,
    [self = shared_from_this()](std::error_code ec, std::size_t bytes_received) {
      if (ec == asio::error::operation_aborted || self->closed_) {
        return;
      }
      if (ec) {
        DEVDNS_LOG_DEBUG("unable to receive DNS query: {}", ec.message());
        return self->do_receive();
      }
      std::vector<std::uint8_t> payload(self->recv_buf_.begin(),
                                        self->recv_buf_.begin() + static_cast<std::ptrdiff_t>(bytes_received));
      auto requester = self->requester_;
      self->do_receive();
      self->handle_query(std::move(payload), requester);
    });
}

void
query_server::handle_query(std::vector<std::uint8_t>&& payload,
                           const asio::ip::udp::endpoint& requester)
{
  DEVDNS_LOG_TRACE("[DNS, UDP, IN] requester=\"{}:{}\", bytes_received={}{:a}",
                   requester.address().to_string(),
                   requester.port(),
                   payload.size(),
                   spdlog::to_hex(payload));
  auto query = io::dns::dns_codec::decode(payload);
  if (!query) {
    DEVDNS_LOG_DEBUG("dropping undecodable DNS query from {}:{}: {}",
                     requester.address().to_string(),
                     requester.port(),
                     query.error().message());
    return;
  }
  if (query->questions.empty()) {
    return send(build_error_response(query.value(), io::dns::response_code::format_error), requester);
  }

  auto hostname = query->questions.front().name.to_string();
  engine_->resolve(
    hostname,
    [self = shared_from_this(), query = std::move(query.value()), requester](
      std::vector<resolution_answer>&& answers) {
      self->send(build_response(query, answers), requester);
    });
}

void
query_server::send(const io::dns::dns_message& response, const asio::ip::udp::endpoint& requester)
{
  if (closed_) {
    DEVDNS_LOG_TRACE("dropping DNS response for {}:{}, the server has been closed",
                     requester.address().to_string(),
                     requester.port());
    return;
  }
  auto payload = std::make_shared<std::vector<std::uint8_t>>(io::dns::dns_codec::encode(response));
  socket_.async_send_to(
    asio::buffer(*payload),
    requester,
    [payload, requester](std::error_code ec, std::size_t /* bytes_transferred */) {
      if (ec) {
        DEVDNS_LOG_DEBUG("unable to send DNS response to {}:{}: {}",
                         requester.address().to_string(),
                         requester.port(),
                         ec.message());
      }
    });
}

auto
query_server::build_response(const io::dns::dns_message& query,
                             const std::vector<resolution_answer>& answers) -> io::dns::dns_message
{
  auto response = build_error_response(query, io::dns::response_code::no_error);
  if (query.questions.empty()) {
    return response;
  }
  const auto& question = query.questions.front();
  for (const auto& answer : answers) {
    std::error_code ec;
    auto address = asio::ip::make_address_v4(answer.address, ec);
    if (ec) {
      DEVDNS_LOG_WARNING("skipping answer for \"{}\" with invalid address \"{}\"",
                         answer.name,
                         answer.address);
      continue;
    }
    io::dns::a_record record{};
    record.name = question.name;
    record.ttl = answer.ttl;
    record.address = address;
    response.answers.emplace_back(std::move(record));
  }
  if (io::dns::dns_codec::encoded_size(response) > max_udp_payload_size) {
    const auto total = response.answers.size();
    while (!response.answers.empty() && io::dns::dns_codec::encoded_size(response) > max_udp_payload_size) {
      response.answers.pop_back();
    }
    response.header.flags.tc = io::dns::truncation::yes;
    DEVDNS_LOG_DEBUG("truncated DNS response for \"{}\" to {} of {} answers",
                     question.name.to_string(),
                     response.answers.size(),
                     total);
  }
  return response;
}

auto
query_server::build_error_response(const io::dns::dns_message& query, io::dns::response_code rcode)
  -> io::dns::dns_message
{
  io::dns::dns_message response{};
  response.header.id = query.header.id;
  response.header.flags.qr = io::dns::message_type::response;
  response.header.flags.opcode = query.header.flags.opcode;
  response.header.flags.rd = query.header.flags.rd;
  response.header.flags.ra = io::dns::recursion_available::yes;
  response.header.flags.rcode = rcode;
  response.questions = query.questions;
  return response;
}
} // namespace devdns::core
