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
#include "upstream_client.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/byteswap.hxx"
#include "dns_codec.hxx"

#include <devdns/error_codes.hxx>

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>

#include <fmt/chrono.h>
#include <spdlog/fmt/bin_to_hex.h>

#include <memory>
#include <random>

namespace devdns::core::io
{
namespace
{
auto
next_query_id() -> std::uint16_t
{
  thread_local std::mt19937 gen{ std::random_device{}() };
  std::uniform_int_distribution<std::uint32_t> dist(0, 0xffffU);
  return static_cast<std::uint16_t>(dist(gen));
}

class dns_a_command : public std::enable_shared_from_this<dns_a_command>
{
public:
  dns_a_command(asio::io_context& ctx,
                std::string hostname,
                const asio::ip::address& address,
                std::uint16_t port,
                utils::movable_function<void(upstream_result&&)> handler)
    : deadline_(ctx)
    , tcp_(ctx)
    , hostname_(std::move(hostname))
    , address_(address)
    , port_(port)
    , handler_(std::move(handler))
  {
    dns::dns_message request{};
    request.header.id = next_query_id();
    request.header.flags.rd = dns::recursion_desired::yes;
    dns::question_record qr;
    qr.klass = dns::resource_class::in;
    qr.type = dns::resource_type::a;
    qr.name = dns::resource_name::from_string(hostname_);
    request.questions.emplace_back(qr);
    request_id_ = request.header.id;

    send_buf_ = dns::dns_codec::encode(request);
    auto send_size = static_cast<std::uint16_t>(send_buf_.size());
    send_buf_.insert(send_buf_.begin(), static_cast<std::uint8_t>(send_size & 0xffU));
    send_buf_.insert(send_buf_.begin(), static_cast<std::uint8_t>(send_size >> 8U));
  }

  void execute(std::chrono::milliseconds timeout)
  {
    DEVDNS_LOG_TRACE("Query upstream DNS (TCP) address=\"{}:{}\", name=\"{}\", id={}, timeout={}",
                     address_.to_string(),
                     port_,
                     hostname_,
                     request_id_,
                     timeout);
    deadline_.expires_after(timeout);
    deadline_.async_wait([self = shared_from_this()](std::error_code ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      DEVDNS_LOG_DEBUG("Upstream DNS deadline has been reached, cancelling in-flight operations "
                       "(address=\"{}:{}\", name=\"{}\")",
                       self->address_.to_string(),
                       self->port_,
                       self->hostname_);
      self->complete({ errc::common::unambiguous_timeout });
    });

    const asio::ip::tcp::endpoint endpoint(address_, port_);
    tcp_.async_connect(endpoint, [self = shared_from_this()](std::error_code ec1) mutable {
      if (ec1) {
        DEVDNS_LOG_DEBUG("Upstream DNS TCP connection has been aborted, address=\"{}:{}\", ec={}",
                         self->address_.to_string(),
                         self->port_,
                         ec1.message());
        return self->complete({ ec1 == asio::error::operation_aborted ? errc::common::request_canceled : ec1 });
      }
      const asio::ip::tcp::no_delay no_delay(true);
      std::error_code ignore_ec;
      self->tcp_.set_option(no_delay, ignore_ec);
      DEVDNS_LOG_TRACE("[DNS, TCP, OUT] host=\"{}\", port={}, buffer_size={}{:a}",
                       self->address_.to_string(),
                       self->port_,
                       self->send_buf_.size(),
                       spdlog::to_hex(self->send_buf_));
      asio::async_write(
        self->tcp_,
        asio::buffer(self->send_buf_),
        [self](std::error_code ec2, std::size_t /* bytes_transferred */) mutable {
          if (ec2) {
            DEVDNS_LOG_DEBUG("Upstream DNS TCP write operation has been aborted, address=\"{}:{}\", ec={}",
                             self->address_.to_string(),
                             self->port_,
                             ec2.message());
            return self->complete({ ec2 == asio::error::operation_aborted ? errc::common::request_canceled : ec2 });
          }
          self->read_size();
        });
    });
  }

private:
  void read_size()
  {
    asio::async_read(
      tcp_,
      asio::buffer(&recv_buf_size_, sizeof(std::uint16_t)),
      [self = shared_from_this()](std::error_code ec, std::size_t /* bytes_transferred */) mutable {
        if (ec) {
          DEVDNS_LOG_DEBUG("Upstream DNS TCP buf size read operation has been aborted, address=\"{}:{}\", ec={}",
                           self->address_.to_string(),
                           self->port_,
                           ec.message());
          return self->complete({ ec == asio::error::eof ? errc::network::end_of_stream : ec });
        }
        self->recv_buf_size_ = utils::byte_swap(self->recv_buf_size_);
        self->recv_buf_.resize(self->recv_buf_size_);
        DEVDNS_LOG_TRACE("Upstream DNS TCP schedule read of {} bytes", self->recv_buf_size_);
        self->read_body();
      });
  }

  void read_body()
  {
    asio::async_read(
      tcp_,
      asio::buffer(recv_buf_),
      [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) mutable {
        DEVDNS_LOG_TRACE("[DNS, TCP, IN] host=\"{}\", port={}, rc={}, bytes_received={}{:a}",
                         self->address_.to_string(),
                         self->port_,
                         ec ? ec.message() : "ok",
                         bytes_transferred,
                         spdlog::to_hex(self->recv_buf_.data(),
                                        self->recv_buf_.data() + bytes_transferred));
        if (ec) {
          DEVDNS_LOG_DEBUG("Upstream DNS TCP read operation has been aborted, address=\"{}:{}\", ec={}",
                           self->address_.to_string(),
                           self->port_,
                           ec.message());
          return self->complete({ ec == asio::error::eof ? errc::network::end_of_stream : ec });
        }
        self->recv_buf_.resize(bytes_transferred);
        self->complete(self->parse_response());
      });
  }

  auto parse_response() -> upstream_result
  {
    auto message = dns::dns_codec::decode(recv_buf_);
    if (!message) {
      return { message.error() };
    }
    if (message->header.id != request_id_ ||
        message->header.flags.qr != dns::message_type::response) {
      DEVDNS_LOG_DEBUG("Upstream DNS response does not match the request, address=\"{}:{}\", "
                       "request_id={}, response_id={}",
                       address_.to_string(),
                       port_,
                       request_id_,
                       message->header.id);
      return { errc::network::protocol_error };
    }
    switch (message->header.flags.rcode) {
      case dns::response_code::no_error:
      case dns::response_code::name_error:
        break;
      default:
        DEVDNS_LOG_DEBUG("Upstream DNS responded with rcode={}, address=\"{}:{}\", name=\"{}\"",
                         static_cast<std::uint32_t>(message->header.flags.rcode),
                         address_.to_string(),
                         port_,
                         hostname_);
        return { errc::network::upstream_failure };
    }

    upstream_result result{};
    result.answers.reserve(message->answers.size());
    for (const auto& answer : message->answers) {
      // CNAME records are not forwarded, so the addresses are attributed to the name asked
      result.answers.push_back({ hostname_, answer.address.to_string(), answer_ttl });
    }
    DEVDNS_LOG_DEBUG("Upstream DNS TCP returned {} records for \"{}\" from \"{}:{}\"",
                     result.answers.size(),
                     hostname_,
                     address_.to_string(),
                     port_);
    return result;
  }

  void complete(upstream_result&& result)
  {
    if (!handler_) {
      return;
    }
    deadline_.cancel();
    std::error_code ignore_ec;
    tcp_.close(ignore_ec);
    auto handler = std::move(handler_);
    handler(std::move(result));
  }

  asio::steady_timer deadline_;
  asio::ip::tcp::socket tcp_;

  std::string hostname_;
  asio::ip::address address_;
  std::uint16_t port_;
  utils::movable_function<void(upstream_result&&)> handler_;

  std::uint16_t request_id_{ 0 };
  std::vector<std::uint8_t> send_buf_{};
  std::uint16_t recv_buf_size_{ 0 };
  std::vector<std::uint8_t> recv_buf_{};
};
} // namespace

upstream_client::upstream_client(asio::io_context& ctx, dns::dns_config config)
  : ctx_{ ctx }
  , config_{ std::move(config) }
{
}

void
upstream_client::resolve(const std::string& hostname,
                         utils::movable_function<void(upstream_result&&)>&& handler)
{
  std::error_code ec;
  auto address = asio::ip::make_address(config_.nameserver(), ec);
  if (ec) {
    return handler({ errc::common::invalid_argument });
  }
  auto cmd = std::make_shared<dns_a_command>(
    ctx_, hostname, address, config_.port(), std::move(handler));
  return cmd->execute(config_.timeout());
}

auto
upstream_client::address() const -> std::string
{
  return config_.to_string();
}
} // namespace devdns::core::io
