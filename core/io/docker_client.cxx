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
#include "docker_client.hxx"

#include "core/logger/logger.hxx"
#include "http_parser.hxx"

#include <devdns/error_codes.hxx>

#include <asio/io_context.hpp>
#include <asio/local/stream_protocol.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include <array>
#include <memory>

namespace devdns::core::io
{
namespace
{
class docker_request : public std::enable_shared_from_this<docker_request>
{
public:
  docker_request(asio::io_context& ctx,
                 std::string socket_path,
                 const http_request& request,
                 utils::movable_function<void(std::error_code, http_response&&)> handler)
    : deadline_(ctx)
    , stream_(ctx)
    , socket_path_(std::move(socket_path))
    , path_(request.path)
    , handler_(std::move(handler))
  {
    send_buf_ = fmt::format("{} {} HTTP/1.1\r\n"
                            "Host: docker\r\n"
                            "Accept: application/json\r\n"
                            "Connection: close\r\n",
                            request.method,
                            request.path);
    for (const auto& [name, value] : request.headers) {
      send_buf_ += fmt::format("{}: {}\r\n", name, value);
    }
    if (!request.body.empty()) {
      send_buf_ += fmt::format("Content-Length: {}\r\n", request.body.size());
    }
    send_buf_ += "\r\n";
    send_buf_ += request.body;
  }

  void execute(std::chrono::milliseconds timeout)
  {
    deadline_.expires_after(timeout);
    deadline_.async_wait([self = shared_from_this()](std::error_code ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      DEVDNS_LOG_DEBUG("Docker API deadline has been reached, cancelling request (socket=\"{}\", path=\"{}\")",
                       self->socket_path_,
                       self->path_);
      self->complete(errc::common::unambiguous_timeout);
    });

    stream_.async_connect(
      asio::local::stream_protocol::endpoint{ socket_path_ },
      [self = shared_from_this()](std::error_code ec1) mutable {
        if (ec1) {
          DEVDNS_LOG_DEBUG("Unable to connect to Docker API socket=\"{}\", ec={}",
                           self->socket_path_,
                           ec1.message());
          return self->complete(errc::discovery::orchestrator_unavailable);
        }
        DEVDNS_LOG_TRACE("[HTTP, OUT] socket=\"{}\", request=\"{}\"", self->socket_path_, self->send_buf_);
        asio::async_write(self->stream_,
                          asio::buffer(self->send_buf_),
                          [self](std::error_code ec2, std::size_t /* bytes_transferred */) mutable {
                            if (ec2) {
                              DEVDNS_LOG_DEBUG("Docker API write operation has been aborted, socket=\"{}\", ec={}",
                                               self->socket_path_,
                                               ec2.message());
                              return self->complete(ec2 == asio::error::operation_aborted ? errc::common::request_canceled : ec2);
                            }
                            self->do_read();
                          });
      });
  }

private:
  void do_read()
  {
    stream_.async_read_some(
      asio::buffer(input_buffer_),
      [self = shared_from_this()](std::error_code ec, std::size_t bytes_transferred) mutable {
        if (ec == asio::error::eof) {
          if (auto res = self->parser_.finish(); res.failure || !self->parser_.complete) {
            DEVDNS_LOG_DEBUG("Docker API closed the stream before the response was complete, socket=\"{}\", error=\"{}\"",
                             self->socket_path_,
                             res.error);
            return self->complete(errc::network::protocol_error);
          }
          return self->complete({});
        }
        if (ec) {
          DEVDNS_LOG_DEBUG("Docker API read operation has been aborted, socket=\"{}\", ec={}",
                           self->socket_path_,
                           ec.message());
          return self->complete(ec == asio::error::operation_aborted ? errc::common::request_canceled : ec);
        }
        auto res = self->parser_.feed(self->input_buffer_.data(), bytes_transferred);
        if (res.failure) {
          DEVDNS_LOG_DEBUG("Unable to parse Docker API response, socket=\"{}\", error=\"{}\"",
                           self->socket_path_,
                           res.error);
          return self->complete(errc::common::parsing_failure);
        }
        if (res.complete) {
          return self->complete({});
        }
        self->do_read();
      });
  }

  void complete(std::error_code ec)
  {
    if (!handler_) {
      return;
    }
    deadline_.cancel();
    std::error_code ignore_ec;
    stream_.close(ignore_ec);
    DEVDNS_LOG_TRACE("[HTTP, IN] socket=\"{}\", path=\"{}\", ec={}, status={}, body_size={}",
                     socket_path_,
                     path_,
                     ec.message(),
                     parser_.response.status_code,
                     parser_.response.body.size());
    auto handler = std::move(handler_);
    handler(ec, std::move(parser_.response));
  }

  asio::steady_timer deadline_;
  asio::local::stream_protocol::socket stream_;
  std::string socket_path_;
  std::string path_;
  utils::movable_function<void(std::error_code, http_response&&)> handler_;

  std::string send_buf_{};
  std::array<char, 16384> input_buffer_{};
  http_parser parser_{};
};
} // namespace

docker_client::docker_client(asio::io_context& ctx,
                             std::string socket_path,
                             std::chrono::milliseconds timeout)
  : ctx_{ ctx }
  , socket_path_{ std::move(socket_path) }
  , timeout_{ timeout }
{
}

void
docker_client::execute(http_request request,
                       utils::movable_function<void(std::error_code, http_response&&)>&& handler)
{
  auto cmd = std::make_shared<docker_request>(ctx_, socket_path_, request, std::move(handler));
  return cmd->execute(timeout_);
}
} // namespace devdns::core::io
