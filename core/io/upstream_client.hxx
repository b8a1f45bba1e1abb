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

#include "dns_config.hxx"
#include "upstream.hxx"

#include <string>

namespace asio
{
class io_context;
} // namespace asio

namespace devdns::core::io
{
/**
 * Recursive resolver client bound to one nameserver. Every query opens its own DNS-over-TCP
 * connection, so concurrent queries never share state.
 */
class upstream_client : public upstream
{
public:
  upstream_client(asio::io_context& ctx, dns::dns_config config);

  void resolve(const std::string& hostname,
               utils::movable_function<void(upstream_result&&)>&& handler) override;

  [[nodiscard]] auto address() const -> std::string override;

  [[nodiscard]] auto config() const -> const dns::dns_config&
  {
    return config_;
  }

private:
  asio::io_context& ctx_;
  dns::dns_config config_;
};
} // namespace devdns::core::io
