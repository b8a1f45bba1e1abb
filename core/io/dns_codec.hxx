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

#include "dns_message.hxx"

#include <tl/expected.hpp>

#include <cstdint>
#include <system_error>
#include <vector>

namespace devdns::core::io::dns
{
class dns_codec
{
public:
  /**
   * Decodes header, question section and the A/IN records of the answer section. Records of other
   * types are skipped, authority and additional sections are ignored.
   *
   * @return errc::network::protocol_error if the payload is truncated or contains an invalid name
   */
  static auto decode(const std::vector<std::uint8_t>& payload)
    -> tl::expected<dns_message, std::error_code>;

  /**
   * Encodes header, question section and answer section. The section counters of the header are
   * derived from the message contents, authority and additional counters are always zero.
   */
  static auto encode(const dns_message& message) -> std::vector<std::uint8_t>;

  /**
   * Size of the message produced by encode().
   */
  static auto encoded_size(const dns_message& message) -> std::size_t;
};
} // namespace devdns::core::io::dns
