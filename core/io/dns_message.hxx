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

#include <asio/ip/address_v4.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace devdns::core::io::dns
{
enum class resource_type : std::uint16_t {
  a = 1,
  ns = 2,
  cname = 5,
  soa = 6,
  ptr = 12,
  mx = 15,
  txt = 16,
  aaaa = 28,
  srv = 33,
  any = 255,
};

enum class resource_class : std::uint16_t {
  in = 1,
};

enum class message_type : std::uint8_t {
  query = 0,
  response = 1,
};

enum class operation_code : std::uint8_t {
  standard_query = 0,
  inverse_query = 1,
  status = 2,
};

enum class authoritative_answer : std::uint8_t {
  no = 0,
  yes = 1,
};

enum class truncation : std::uint8_t {
  no = 0,
  yes = 1,
};

enum class recursion_desired : std::uint8_t {
  no = 0,
  yes = 1,
};

enum class recursion_available : std::uint8_t {
  no = 0,
  yes = 1,
};

enum class response_code : std::uint8_t {
  no_error = 0,
  format_error = 1,
  server_failure = 2,
  name_error = 3,
  not_implemented = 4,
  refused = 5,
};

struct dns_flags {
  message_type qr{ message_type::query };
  operation_code opcode{ operation_code::standard_query };
  authoritative_answer aa{ authoritative_answer::no };
  truncation tc{ truncation::no };
  recursion_desired rd{ recursion_desired::no };
  recursion_available ra{ recursion_available::no };
  response_code rcode{ response_code::no_error };

  [[nodiscard]] auto encode() const -> std::uint16_t
  {
    auto value = static_cast<std::uint16_t>((static_cast<std::uint16_t>(qr) & 0b0000'0001U) << 15U);
    value |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(opcode) & 0b0000'1111U) << 11U);
    value |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(aa) & 0b0000'0001U) << 10U);
    value |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(tc) & 0b0000'0001U) << 9U);
    value |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(rd) & 0b0000'0001U) << 8U);
    value |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(ra) & 0b0000'0001U) << 7U);
    value |= static_cast<std::uint16_t>(static_cast<std::uint16_t>(rcode) & 0b0000'1111U);
    return value;
  }

  void decode(std::uint16_t value)
  {
    qr = static_cast<message_type>((value >> 15U) & 0b0000'0001U);
    opcode = static_cast<operation_code>((value >> 11U) & 0b0000'1111U);
    aa = static_cast<authoritative_answer>((value >> 10U) & 0b0000'0001U);
    tc = static_cast<truncation>((value >> 9U) & 0b0000'0001U);
    rd = static_cast<recursion_desired>((value >> 8U) & 0b0000'0001U);
    ra = static_cast<recursion_available>((value >> 7U) & 0b0000'0001U);
    rcode = static_cast<response_code>(value & 0b0000'1111U);
  }
};

struct dns_header {
  std::uint16_t id{};
  dns_flags flags{};
  std::uint16_t question_records{};
  std::uint16_t answer_records{};
  std::uint16_t authority_records{};
  std::uint16_t additional_records{};
};

struct resource_name {
  std::vector<std::string> labels{};

  /**
   * Splits dotted notation into labels. Empty labels (leading, trailing or doubled dots) are
   * dropped.
   */
  static auto from_string(std::string_view name) -> resource_name;

  /**
   * @return dotted notation without trailing dot, or an empty string for the root name
   */
  [[nodiscard]] auto to_string() const -> std::string;
};

struct question_record {
  resource_name name{};
  resource_type type{ resource_type::a };
  resource_class klass{ resource_class::in };
};

/**
 * Only address records are ever produced or consumed, so the answer section is modelled as a list
 * of A records.
 */
struct a_record {
  resource_name name{};
  resource_type type{ resource_type::a };
  resource_class klass{ resource_class::in };
  std::uint32_t ttl{};
  asio::ip::address_v4 address{};
};

struct dns_message {
  dns_header header{};
  std::vector<question_record> questions{};
  std::vector<a_record> answers{};
};
} // namespace devdns::core::io::dns
