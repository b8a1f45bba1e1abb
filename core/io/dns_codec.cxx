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
#include "dns_codec.hxx"

#include "core/utils/byteswap.hxx"

#include <devdns/error_codes.hxx>

#include <algorithm>
#include <array>
#include <cstring>
#include <optional>

namespace devdns::core::io::dns
{
namespace
{
constexpr std::size_t header_size{ 12 };
constexpr std::size_t max_label_size{ 63 };
// wire length of a name, length octets and the root label included
constexpr std::size_t max_name_size{ 255 };
// a pointer chain longer than this can only be a loop
constexpr std::size_t max_pointer_jumps{ 64 };

class payload_reader
{
public:
  explicit payload_reader(const std::vector<std::uint8_t>& payload)
    : payload_{ payload }
  {
  }

  [[nodiscard]] auto offset() const -> std::size_t
  {
    return offset_;
  }

  auto read_u16(std::uint16_t& value) -> bool
  {
    if (offset_ + sizeof(std::uint16_t) > payload_.size()) {
      return false;
    }
    std::memcpy(&value, payload_.data() + offset_, sizeof(std::uint16_t));
    offset_ += sizeof(std::uint16_t);
    value = utils::byte_swap(value);
    return true;
  }

  auto read_u32(std::uint32_t& value) -> bool
  {
    if (offset_ + sizeof(std::uint32_t) > payload_.size()) {
      return false;
    }
    std::memcpy(&value, payload_.data() + offset_, sizeof(std::uint32_t));
    offset_ += sizeof(std::uint32_t);
    value = utils::byte_swap(value);
    return true;
  }

  auto skip(std::size_t size) -> bool
  {
    if (offset_ + size > payload_.size()) {
      return false;
    }
    offset_ += size;
    return true;
  }

  auto read_bytes(std::uint8_t* output, std::size_t size) -> bool
  {
    if (offset_ + size > payload_.size()) {
      return false;
    }
    std::memcpy(output, payload_.data() + offset_, size);
    offset_ += size;
    return true;
  }

  auto read_name(resource_name& name) -> bool
  {
    std::optional<std::size_t> save_offset{};
    std::size_t jumps = 0;
    std::size_t wire_size = 1;
    std::size_t offset = offset_;
    while (true) {
      if (offset >= payload_.size()) {
        return false;
      }
      std::uint8_t len = payload_[offset];
      if (len == 0) {
        offset += 1;
        // restore offset after pointer jump
        offset_ = save_offset ? *save_offset : offset;
        return true;
      }
      if ((len & 0b1100'0000U) == 0b1100'0000U) {
        if (offset + sizeof(std::uint16_t) > payload_.size() || ++jumps > max_pointer_jumps) {
          return false;
        }
        std::uint16_t ptr = 0;
        std::memcpy(&ptr, payload_.data() + offset, sizeof(std::uint16_t));
        ptr = utils::byte_swap(ptr);
        ptr &= 0b0011'1111'1111'1111U;
        if (!save_offset) {
          save_offset = offset + sizeof(std::uint16_t);
        }
        offset = ptr;
      } else if ((len & 0b1100'0000U) != 0) {
        // extended label types are obsolete
        return false;
      } else {
        wire_size += 1U + len;
        if (offset + 1 + len > payload_.size() || wire_size > max_name_size) {
          return false;
        }
        name.labels.emplace_back(payload_.data() + offset + 1, payload_.data() + offset + 1 + len);
        offset += static_cast<std::size_t>(1U + len);
      }
    }
  }

private:
  const std::vector<std::uint8_t>& payload_;
  std::size_t offset_{ 0 };
};

class payload_writer
{
public:
  explicit payload_writer(std::vector<std::uint8_t>& payload)
    : payload_{ payload }
  {
  }

  void write_u16(std::uint16_t value)
  {
    value = utils::byte_swap(value);
    std::memcpy(payload_.data() + offset_, &value, sizeof(std::uint16_t));
    offset_ += sizeof(std::uint16_t);
  }

  void write_u32(std::uint32_t value)
  {
    value = utils::byte_swap(value);
    std::memcpy(payload_.data() + offset_, &value, sizeof(std::uint32_t));
    offset_ += sizeof(std::uint32_t);
  }

  void write_bytes(const std::uint8_t* data, std::size_t size)
  {
    std::memcpy(payload_.data() + offset_, data, size);
    offset_ += size;
  }

  void write_name(const resource_name& name)
  {
    for (const auto& label : name.labels) {
      auto size = std::min(label.size(), max_label_size);
      payload_[offset_] = static_cast<std::uint8_t>(size);
      ++offset_;
      std::memcpy(payload_.data() + offset_, label.data(), size);
      offset_ += size;
    }
    payload_[offset_] = '\0';
    ++offset_;
  }

private:
  std::vector<std::uint8_t>& payload_;
  std::size_t offset_{ 0 };
};

auto
name_size(const resource_name& name) -> std::size_t
{
  std::size_t size = 1; // root label
  for (const auto& label : name.labels) {
    size += 1 + std::min(label.size(), max_label_size);
  }
  return size;
}
} // namespace

auto
dns_codec::decode(const std::vector<std::uint8_t>& payload)
  -> tl::expected<dns_message, std::error_code>
{
  if (payload.size() < header_size) {
    return tl::unexpected(errc::network::protocol_error);
  }

  dns_message message{};
  payload_reader reader{ payload };

  std::uint16_t flags = 0;
  reader.read_u16(message.header.id);
  reader.read_u16(flags);
  message.header.flags.decode(flags);
  reader.read_u16(message.header.question_records);
  reader.read_u16(message.header.answer_records);
  reader.read_u16(message.header.authority_records);
  reader.read_u16(message.header.additional_records);

  for (std::uint16_t idx = 0; idx < message.header.question_records; ++idx) {
    question_record qr;
    std::uint16_t type = 0;
    std::uint16_t klass = 0;
    if (!reader.read_name(qr.name) || !reader.read_u16(type) || !reader.read_u16(klass)) {
      return tl::unexpected(errc::network::protocol_error);
    }
    qr.type = static_cast<resource_type>(type);
    qr.klass = static_cast<resource_class>(klass);
    message.questions.emplace_back(std::move(qr));
  }

  for (std::uint16_t idx = 0; idx < message.header.answer_records; ++idx) {
    a_record ar;
    std::uint16_t type = 0;
    std::uint16_t klass = 0;
    std::uint16_t size = 0;
    if (!reader.read_name(ar.name) || !reader.read_u16(type) || !reader.read_u16(klass) ||
        !reader.read_u32(ar.ttl) || !reader.read_u16(size)) {
      return tl::unexpected(errc::network::protocol_error);
    }
    ar.type = static_cast<resource_type>(type);
    ar.klass = static_cast<resource_class>(klass);

    if (ar.klass != resource_class::in || ar.type != resource_type::a ||
        size != sizeof(asio::ip::address_v4::bytes_type)) {
      // ignore everything except IPv4 address answers
      if (!reader.skip(size)) {
        return tl::unexpected(errc::network::protocol_error);
      }
      continue;
    }

    asio::ip::address_v4::bytes_type bytes{};
    if (!reader.read_bytes(bytes.data(), bytes.size())) {
      return tl::unexpected(errc::network::protocol_error);
    }
    ar.address = asio::ip::address_v4{ bytes };
    message.answers.emplace_back(std::move(ar));
  }

  return message;
}

auto
dns_codec::encoded_size(const dns_message& message) -> std::size_t
{
  std::size_t size = header_size;
  for (const auto& question : message.questions) {
    size += name_size(question.name) + 2 * sizeof(std::uint16_t);
  }
  for (const auto& answer : message.answers) {
    size += name_size(answer.name) + 3 * sizeof(std::uint16_t) + sizeof(std::uint32_t) +
            sizeof(asio::ip::address_v4::bytes_type);
  }
  return size;
}

auto
dns_codec::encode(const dns_message& message) -> std::vector<std::uint8_t>
{
  std::vector<std::uint8_t> payload(encoded_size(message), 0);
  payload_writer writer{ payload };

  writer.write_u16(message.header.id);
  writer.write_u16(message.header.flags.encode());
  writer.write_u16(static_cast<std::uint16_t>(message.questions.size()));
  writer.write_u16(static_cast<std::uint16_t>(message.answers.size()));
  writer.write_u16(0); // authority
  writer.write_u16(0); // additional

  for (const auto& question : message.questions) {
    writer.write_name(question.name);
    writer.write_u16(static_cast<std::uint16_t>(question.type));
    writer.write_u16(static_cast<std::uint16_t>(question.klass));
  }

  for (const auto& answer : message.answers) {
    writer.write_name(answer.name);
    writer.write_u16(static_cast<std::uint16_t>(resource_type::a));
    writer.write_u16(static_cast<std::uint16_t>(resource_class::in));
    writer.write_u32(answer.ttl);
    const auto bytes = answer.address.to_bytes();
    writer.write_u16(static_cast<std::uint16_t>(bytes.size()));
    writer.write_bytes(bytes.data(), bytes.size());
  }
  return payload;
}

auto
resource_name::from_string(std::string_view name) -> resource_name
{
  resource_name result{};
  while (!name.empty()) {
    auto dot = name.find('.');
    auto label = name.substr(0, dot);
    if (!label.empty()) {
      result.labels.emplace_back(label);
    }
    if (dot == std::string_view::npos) {
      break;
    }
    name.remove_prefix(dot + 1);
  }
  return result;
}

auto
resource_name::to_string() const -> std::string
{
  std::string result;
  for (const auto& label : labels) {
    if (!result.empty()) {
      result += '.';
    }
    result += label;
  }
  return result;
}
} // namespace devdns::core::io::dns
