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

#include <system_error>

namespace devdns
{
namespace core::impl
{
const std::error_category&
common_category() noexcept;

const std::error_category&
network_category() noexcept;

const std::error_category&
discovery_category() noexcept;

const std::error_category&
configuration_category() noexcept;
} // namespace core::impl

namespace errc
{
/**
 * Errors shared by all subsystems.
 */
enum class common {
  /**
   * The operation has been cancelled, most likely because its owner was closed.
   */
  request_canceled = 2,

  /**
   * The caller passed an argument that cannot be used (for example a nameserver that is not an IP
   * address).
   */
  invalid_argument = 3,

  /**
   * The payload could not be parsed.
   */
  parsing_failure = 8,

  /**
   * The operation did not complete before its deadline. Nothing has been received from the peer.
   */
  unambiguous_timeout = 14,
};

/**
 * Errors of the DNS transport, both on the serving side and towards upstream nameservers.
 */
enum class network {
  /**
   * The peer sent a message that violates the DNS wire format, or a response that does not match
   * the request.
   */
  protocol_error = 1001,

  /**
   * The upstream nameserver answered with a failure RCODE (SERVFAIL, REFUSED, ...).
   */
  upstream_failure = 1002,

  /**
   * The stream has been closed before the full message has been received.
   */
  end_of_stream = 1003,
};

/**
 * Errors of the orchestrator discovery.
 */
enum class discovery {
  /**
   * The orchestrator API endpoint cannot be reached.
   */
  orchestrator_unavailable = 1101,

  /**
   * The orchestrator API responded with a non-successful HTTP status.
   */
  unexpected_status = 1102,

  /**
   * The orchestrator API responded with a body that is not the expected JSON document.
   */
  malformed_payload = 1103,
};

/**
 * Errors of the configuration file.
 */
enum class configuration {
  /**
   * The configuration file does not exist or cannot be read.
   */
  file_not_found = 1201,

  /**
   * The configuration file is not a JSON object.
   */
  invalid_json = 1202,

  /**
   * A configuration key has a value of the wrong type or out of range.
   */
  invalid_value = 1203,
};

inline std::error_code
make_error_code(common e) noexcept
{
  return { static_cast<int>(e), core::impl::common_category() };
}

inline std::error_code
make_error_code(network e) noexcept
{
  return { static_cast<int>(e), core::impl::network_category() };
}

inline std::error_code
make_error_code(discovery e) noexcept
{
  return { static_cast<int>(e), core::impl::discovery_category() };
}

inline std::error_code
make_error_code(configuration e) noexcept
{
  return { static_cast<int>(e), core::impl::configuration_category() };
}
} // namespace errc
} // namespace devdns

template<>
struct std::is_error_code_enum<devdns::errc::common> : std::true_type {
};

template<>
struct std::is_error_code_enum<devdns::errc::network> : std::true_type {
};

template<>
struct std::is_error_code_enum<devdns::errc::discovery> : std::true_type {
};

template<>
struct std::is_error_code_enum<devdns::errc::configuration> : std::true_type {
};
