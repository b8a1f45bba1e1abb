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

#include "core/io/dns_config.hxx"
#include "core/io/docker_client.hxx"
#include "local_table.hxx"

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace devdns::core
{
struct dns_settings {
  std::optional<std::string> primary{};
  std::optional<std::string> secondary{};
  std::chrono::milliseconds timeout{ io::dns::dns_config::default_timeout };
};

struct docker_settings {
  bool enable{ false };
  std::chrono::milliseconds refresh{ 5'000 };
  std::string socket{ io::docker_client::default_socket_path };
  std::optional<std::string> address{};
  std::chrono::milliseconds timeout{ io::docker_client::default_timeout };
};

struct watch_settings {
  static constexpr std::chrono::milliseconds default_interval{ 2'000 };

  bool enable{ true };
  std::chrono::milliseconds interval{ default_interval };
};

/**
 * Immutable snapshot of the configuration file. Every new configuration produces a new server
 * instance.
 */
struct configuration {
  std::string host{ "0.0.0.0" };
  /**
   * 0 lets the operating system pick a free port
   */
  std::uint16_t port{ 53 };
  dns_settings dns{};
  docker_settings docker{};
  local_config local{};
  watch_settings watch{};
};

/**
 * Parses and validates the JSON representation. Every key is optional.
 *
 * @return errc::configuration::invalid_json if the document is not a JSON object,
 * errc::configuration::invalid_value if a key has a wrong type or is out of range
 */
auto
parse_configuration(std::string_view input) -> tl::expected<configuration, std::error_code>;

/**
 * Reads and parses the configuration file.
 *
 * @return errc::configuration::file_not_found if the file does not exist or cannot be read, or
 * any error of parse_configuration()
 */
auto
load_configuration(const std::filesystem::path& path) -> tl::expected<configuration, std::error_code>;

/**
 * Location of the configuration file: the explicit path when given, otherwise config.json next to
 * the executable if it exists, otherwise config.json in the working directory.
 */
auto
locate_configuration_file(const std::optional<std::string>& explicit_path,
                          const std::filesystem::path& executable_directory) -> std::filesystem::path;

/**
 * JSON representation with all defaults applied, used for logging.
 */
auto
to_string(const configuration& config) -> std::string;
} // namespace devdns::core
