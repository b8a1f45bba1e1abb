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
#include "configuration.hxx"

#include "configuration_json.hxx"
#include "core/logger/logger.hxx"
#include "core/utils/hostname.hxx"
#include "core/utils/json.hxx"

#include <devdns/error_codes.hxx>

#include <asio/ip/address.hpp>
#include <tao/json.hpp>

#include <fstream>
#include <sstream>

namespace devdns::core
{
namespace
{
auto
invalid_value(std::string_view key, std::string_view expectation) -> std::error_code
{
  DEVDNS_LOG_ERROR("config key \"{}\" must be {}", key, expectation);
  return errc::configuration::invalid_value;
}

auto
read_string(const tao::json::value& parent,
            std::string_view key,
            std::optional<std::string>& output) -> std::error_code
{
  const auto* v = parent.find(key);
  if (v == nullptr || v->is_null()) {
    return {};
  }
  if (!v->is_string()) {
    return invalid_value(key, "a string");
  }
  if (const auto& str = v->get_string(); !str.empty()) {
    output = str;
  }
  return {};
}

auto
read_boolean(const tao::json::value& parent, std::string_view key, bool& output) -> std::error_code
{
  const auto* v = parent.find(key);
  if (v == nullptr || v->is_null()) {
    return {};
  }
  if (!v->is_boolean()) {
    return invalid_value(key, "a boolean");
  }
  output = v->get_boolean();
  return {};
}

auto
read_duration(const tao::json::value& parent,
              std::string_view key,
              std::chrono::milliseconds& output) -> std::error_code
{
  const auto* v = parent.find(key);
  if (v == nullptr || v->is_null()) {
    return {};
  }
  if (!v->is_integer() || v->as<std::int64_t>() <= 0) {
    return invalid_value(key, "a positive number of milliseconds");
  }
  output = std::chrono::milliseconds{ v->as<std::int64_t>() };
  return {};
}

auto
read_section(const tao::json::value& root, std::string_view key, const tao::json::value*& output)
  -> std::error_code
{
  output = root.find(key);
  if (output != nullptr && output->is_null()) {
    output = nullptr;
  }
  if (output != nullptr && !output->is_object()) {
    return invalid_value(key, "an object");
  }
  return {};
}

auto
parse_dns(const tao::json::value& section, dns_settings& dns) -> std::error_code
{
  if (auto ec = read_string(section, "primary", dns.primary); ec) {
    return ec;
  }
  if (auto ec = read_string(section, "secondary", dns.secondary); ec) {
    return ec;
  }
  if (auto ec = read_duration(section, "timeout", dns.timeout); ec) {
    return ec;
  }
  for (const auto& [key, server] : { std::pair{ "dns.primary", &dns.primary }, std::pair{ "dns.secondary", &dns.secondary } }) {
    if (*server && !io::dns::dns_config::parse(server->value())) {
      return invalid_value(key, "an IP address with optional port");
    }
  }
  return {};
}

auto
parse_docker(const tao::json::value& section, docker_settings& docker) -> std::error_code
{
  if (auto ec = read_boolean(section, "enable", docker.enable); ec) {
    return ec;
  }
  if (auto ec = read_duration(section, "refresh", docker.refresh); ec) {
    return ec;
  }
  if (auto ec = read_duration(section, "timeout", docker.timeout); ec) {
    return ec;
  }
  std::optional<std::string> socket{};
  if (auto ec = read_string(section, "socket", socket); ec) {
    return ec;
  }
  if (socket) {
    docker.socket = socket.value();
  }
  if (auto ec = read_string(section, "address", docker.address); ec) {
    return ec;
  }
  if (docker.address && !utils::is_ipv4_address(docker.address.value())) {
    return invalid_value("docker.address", "an IPv4 address");
  }
  return {};
}

auto
parse_local(const tao::json::value& section, local_config& local) -> std::error_code
{
  if (const auto* records = section.find("records"); records != nullptr && !records->is_null()) {
    if (!records->is_object()) {
      return invalid_value("local.records", "an object of hostname to address");
    }
    for (const auto& [name, address] : records->get_object()) {
      if (!address.is_string()) {
        return invalid_value("local.records", "an object of hostname to address");
      }
      local.records.insert_or_assign(name, address.get_string());
    }
  }
  return read_string(section, "hosts_file", local.hosts_file);
}

auto
parse_watch(const tao::json::value& section, watch_settings& watch) -> std::error_code
{
  if (auto ec = read_boolean(section, "enable", watch.enable); ec) {
    return ec;
  }
  return read_duration(section, "interval", watch.interval);
}
} // namespace

auto
parse_configuration(std::string_view input) -> tl::expected<configuration, std::error_code>
{
  tao::json::value root;
  try {
    root = utils::json::parse(input);
  } catch (const tao::pegtl::parse_error& e) {
    DEVDNS_LOG_ERROR("config file json error: {}", e.what());
    return tl::unexpected(errc::configuration::invalid_json);
  }
  if (!root.is_object()) {
    DEVDNS_LOG_ERROR("config file json error: the document must be an object");
    return tl::unexpected(errc::configuration::invalid_json);
  }

  configuration config{};

  std::optional<std::string> host{};
  if (auto ec = read_string(root, "host", host); ec) {
    return tl::unexpected(ec);
  }
  if (host) {
    std::error_code ec;
    asio::ip::make_address(host.value(), ec);
    if (ec) {
      return tl::unexpected(invalid_value("host", "an IP address"));
    }
    config.host = host.value();
  }

  if (const auto* port = root.find("port"); port != nullptr && !port->is_null()) {
    if (!port->is_integer() || port->as<std::int64_t>() < 0 || port->as<std::int64_t>() > 65535) {
      return tl::unexpected(invalid_value("port", "a number in 0..65535"));
    }
    config.port = static_cast<std::uint16_t>(port->as<std::int64_t>());
  }

  const tao::json::value* section = nullptr;
  if (auto ec = read_section(root, "dns", section); ec) {
    return tl::unexpected(ec);
  }
  if (section != nullptr) {
    if (auto ec = parse_dns(*section, config.dns); ec) {
      return tl::unexpected(ec);
    }
  }
  if (auto ec = read_section(root, "docker", section); ec) {
    return tl::unexpected(ec);
  }
  if (section != nullptr) {
    if (auto ec = parse_docker(*section, config.docker); ec) {
      return tl::unexpected(ec);
    }
  }
  if (auto ec = read_section(root, "local", section); ec) {
    return tl::unexpected(ec);
  }
  if (section != nullptr) {
    if (auto ec = parse_local(*section, config.local); ec) {
      return tl::unexpected(ec);
    }
  }
  if (auto ec = read_section(root, "watch", section); ec) {
    return tl::unexpected(ec);
  }
  if (section != nullptr) {
    if (auto ec = parse_watch(*section, config.watch); ec) {
      return tl::unexpected(ec);
    }
  }
  return config;
}

auto
load_configuration(const std::filesystem::path& path) -> tl::expected<configuration, std::error_code>
{
  if (std::error_code ec{}; !std::filesystem::is_regular_file(path, ec) || ec) {
    DEVDNS_LOG_ERROR("config file not found: {}", path.string());
    return tl::unexpected(errc::configuration::file_not_found);
  }
  std::ifstream input(path);
  if (!input.good()) {
    DEVDNS_LOG_ERROR("config file cannot be read: {}", path.string());
    return tl::unexpected(errc::configuration::file_not_found);
  }
  std::stringstream contents;
  contents << input.rdbuf();
  auto config = parse_configuration(contents.str());
  if (!config) {
    DEVDNS_LOG_ERROR("config file is invalid: {}, {}", path.string(), config.error().message());
  }
  return config;
}

auto
locate_configuration_file(const std::optional<std::string>& explicit_path,
                          const std::filesystem::path& executable_directory) -> std::filesystem::path
{
  static constexpr auto file_name = "config.json";
  if (explicit_path) {
    return explicit_path.value();
  }
  if (!executable_directory.empty()) {
    auto candidate = executable_directory / file_name;
    if (std::error_code ec{}; std::filesystem::exists(candidate, ec) && !ec) {
      return candidate;
    }
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    return file_name;
  }
  return cwd / file_name;
}

auto
to_string(const configuration& config) -> std::string
{
  tao::json::value json = config;
  return utils::json::generate(json);
}
} // namespace devdns::core
