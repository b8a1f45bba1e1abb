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
#include "docker_discovery_provider.hxx"

#include "core/logger/logger.hxx"
#include "core/utils/hostname.hxx"
#include "core/utils/json.hxx"
#include "traefik_rules.hxx"

#include <devdns/error_codes.hxx>

#include <fmt/core.h>
#include <tao/json.hpp>

#include <map>
#include <vector>

namespace devdns::core::discovery
{
namespace
{
constexpr auto containers_path = "/containers/json";

auto
container_name(const tao::json::value& container) -> std::string
{
  if (const auto* names = container.find("Names");
      names != nullptr && names->is_array() && !names->get_array().empty() &&
      names->get_array().front().is_string()) {
    return names->get_array().front().get_string();
  }
  if (const auto* id = container.find("Id"); id != nullptr && id->is_string()) {
    return id->get_string().substr(0, 12);
  }
  return "<unknown>";
}

auto
container_address(const tao::json::value& container) -> std::optional<std::string>
{
  const auto* settings = container.find("NetworkSettings");
  if (settings == nullptr || !settings->is_object()) {
    return {};
  }
  const auto* networks = settings->find("Networks");
  if (networks == nullptr || !networks->is_object()) {
    return {};
  }
  for (const auto& [network_name, network] : networks->get_object()) {
    if (!network.is_object()) {
      continue;
    }
    if (const auto* ip = network.find("IPAddress");
        ip != nullptr && ip->is_string() && utils::is_ipv4_address(ip->get_string())) {
      return ip->get_string();
    }
  }
  return {};
}

auto
is_disabled(const tao::json::value& labels) -> bool
{
  if (const auto* enable = labels.find("traefik.enable"); enable != nullptr && enable->is_string()) {
    return enable->get_string() == "false";
  }
  return false;
}
} // namespace

docker_discovery_provider::docker_discovery_provider(asio::io_context& ctx,
                                                     docker_discovery_options options)
  : client_{ ctx, options.socket_path, options.timeout }
  , options_{ std::move(options) }
{
}

auto
docker_discovery_provider::endpoint() const -> std::string
{
  return fmt::format("unix://{}", options_.socket_path);
}

void
docker_discovery_provider::fetch(
  utils::movable_function<void(std::error_code, discovery_snapshot::entries_type&&)>&& handler)
{
  io::http_request request{};
  request.path = containers_path;
  client_.execute(
    std::move(request),
    [address = options_.address, handler = std::move(handler)](
      std::error_code ec, io::http_response&& response) mutable {
      if (ec) {
        return handler(ec, {});
      }
      if (!response.is_success()) {
        DEVDNS_LOG_DEBUG("Docker API responded with status {} ({}): {}",
                         response.status_code,
                         response.status_message,
                         response.body);
        return handler(errc::discovery::unexpected_status, {});
      }
      tao::json::value containers;
      try {
        containers = utils::json::parse(response.body);
      } catch (const tao::pegtl::parse_error& e) {
        DEVDNS_LOG_DEBUG("unable to parse Docker containers list as JSON: {}", e.what());
        return handler(errc::discovery::malformed_payload, {});
      }
      auto entries = entries_from_containers(containers, address);
      if (!entries) {
        return handler(entries.error(), {});
      }
      return handler({}, std::move(entries.value()));
    });
}

auto
docker_discovery_provider::entries_from_containers(const tao::json::value& containers,
                                                   const std::optional<std::string>& address)
  -> tl::expected<discovery_snapshot::entries_type, std::error_code>
{
  if (!containers.is_array()) {
    return tl::unexpected(errc::discovery::malformed_payload);
  }

  discovery_snapshot::entries_type entries{};
  std::map<std::string, std::string, std::less<>> owners{};
  for (const auto& container : containers.get_array()) {
    if (!container.is_object()) {
      return tl::unexpected(errc::discovery::malformed_payload);
    }
    if (const auto* state = container.find("State");
        state != nullptr && state->is_string() && state->get_string() != "running") {
      continue;
    }
    const auto* labels = container.find("Labels");
    if (labels == nullptr || !labels->is_object() || is_disabled(*labels)) {
      continue;
    }

    std::vector<std::string> hostnames;
    for (const auto& [label, rule] : labels->get_object()) {
      if (!rule.is_string() || !is_router_rule_label(label)) {
        continue;
      }
      for (auto& name : extract_host_names(rule.get_string())) {
        hostnames.emplace_back(std::move(name));
      }
    }
    if (hostnames.empty()) {
      continue;
    }

    auto name = container_name(container);
    auto target = address ? address : container_address(container);
    if (!target) {
      DEVDNS_LOG_DEBUG("container \"{}\" has no IPv4 address, skipping {} hostname(s)",
                       name,
                       hostnames.size());
      continue;
    }

    for (auto& hostname : hostnames) {
      if (auto owner = owners.find(hostname); owner != owners.end()) {
        if (owner->second != name) {
          DEVDNS_LOG_WARNING("hostname \"{}\" is claimed by containers \"{}\" and \"{}\", using \"{}\"",
                             hostname,
                             owner->second,
                             name,
                             owner->second);
        }
        continue;
      }
      owners.emplace(hostname, name);
      entries.emplace(std::move(hostname), *target);
    }
  }
  return entries;
}
} // namespace devdns::core::discovery
