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

#include <string>
#include <string_view>
#include <vector>

namespace devdns::core::discovery
{
/**
 * Prefix and suffix of the Traefik v2/v3 router rule labels, e.g.
 * "traefik.http.routers.api.rule".
 */
constexpr std::string_view router_label_prefix{ "traefik.http.routers." };
constexpr std::string_view router_label_suffix{ ".rule" };

/**
 * Traefik v1 frontend rule label.
 */
constexpr std::string_view frontend_rule_label{ "traefik.frontend.rule" };

/**
 * @return true if the container label carries a router rule
 */
auto
is_router_rule_label(std::string_view label) -> bool;

/**
 * Extracts the literal hostnames from the Host matchers of a router rule:
 *
 *   Host(`a.local`) || (Host(`b.local`, `c.local`) && PathPrefix(`/api`))
 *
 * yields a.local, b.local, c.local. Other matchers (HostRegexp, HostSNI, Path...) are ignored.
 * The v1 form "Host:a.local,b.local" is accepted as well. Names are returned normalized and
 * without duplicates, in order of appearance.
 */
auto
extract_host_names(std::string_view rule) -> std::vector<std::string>;
} // namespace devdns::core::discovery
