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

#include "test_helper.hxx"

#include "core/discovery/traefik_rules.hxx"

#include <string>
#include <vector>

using devdns::core::discovery::extract_host_names;
using devdns::core::discovery::is_router_rule_label;
using names = std::vector<std::string>;

TEST_CASE("unit: router rule labels", "[unit]")
{
    CHECK(is_router_rule_label("traefik.http.routers.api.rule"));
    CHECK(is_router_rule_label("traefik.http.routers.api-secure.rule"));
    CHECK(is_router_rule_label("traefik.frontend.rule"));
    CHECK_FALSE(is_router_rule_label("traefik.http.routers.api.entrypoints"));
    CHECK_FALSE(is_router_rule_label("traefik.http.routers.rule"));
    CHECK_FALSE(is_router_rule_label("traefik.http.services.api.loadbalancer.server.port"));
    CHECK_FALSE(is_router_rule_label("traefik.enable"));
}

TEST_CASE("unit: single host matcher", "[unit]")
{
    CHECK(extract_host_names("Host(`api.dev.local`)") == names{ "api.dev.local" });
    CHECK(extract_host_names("Host(\"api.dev.local\")") == names{ "api.dev.local" });
    CHECK(extract_host_names("Host('api.dev.local')") == names{ "api.dev.local" });
    CHECK(extract_host_names("Host( `API.Dev.Local` )") == names{ "api.dev.local" });
}

TEST_CASE("unit: several host matchers", "[unit]")
{
    CHECK(extract_host_names("Host(`a.local`) || Host(`b.local`)") == names{ "a.local", "b.local" });
    CHECK(extract_host_names("Host(`a.local`, `b.local`)") == names{ "a.local", "b.local" });
    CHECK(extract_host_names("(Host(`a.local`) || Host(`b.local`)) && PathPrefix(`/api`)") ==
          names{ "a.local", "b.local" });
    CHECK(extract_host_names("Host(`a.local`) || Host(`A.local`)") == names{ "a.local" });
}

TEST_CASE("unit: non-literal host matchers are ignored", "[unit]")
{
    CHECK(extract_host_names("HostRegexp(`{subdomain:[a-z]+}.dev.local`)").empty());
    CHECK(extract_host_names("HostSNI(`*`)").empty());
    CHECK(extract_host_names("PathPrefix(`/api`)").empty());
    CHECK(extract_host_names("HostRegexp(`.+`) || Host(`web.local`)") == names{ "web.local" });
    CHECK(extract_host_names("").empty());
}

TEST_CASE("unit: truncated rules", "[unit]")
{
    CHECK(extract_host_names("Host(`a.local`) || Host(`b.loc").size() == 1);
    CHECK(extract_host_names("Host(`a.local`").size() == 1);
}

TEST_CASE("unit: traefik v1 frontend rule", "[unit]")
{
    CHECK(extract_host_names("Host:a.local,b.local") == names{ "a.local", "b.local" });
    CHECK(extract_host_names("Host:a.local;PathPrefix:/api") == names{ "a.local" });
    CHECK(extract_host_names("PathPrefix:/api;Host:a.local") == names{});
}
