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

#include "configuration.hxx"

#include <tao/json.hpp>

namespace tao::json
{
template<>
struct traits<devdns::core::configuration> {
  template<template<typename...> class Traits>
  static void assign(basic_value<Traits>& v, const devdns::core::configuration& config)
  {
    v = {
      { "host", config.host },
      { "port", config.port },
      {
        "dns",
        {
          { "timeout", config.dns.timeout.count() },
        },
      },
      {
        "docker",
        {
          { "enable", config.docker.enable },
          { "refresh", config.docker.refresh.count() },
          { "socket", config.docker.socket },
          { "timeout", config.docker.timeout.count() },
        },
      },
      {
        "watch",
        {
          { "enable", config.watch.enable },
          { "interval", config.watch.interval.count() },
        },
      },
    };
    if (config.dns.primary) {
      v["dns"]["primary"] = config.dns.primary.value();
    }
    if (config.dns.secondary) {
      v["dns"]["secondary"] = config.dns.secondary.value();
    }
    if (config.docker.address) {
      v["docker"]["address"] = config.docker.address.value();
    }
    basic_value<Traits> records = empty_object;
    for (const auto& [name, address] : config.local.records) {
      records[name] = address;
    }
    v["local"] = {
      { "records", std::move(records) },
    };
    if (config.local.hosts_file) {
      v["local"]["hosts_file"] = config.local.hosts_file.value();
    }
  }
};
} // namespace tao::json
