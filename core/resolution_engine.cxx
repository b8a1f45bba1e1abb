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
#include "resolution_engine.hxx"

#include "core/logger/logger.hxx"

namespace devdns::core
{
resolution_engine::resolution_engine(std::shared_ptr<discovery::discovery_source> discovery,
                                     std::shared_ptr<local_table> local,
                                     std::shared_ptr<io::upstream> primary,
                                     std::shared_ptr<io::upstream> secondary)
  : discovery_{ std::move(discovery) }
  , local_{ std::move(local) }
  , primary_{ std::move(primary) }
  , secondary_{ std::move(secondary) }
{
}

void
resolution_engine::resolve(const std::string& hostname,
                           utils::movable_function<void(std::vector<resolution_answer>&&)>&& handler)
{
  if (discovery_) {
    if (auto address = discovery_->resolve(hostname); address) {
      DEVDNS_LOG_DEBUG("resolved \"{}\" from discovery: {}", hostname, address.value());
      return handler(std::vector<resolution_answer>{ { hostname, address.value(), answer_ttl } });
    }
  }

  if (local_) {
    if (auto address = local_->resolve(hostname); address) {
      DEVDNS_LOG_DEBUG("resolved \"{}\" from local table: {}", hostname, address.value());
      return handler(std::vector<resolution_answer>{ { hostname, address.value(), answer_ttl } });
    }
  }

  if (!primary_) {
    return resolve_with_secondary(hostname, std::move(handler));
  }

  primary_->resolve(
    hostname,
    [self = shared_from_this(), hostname, handler = std::move(handler)](io::upstream_result&& result) mutable {
      if (result.ec) {
        DEVDNS_LOG_ERROR("error primary dns response: {} - {}", self->primary_->address(), result.ec.message());
      }
      if (!result.answers.empty()) {
        DEVDNS_LOG_DEBUG("resolved \"{}\" from primary upstream {}: {} answer(s)",
                         hostname,
                         self->primary_->address(),
                         result.answers.size());
        return handler(std::move(result.answers));
      }
      return self->resolve_with_secondary(hostname, std::move(handler));
    });
}

void
resolution_engine::resolve_with_secondary(
  const std::string& hostname,
  utils::movable_function<void(std::vector<resolution_answer>&&)>&& handler)
{
  if (!secondary_) {
    DEVDNS_LOG_DEBUG("no source has answers for \"{}\"", hostname);
    return handler({});
  }

  secondary_->resolve(
    hostname,
    [self = shared_from_this(), hostname, handler = std::move(handler)](io::upstream_result&& result) mutable {
      if (result.ec) {
        DEVDNS_LOG_ERROR("error secondary dns response: {} - {}", self->secondary_->address(), result.ec.message());
      }
      if (!result.answers.empty()) {
        DEVDNS_LOG_DEBUG("resolved \"{}\" from secondary upstream {}: {} answer(s)",
                         hostname,
                         self->secondary_->address(),
                         result.answers.size());
      } else {
        DEVDNS_LOG_DEBUG("no source has answers for \"{}\"", hostname);
      }
      return handler(std::move(result.answers));
    });
}
} // namespace devdns::core
