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

#include <devdns/error_codes.hxx>

#include <string>

namespace devdns::core::impl
{
struct discovery_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "devdns.discovery";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::discovery>(ev)) {
      case errc::discovery::orchestrator_unavailable:
        return "orchestrator_unavailable (1101)";
      case errc::discovery::unexpected_status:
        return "unexpected_status (1102)";
      case errc::discovery::malformed_payload:
        return "malformed_payload (1103)";
    }
    return "FIXME: unknown error code (recompile with newer library): devdns.discovery." +
           std::to_string(ev);
  }
};

const inline static discovery_error_category category_instance;

auto
discovery_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace devdns::core::impl
