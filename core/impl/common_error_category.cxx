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
struct common_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "devdns.common";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::common>(ev)) {
      case errc::common::request_canceled:
        return "request_canceled (2)";
      case errc::common::invalid_argument:
        return "invalid_argument (3)";
      case errc::common::parsing_failure:
        return "parsing_failure (8)";
      case errc::common::unambiguous_timeout:
        return "unambiguous_timeout (14)";
    }
    return "FIXME: unknown error code (recompile with newer library): devdns.common." +
           std::to_string(ev);
  }
};

const inline static common_error_category category_instance;

auto
common_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace devdns::core::impl
