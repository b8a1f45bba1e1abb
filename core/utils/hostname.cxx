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
#include "hostname.hxx"

#include <asio/ip/address_v4.hpp>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace devdns::core::utils
{
auto
normalize_hostname(std::string_view name) -> std::string
{
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back())) != 0) {
    name.remove_suffix(1);
  }
  while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front())) != 0) {
    name.remove_prefix(1);
  }
  if (!name.empty() && name.back() == '.') {
    name.remove_suffix(1);
  }
  std::string result{ name };
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

auto
is_ipv4_address(std::string_view address) -> bool
{
  std::error_code ec;
  asio::ip::make_address_v4(std::string{ address }, ec);
  return !ec;
}
} // namespace devdns::core::utils
