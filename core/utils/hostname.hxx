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

namespace devdns::core::utils
{
/**
 * Canonical form of a hostname used as a lookup key: ASCII lower case, without the trailing dot of
 * a fully qualified name.
 */
auto
normalize_hostname(std::string_view name) -> std::string;

/**
 * @return true if the string is a dotted-quad IPv4 address
 */
auto
is_ipv4_address(std::string_view address) -> bool;
} // namespace devdns::core::utils
