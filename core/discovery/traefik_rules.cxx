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
#include "traefik_rules.hxx"

#include "core/utils/hostname.hxx"

#include <algorithm>
#include <cctype>

namespace devdns::core::discovery
{
namespace
{
constexpr std::string_view host_matcher{ "Host" };

auto
is_identifier_char(char c) -> bool
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

void
append_unique(std::vector<std::string>& names, std::string_view candidate)
{
  auto name = utils::normalize_hostname(candidate);
  if (name.empty()) {
    return;
  }
  if (std::find(names.begin(), names.end(), name) == names.end()) {
    names.emplace_back(std::move(name));
  }
}

/**
 * Parses the arguments of a matcher starting right after the opening parenthesis. Returns the
 * position after the closing parenthesis, or npos if the rule is truncated.
 */
auto
parse_matcher_arguments(std::string_view rule, std::size_t offset, std::vector<std::string>& names)
  -> std::size_t
{
  while (offset < rule.size()) {
    const char c = rule[offset];
    if (c == ')') {
      return offset + 1;
    }
    if (c == '`' || c == '"' || c == '\'') {
      auto end = rule.find(c, offset + 1);
      if (end == std::string_view::npos) {
        return std::string_view::npos;
      }
      append_unique(names, rule.substr(offset + 1, end - offset - 1));
      offset = end + 1;
      continue;
    }
    ++offset;
  }
  return std::string_view::npos;
}

void
parse_v1_rule(std::string_view rule, std::vector<std::string>& names)
{
  // Host:a.local,b.local;PathPrefix:/api
  for (auto segment_end = rule.find(';'); !rule.empty(); segment_end = rule.find(';')) {
    auto segment = rule.substr(0, segment_end);
    if (segment.substr(0, host_matcher.size() + 1) == "Host:") {
      segment.remove_prefix(host_matcher.size() + 1);
      while (!segment.empty()) {
        auto comma = segment.find(',');
        append_unique(names, segment.substr(0, comma));
        if (comma == std::string_view::npos) {
          break;
        }
        segment.remove_prefix(comma + 1);
      }
    }
    if (segment_end == std::string_view::npos) {
      break;
    }
    rule.remove_prefix(segment_end + 1);
  }
}
} // namespace

auto
is_router_rule_label(std::string_view label) -> bool
{
  if (label == frontend_rule_label) {
    return true;
  }
  return label.size() > router_label_prefix.size() + router_label_suffix.size() &&
         label.substr(0, router_label_prefix.size()) == router_label_prefix &&
         label.substr(label.size() - router_label_suffix.size()) == router_label_suffix;
}

auto
extract_host_names(std::string_view rule) -> std::vector<std::string>
{
  std::vector<std::string> names;

  auto first = rule.find_first_not_of(" \t");
  if (first != std::string_view::npos && rule.substr(first, host_matcher.size() + 1) == "Host:") {
    parse_v1_rule(rule.substr(first), names);
    return names;
  }

  std::size_t offset = 0;
  while (offset < rule.size()) {
    auto pos = rule.find(host_matcher, offset);
    if (pos == std::string_view::npos) {
      break;
    }
    offset = pos + host_matcher.size();
    if (pos > 0 && is_identifier_char(rule[pos - 1])) {
      continue;
    }
    auto open = offset;
    while (open < rule.size() && std::isspace(static_cast<unsigned char>(rule[open])) != 0) {
      ++open;
    }
    if (open >= rule.size() || rule[open] != '(') {
      // HostRegexp, HostSNI, HostHeader...
      continue;
    }
    offset = parse_matcher_arguments(rule, open + 1, names);
    if (offset == std::string_view::npos) {
      break;
    }
  }
  return names;
}
} // namespace devdns::core::discovery
