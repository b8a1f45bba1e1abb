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
#include "logger.hxx"

#include "configuration.hxx"

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace devdns::core::logger
{
namespace
{
constexpr auto logger_name{ "devdns" };

// [2024-06-01 10:00:00.123] [info] [4242] DNS server listening on 0.0.0.0:53, ...
constexpr auto log_pattern{ "[%Y-%m-%d %T.%e] [%^%l%$] [%P] %v" };

std::shared_ptr<spdlog::logger> current_logger{};

auto
current() -> std::shared_ptr<spdlog::logger>
{
  return std::atomic_load(&current_logger);
}

void
install(std::shared_ptr<spdlog::logger> logger)
{
  spdlog::drop(logger_name);
  if (logger) {
    logger->set_pattern(log_pattern);
    spdlog::register_logger(logger);
  }
  std::atomic_store(&current_logger, std::move(logger));
}

auto
translate_level(level lvl) -> spdlog::level::level_enum
{
  switch (lvl) {
    case level::trace:
      return spdlog::level::trace;
    case level::debug:
      return spdlog::level::debug;
    case level::info:
      return spdlog::level::info;
    case level::warn:
      return spdlog::level::warn;
    case level::err:
      return spdlog::level::err;
    case level::critical:
      return spdlog::level::critical;
    case level::off:
      return spdlog::level::off;
  }
  return spdlog::level::trace;
}

/*
 * devdns ──> dist_sink ──┬──> rotating file (when a file name is configured)
 *                        ├──> stderr with colors (when console output is enabled)
 *                        └──> custom sink (when given)
 *
 * Filtering happens in the logger, every sink accepts all levels.
 */
auto
make_dist_sink(const configuration& settings) -> std::shared_ptr<spdlog::sinks::dist_sink_mt>
{
  auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
  dist->set_level(spdlog::level::trace);
  if (!settings.filename.empty()) {
    dist->add_sink(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      settings.filename, settings.cycle_size, settings.max_files));
  }
  if (settings.console) {
    dist->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (settings.sink) {
    dist->add_sink(settings.sink);
  }
  return dist;
}
} // namespace

auto
level_from_str(const std::string& str) -> level
{
  switch (spdlog::level::from_str(str)) {
    case spdlog::level::trace:
      return level::trace;
    case spdlog::level::debug:
      return level::debug;
    case spdlog::level::info:
      return level::info;
    case spdlog::level::warn:
      return level::warn;
    case spdlog::level::err:
      return level::err;
    case spdlog::level::critical:
      return level::critical;
    case spdlog::level::off:
      return level::off;
    default:
      break;
  }
  return level::info;
}

auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>
{
  std::shared_ptr<spdlog::logger> logger{};
  try {
    logger = std::make_shared<spdlog::logger>(logger_name, make_dist_sink(logger_settings));
  } catch (const spdlog::spdlog_ex& e) {
    return std::string{ "unable to initialize logger: " } + e.what();
  }
  logger->set_level(translate_level(logger_settings.log_level));
  logger->flush_on(spdlog::level::warn);
  spdlog::flush_every(std::chrono::seconds{ 1 });
  install(std::move(logger));
  return {};
}

void
create_blackhole_logger()
{
  auto logger = std::make_shared<spdlog::logger>(logger_name, std::make_shared<spdlog::sinks::null_sink_mt>());
  logger->set_level(spdlog::level::off);
  install(std::move(logger));
}

void
create_console_logger()
{
  auto logger = std::make_shared<spdlog::logger>(logger_name, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  logger->set_level(spdlog::level::info);
  install(std::move(logger));
}

auto
get() -> spdlog::logger*
{
  return current().get();
}

auto
should_log(level lvl) -> bool
{
  auto logger = current();
  return logger != nullptr && logger->should_log(translate_level(lvl));
}

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg)
{
  if (auto logger = current(); logger != nullptr) {
    logger->log(spdlog::source_loc{ file, line, function }, translate_level(lvl), msg);
  }
}
} // namespace detail

void
flush()
{
  if (auto logger = current(); logger != nullptr) {
    logger->flush();
  }
}

void
shutdown()
{
  flush();
  install(nullptr);
  spdlog::shutdown();
}

auto
is_initialized() -> bool
{
  return current() != nullptr;
}
} // namespace devdns::core::logger
