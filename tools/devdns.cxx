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

#include "core/config_watcher.hxx"
#include "core/configuration.hxx"
#include "core/lifecycle_manager.hxx"
#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace
{
struct devdns_options {
  std::string config_path{};
  std::string log_level{};
  std::string log_file{};
};

auto
getenv_or_default(std::string_view var_name, const std::string& default_value) -> std::string
{
  if (const auto* val = std::getenv(var_name.data()); val != nullptr && val[0] != '\0') {
    return val;
  }
  return default_value;
}

auto
executable_directory(const char* argv0) -> std::filesystem::path
{
  std::error_code ec;
  auto path = std::filesystem::weakly_canonical(std::filesystem::path(argv0), ec);
  if (ec) {
    return {};
  }
  return path.parent_path();
}

auto
apply_logger_options(const devdns_options& options) -> bool
{
  devdns::core::logger::configuration configuration{};
  configuration.filename = options.log_file;
  configuration.log_level = devdns::core::logger::level_from_str(options.log_level);
  if (auto error = devdns::core::logger::create_file_logger(configuration); error) {
    std::cerr << error.value() << std::endl;
    return false;
  }
  return true;
}

void
log_bind_failure(const std::system_error& e, const devdns::core::configuration& config)
{
  DEVDNS_LOG_CRITICAL("host and port already in use, host: {}, port: {}", config.host, config.port);
  DEVDNS_LOG_DEBUG("bind failure: {}", e.what());
}
} // namespace

int
main(int argc, const char** argv)
{
  devdns_options options{};

  CLI::App app{ "DNS server for development environments.", "devdns" };
  app.add_option("--config", options.config_path, "Path to the configuration file.")
    ->transform(CLI::ExistingFile | CLI::NonexistentPath);
  const std::vector<std::string> allowed_log_levels{
    "trace", "debug", "info", "warning", "error", "critical", "off",
  };
  app
    .add_option("--log-level", options.log_level, "Log level. Also see DEVDNS_LOG_LEVEL environment variable.")
    ->default_val(getenv_or_default("DEVDNS_LOG_LEVEL", "info"))
    ->transform(CLI::IsMember(allowed_log_levels));
  app
    .add_option("--log-file", options.log_file, "File to write logs (when is not set, logs will be written to STDERR).")
    ->transform(CLI::ExistingFile | CLI::NonexistentPath);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  if (!apply_logger_options(options)) {
    return EXIT_FAILURE;
  }

  asio::io_context ctx;
  int exit_code = EXIT_SUCCESS;

  std::optional<std::string> explicit_path{};
  if (!options.config_path.empty()) {
    explicit_path = options.config_path;
  }
  auto config_path = devdns::core::locate_configuration_file(explicit_path, executable_directory(argv[0]));
  auto config = devdns::core::load_configuration(config_path);

  devdns::core::lifecycle_manager manager(ctx);
  std::shared_ptr<devdns::core::config_watcher> watcher{};
  asio::signal_set signals(ctx, SIGINT, SIGTERM);

  auto shutdown = [&]() {
    if (watcher) {
      watcher->close();
    }
    manager.stop();
    std::error_code ignore_ec;
    signals.cancel(ignore_ec);
  };

  manager.on_fatal([&](const std::system_error& e, const devdns::core::configuration& failed) {
    log_bind_failure(e, failed);
    exit_code = EXIT_FAILURE;
    shutdown();
  });

  if (!config || config->watch.enable) {
    auto interval = config ? config->watch.interval : devdns::core::watch_settings::default_interval;
    watcher = std::make_shared<devdns::core::config_watcher>(ctx, config_path, interval);
    watcher->start([&manager, config_path](devdns::core::config_event event) {
      manager.on_config_event(event, config_path);
    });
  }

  if (config) {
    try {
      manager.start(config.value());
    } catch (const std::system_error& e) {
      log_bind_failure(e, config.value());
      devdns::core::logger::shutdown();
      return EXIT_FAILURE;
    }
  }

  signals.async_wait([&](std::error_code ec, int signal_number) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    DEVDNS_LOG_INFO("received signal {}, shutting down", signal_number);
    shutdown();
  });

  ctx.run();

  devdns::core::logger::shutdown();
  return exit_code;
}
