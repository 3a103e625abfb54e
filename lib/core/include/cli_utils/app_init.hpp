#pragma once

#include "internal_use_only/config.hpp"
#include <cli_utils/cli_parser.hpp>

#include <fmt/core.h>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace relay_feed::cli_utils {

/**
 * @brief Installs the default logger and applies the requested level.
 *
 * Logs go to stderr so that event output on stdout stays machine readable.
 * --verbose wins over --log-level.
 */
inline auto configure_logging(const cli_args &args) -> void
{
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (not args.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(platform::expand_tilde_path(args.log_file)));
  }

  auto logger = std::make_shared<spdlog::logger>("relay_feed", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);

  spdlog::set_level(spdlog::level::from_str(args.log_level));
  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_app_banner(const cli_args &args) -> void
{
  fmt::print(stderr, "Relay Feed v{}\n", relay_feed::cmake::project_version);
  fmt::print(stderr, "Relays: {}\n\n", args.relays.size());
}

}// namespace relay_feed::cli_utils
