#pragma once

#include <cli_utils/cli_parser.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "internal_use_only/config.hpp"

namespace tether::cli_utils {

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_version() -> void
{
  fmt::print("{} v{}\n", tether::cmake::project_name, tether::cmake::project_version);
}

}// namespace tether::cli_utils
