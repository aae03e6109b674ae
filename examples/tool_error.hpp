#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include <bigarc/error.hpp>

namespace tools {

// Exit codes shared by the example tools
enum ExitCode : int {
  ExitOk = 0,
  ExitUsage = 1,
  ExitIo = 2,
  ExitBadArchive = 3,
};

// Presentation-level error owned by the tools
struct ToolError {
  int exitCode = ExitOk;
  std::string message;
};

inline ToolError usageError(std::string message) {
  return ToolError{ExitUsage, std::move(message)};
}

// Library errors are converted here and nowhere else
inline ToolError fromLibrary(const bigarc::Error &error, std::string_view context) {
  int exitCode = ExitBadArchive;
  switch (error.code) {
  case bigarc::ErrorCode::Io:
    exitCode = ExitIo;
    break;
  case bigarc::ErrorCode::UnsupportedKind:
    exitCode = ExitUsage;
    break;
  default:
    break;
  }
  return ToolError{exitCode, std::format("{}: {} [{}]", context, error.message,
                                         bigarc::toString(error.code))};
}

inline int report(const ToolError &error) {
  spdlog::error("{}", error.message);
  return error.exitCode;
}

inline void initLogging(bool verbose) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

} // namespace tools
