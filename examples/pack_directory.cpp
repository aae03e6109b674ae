#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include <bigarc/bigarc.hpp>

#include "tool_error.hpp"

namespace {

struct Options {
  bigarc::PackSettings settings;
  std::string inputDir;
  std::string outputPath;
  bool verbose = false;
};

void printUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " [--kind big4|bigf] [--order path|size] [--strip-prefix PREFIX]"
               " [--secret TEXT | --secret-file PATH] [--verbose] <input_dir> <output.big>\n";
}

std::optional<std::vector<uint8_t>> readWholeFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::variant<Options, tools::ToolError> parseArgs(int argc, char *argv[]) {
  Options options;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;

    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--kind" && hasValue) {
      std::string value = argv[++i];
      if (value == "big4" || value == "BIG4") {
        options.settings.kind = bigarc::Kind::Big4;
      } else if (value == "bigf" || value == "BIGF") {
        options.settings.kind = bigarc::Kind::BigF;
      } else {
        return tools::usageError(std::format("Unknown archive kind: {}", value));
      }
    } else if (arg == "--order" && hasValue) {
      std::string value = argv[++i];
      if (value == "path") {
        options.settings.ordering = bigarc::EntryOrder::Path;
      } else if (value == "size") {
        options.settings.ordering = bigarc::EntryOrder::SizeAscending;
      } else {
        return tools::usageError(std::format("Unknown entry order: {}", value));
      }
    } else if (arg == "--strip-prefix" && hasValue) {
      options.settings.stripPrefix = argv[++i];
    } else if (arg == "--secret" && hasValue) {
      std::string value = argv[++i];
      options.settings.secretData = std::vector<uint8_t>(value.begin(), value.end());
    } else if (arg == "--secret-file" && hasValue) {
      std::string path = argv[++i];
      auto data = readWholeFile(path);
      if (!data) {
        return tools::ToolError{tools::ExitIo, std::format("Failed to read {}", path)};
      }
      options.settings.secretData = std::move(*data);
    } else if (arg.starts_with("--")) {
      return tools::usageError(std::format("Unknown or incomplete option: {}", arg));
    } else {
      positional.push_back(std::move(arg));
    }
  }

  if (positional.size() != 2) {
    return tools::usageError("Expected <input_dir> and <output.big>");
  }

  options.inputDir = positional[0];
  options.outputPath = positional[1];
  return options;
}

} // namespace

int main(int argc, char *argv[]) {
  auto parsed = parseArgs(argc, argv);
  if (auto *error = std::get_if<tools::ToolError>(&parsed)) {
    tools::initLogging(false);
    printUsage(argv[0]);
    return tools::report(*error);
  }

  const auto &options = std::get<Options>(parsed);
  tools::initLogging(options.verbose);

  bigarc::Error error;
  bigarc::Packer packer;
  if (!packer.addDirectory(options.inputDir, &error)) {
    return tools::report(tools::fromLibrary(error, "Failed to collect input files"));
  }

  if (!packer.write(options.outputPath, options.settings, &error)) {
    return tools::report(tools::fromLibrary(error, "Failed to write archive"));
  }

  spdlog::info("Packed {} files into {}", packer.entryCount(), options.outputPath);
  return tools::ExitOk;
}
