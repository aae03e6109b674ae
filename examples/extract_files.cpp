#include <algorithm>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <bigarc/bigarc.hpp>

#include "tool_error.hpp"

namespace {

int run(const std::string &archivePath, const std::filesystem::path &outputDir,
        const std::vector<std::string> &names) {
  bigarc::Error error;
  auto archive = bigarc::Archive::open(archivePath, &error);
  if (!archive) {
    return tools::report(tools::fromLibrary(error, archivePath));
  }

  if (!archive->readKind(&error)) {
    return tools::report(tools::fromLibrary(error, archivePath));
  }

  auto entries = archive->readEntryList(&error);
  if (!entries) {
    return tools::report(tools::fromLibrary(error, "Failed to read entry table"));
  }

  std::error_code ec;
  std::filesystem::create_directories(outputDir, ec);
  if (ec) {
    return tools::report(tools::ToolError{
        tools::ExitIo, std::format("Failed to create {}: {}", outputDir.string(), ec.message())});
  }

  int extractedCount = 0;
  int failedCount = 0;
  for (const auto &entry : *entries) {
    if (!names.empty() && std::find(names.begin(), names.end(), entry.name) == names.end()) {
      continue;
    }

    auto outputPath = bigarc::Archive::destinationFor(outputDir, entry.name, &error);
    if (!outputPath) {
      spdlog::warn("Skipping {}: {}", entry.name, error.message);
      ++failedCount;
      continue;
    }
    if (!archive->extract(entry, *outputPath, &error)) {
      spdlog::error("Failed to extract {}: {}", entry.name, error.message);
      ++failedCount;
      continue;
    }
    spdlog::debug("Extracted {} ({} bytes)", entry.name, entry.length);
    ++extractedCount;
  }

  for (const auto &name : names) {
    auto found = std::find_if(entries->begin(), entries->end(),
                              [&name](const bigarc::EntryRecord &e) { return e.name == name; });
    if (found == entries->end()) {
      spdlog::warn("No entry named {}", name);
    }
  }

  spdlog::info("Extracted {} files to {}", extractedCount, outputDir.string());
  return failedCount == 0 ? tools::ExitOk : tools::ExitIo;
}

} // namespace

int main(int argc, char *argv[]) {
  bool verbose = false;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      positional.push_back(std::move(arg));
    }
  }

  tools::initLogging(verbose);

  if (positional.size() < 2) {
    std::cerr << "Usage: " << argv[0] << " [--verbose] <archive.big> <output_dir> [names...]\n";
    return tools::ExitUsage;
  }

  std::vector<std::string> names(positional.begin() + 2, positional.end());
  return run(positional[0], positional[1], names);
}
