#include <format>
#include <iostream>
#include <string_view>

#include <spdlog/spdlog.h>

#include <bigarc/bigarc.hpp>

#include "tool_error.hpp"

namespace {

int run(const char *path) {
  bigarc::Error error;
  auto archive = bigarc::Archive::open(path, &error);
  if (!archive) {
    return tools::report(tools::fromLibrary(error, path));
  }

  auto kind = archive->readKind(&error);
  auto totalSize = kind ? archive->readTotalSize(&error) : std::nullopt;
  auto entryCount = totalSize ? archive->readEntryCount(&error) : std::nullopt;
  auto dataStart = entryCount ? archive->readDataStart(&error) : std::nullopt;
  if (!dataStart) {
    return tools::report(tools::fromLibrary(error, "Failed to read header"));
  }

  auto entries = archive->readEntryList(&error);
  if (!entries) {
    return tools::report(tools::fromLibrary(error, "Failed to read entry table"));
  }

  auto table = archive->readEntryTable(&error);
  if (!table) {
    return tools::report(tools::fromLibrary(error, "Failed to read entry table"));
  }

  auto secret = archive->readSecretData(*table, &error);
  if (!secret && error) {
    return tools::report(tools::fromLibrary(error, "Failed to read secret data"));
  }
  if (table->size() != entries->size()) {
    spdlog::warn("{} duplicate entry names; their records are counted as secret data",
                 entries->size() - table->size());
  }

  std::cout << "Archive: " << path << "\n";
  std::cout << "  kind: " << bigarc::kindMagic(*kind) << "\n";
  std::cout << "  size: " << *totalSize << "\n";
  std::cout << "  entries: " << *entryCount << "\n";
  std::cout << std::format("  data start: 0x{:x}\n", *dataStart);
  std::cout << "  secret data: " << (secret ? secret->size() : 0) << " bytes\n\n";

  std::cout << "Entries:\n";
  for (const auto &entry : *entries) {
    std::cout << "  " << entry.name << "\n";
    std::cout << std::format("    offset: 0x{:x}\n", entry.offset);
    std::cout << "    length: " << entry.length << "\n";
  }

  return tools::ExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
  bool verbose = false;
  const char *path = nullptr;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (!path) {
      path = argv[i];
    } else {
      path = nullptr;
      break;
    }
  }

  tools::initLogging(verbose);

  if (!path) {
    std::cerr << "Usage: " << argv[0] << " [--verbose] <archive.big>\n";
    return tools::ExitUsage;
  }

  return run(path);
}
