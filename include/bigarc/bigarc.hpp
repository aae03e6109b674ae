#pragma once

// bigarc
// A C++20 library for reading and writing BIG archives (BIG4 / BIGF), the container
// format used by many Electronic Arts games.

#include "archive.hpp"
#include "buffer.hpp"
#include "error.hpp"
#include "packer.hpp"
#include "source.hpp"
#include "types.hpp"

// The library has two halves:
//
// 1. Archive
//    - Zero-copy view over a memory-mapped file or an in-memory buffer
//    - Header fields and the entry table are decoded on demand, never cached
//    - Entry data is returned as a ByteView that keeps the buffer alive
//
// 2. Packer
//    - Collects (name, source) pairs from memory, files or a directory tree
//    - Computes the table layout and serializes a complete archive
//
// Errors are reported through an optional `Error *outError` parameter; functions return
// std::optional (or bool) and never throw for malformed archives.
//
// Example usage:
//
//   // Reading an archive
//   bigarc::Error error;
//   auto archive = bigarc::Archive::open("myfile.big", &error);
//   if (archive) {
//     auto table = archive->readEntryTable(&error);
//     if (table) {
//       auto bytes = archive->bytesOf(*table, "data/file.txt", &error);
//       if (bytes) {
//         // bytes->span() stays valid while `bytes` is alive
//       }
//     }
//   }
//
//   // Creating a new archive
//   bigarc::Packer packer;
//   packer.addFile("source.txt", "data/file.txt", &error);
//   bigarc::PackSettings settings;
//   settings.kind = bigarc::Kind::Big4;
//   packer.write("output.big", settings, &error);
