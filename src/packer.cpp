#include <algorithm>
#include <cstring>
#include <format>
#include <limits>
#include <numeric>

#include <spdlog/spdlog.h>

#include <bigarc/endian.hpp>
#include <bigarc/mmap.hpp>
#include <bigarc/packer.hpp>

namespace bigarc {

namespace {

constexpr uint64_t kMaxArchiveSize = std::numeric_limits<uint32_t>::max();

std::string stripPrefix(const std::string &name, const std::optional<std::string> &prefix) {
  if (prefix && !prefix->empty() && name.starts_with(*prefix)) {
    return name.substr(prefix->size());
  }
  return name;
}

} // namespace

void Packer::addData(std::span<const uint8_t> data, const std::string &name) {
  addSource(name, std::make_unique<MemorySource>(data));
}

bool Packer::addFile(const std::filesystem::path &sourcePath, const std::string &name,
                     Error *outError) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sourcePath, ec)) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Source file does not exist: {}", sourcePath.string()), name);
    return false;
  }

  uint64_t length = std::filesystem::file_size(sourcePath, ec);
  if (ec) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to get file size: {} ({})", sourcePath.string(),
                                 ec.message()),
                     name);
    return false;
  }

  addSource(name, std::make_unique<FileSource>(sourcePath, length));
  return true;
}

void Packer::addSource(const std::string &name, std::unique_ptr<ByteSource> source) {
  PendingEntry pending;
  pending.name = name;
  pending.source = std::move(source);
  pending_.push_back(std::move(pending));
}

bool Packer::addDirectory(const std::filesystem::path &root, Error *outError) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Not a directory: {}", root.string()), root.string());
    return false;
  }

  std::vector<std::filesystem::path> files;
  std::filesystem::recursive_directory_iterator it(root, ec);
  std::filesystem::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code statusEc;
    if (it->is_directory(statusEc)) {
      continue;
    }
    if (!it->is_regular_file(statusEc)) {
      spdlog::debug("Skipping non-regular file {}", it->path().string());
      continue;
    }
    files.push_back(it->path());
  }

  if (ec) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to traverse {}: {}", root.string(), ec.message()),
                     root.string());
    return false;
  }

  // Directory iteration order varies between filesystems
  std::sort(files.begin(), files.end());

  for (const auto &file : files) {
    if (!addFile(file, file.generic_string(), outError)) {
      return false;
    }
  }

  spdlog::debug("Collected {} files under {}", files.size(), root.string());
  return true;
}

std::optional<Packer::Plan> Packer::plan(const PackSettings &settings, Error *outError) const {
  if (kindMagic(settings.kind).empty()) {
    detail::setError(outError, ErrorCode::UnsupportedKind,
                     std::format("Unsupported archive kind: {}",
                                 static_cast<int>(settings.kind)));
    return std::nullopt;
  }

  if (pending_.empty()) {
    detail::setError(outError, ErrorCode::AttemptCreateEmpty,
                     "Cannot create archive with no entries");
    return std::nullopt;
  }

  std::vector<std::string> names;
  names.reserve(pending_.size());
  for (const auto &pending : pending_) {
    names.push_back(stripPrefix(pending.name, settings.stripPrefix));
  }

  // Stable, so ties keep the order entries were added in
  std::vector<size_t> order(pending_.size());
  std::iota(order.begin(), order.end(), 0);
  switch (settings.ordering) {
  case EntryOrder::Path:
    std::stable_sort(order.begin(), order.end(),
                     [&names](size_t a, size_t b) { return names[a] < names[b]; });
    break;
  case EntryOrder::SizeAscending:
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
      return pending_[a].source->length() < pending_[b].source->length();
    });
    break;
  }

  uint64_t table = 0;
  for (const auto &name : names) {
    // offset (4) + length (4) + name + NUL
    table += 8 + name.size() + 1;
  }

  uint64_t secretSize = settings.secretData ? settings.secretData->size() : 0;
  uint64_t dataStart = ArchiveHeader::headerSize + table + secretSize;

  Plan result;
  result.layout.records.reserve(order.size());
  result.sources.reserve(order.size());

  uint64_t offset = dataStart;
  for (size_t index : order) {
    const auto &pending = pending_[index];
    uint64_t length = pending.source->length();
    if (length > kMaxArchiveSize || offset + length > kMaxArchiveSize) {
      detail::setError(outError, ErrorCode::OutOfBounds,
                       std::format("Archive would exceed 4 GiB at entry {}", names[index]),
                       names[index]);
      return std::nullopt;
    }

    EntryRecord record;
    record.offset = static_cast<uint32_t>(offset);
    record.length = static_cast<uint32_t>(length);
    record.name = names[index];
    result.layout.records.push_back(std::move(record));
    result.sources.push_back(pending.source.get());

    offset += length;
  }

  if (dataStart > kMaxArchiveSize) {
    detail::setError(outError, ErrorCode::OutOfBounds, "Entry table exceeds 4 GiB");
    return std::nullopt;
  }

  result.layout.tableSize = static_cast<uint32_t>(table);
  result.layout.dataStart = static_cast<uint32_t>(dataStart);
  result.layout.totalSize = static_cast<uint32_t>(offset);

  spdlog::debug("Archive layout: {} entries, table {} bytes, data start {}, total {} bytes",
                result.layout.records.size(), result.layout.tableSize, result.layout.dataStart,
                result.layout.totalSize);
  return result;
}

bool Packer::emit(const Plan &plan, const PackSettings &settings, std::span<uint8_t> out,
                  Error *outError) {
  const auto &layout = plan.layout;
  if (out.size() != layout.totalSize) {
    detail::setError(outError, ErrorCode::OutOfBounds,
                     std::format("Output buffer holds {} bytes, archive needs {}", out.size(),
                                 layout.totalSize));
    return false;
  }

  // Step 1: Header
  size_t pos = 0;
  std::memcpy(out.data() + pos, kindMagic(settings.kind).data(), 4);
  pos += 4;
  storeLE32(out.data() + pos, layout.totalSize);
  pos += 4;
  storeBE32(out.data() + pos, static_cast<uint32_t>(layout.records.size()));
  pos += 4;
  storeBE32(out.data() + pos, layout.dataStart);
  pos += 4;

  // Step 2: Entry table
  for (const auto &record : layout.records) {
    storeBE32(out.data() + pos, record.offset);
    storeBE32(out.data() + pos + 4, record.length);
    pos += 8;
    std::memcpy(out.data() + pos, record.name.data(), record.name.size());
    pos += record.name.size();
    out[pos++] = '\0';
  }

  // Step 3: Secret data
  if (settings.secretData && !settings.secretData->empty()) {
    std::memcpy(out.data() + pos, settings.secretData->data(), settings.secretData->size());
    pos += settings.secretData->size();
  }

  // Step 4: Entry data, contiguous in table order
  for (size_t i = 0; i < layout.records.size(); ++i) {
    const auto &record = layout.records[i];
    if (!plan.sources[i]->copyTo(out.subspan(record.offset, record.length), record.name,
                                 outError)) {
      return false;
    }
  }

  return true;
}

std::optional<PackLayout> Packer::layout(const PackSettings &settings, Error *outError) const {
  auto result = plan(settings, outError);
  if (!result) {
    return std::nullopt;
  }
  return std::move(result->layout);
}

std::optional<std::vector<uint8_t>> Packer::build(const PackSettings &settings,
                                                  Error *outError) const {
  auto result = plan(settings, outError);
  if (!result) {
    return std::nullopt;
  }

  std::vector<uint8_t> out(result->layout.totalSize);
  if (!emit(*result, settings, out, outError)) {
    return std::nullopt;
  }
  return out;
}

std::optional<Archive> Packer::buildArchive(const PackSettings &settings, Error *outError) const {
  auto bytes = build(settings, outError);
  if (!bytes) {
    return std::nullopt;
  }
  return Archive::fromBuffer(SharedBuffer::fromVector(std::move(*bytes)), outError);
}

bool Packer::write(const std::filesystem::path &destPath, const PackSettings &settings,
                   Error *outError) const {
  auto result = plan(settings, outError);
  if (!result) {
    return false;
  }

  // Fill a sibling file; destPath is only replaced once the archive is complete
  std::filesystem::path partialPath = destPath;
  partialPath += ".partial";

  MappedFile outputFile;
  if (!outputFile.openWrite(partialPath, result->layout.totalSize, outError)) {
    return false;
  }

  if (!emit(*result, settings, outputFile.data(), outError) || !outputFile.flush(outError)) {
    outputFile.discard();
    return false;
  }
  outputFile.close();

  std::error_code ec;
  std::filesystem::rename(partialPath, destPath, ec);
  if (ec) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to move {} into place: {}", destPath.string(),
                                 ec.message()),
                     destPath.string());
    std::error_code removeEc;
    std::filesystem::remove(partialPath, removeEc);
    if (removeEc) {
      spdlog::warn("Failed to remove incomplete archive {}: {}", partialPath.string(),
                   removeEc.message());
    }
    return false;
  }

  spdlog::debug("Wrote {} ({} bytes, {} entries)", destPath.string(), result->layout.totalSize,
                result->layout.records.size());
  return true;
}

std::optional<std::vector<uint8_t>>
pack(const std::vector<std::pair<std::string, std::vector<uint8_t>>> &entries,
     const PackSettings &settings, Error *outError) {
  Packer packer;
  for (const auto &[name, data] : entries) {
    packer.addData(data, name);
  }
  return packer.build(settings, outError);
}

} // namespace bigarc
