#include <bigarc/buffer.hpp>
#include <bigarc/mmap.hpp>

namespace bigarc {

std::optional<SharedBuffer> SharedBuffer::mapFile(const std::filesystem::path &path,
                                                  Error *outError) {
  MappedFile mappedFile;
  if (!mappedFile.openRead(path, outError)) {
    return std::nullopt;
  }

  auto owner = std::make_shared<const MappedFile>(std::move(mappedFile));
  auto data = owner->data();
  return SharedBuffer(std::move(owner), data);
}

SharedBuffer SharedBuffer::fromVector(std::vector<uint8_t> bytes) {
  auto owner = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
  std::span<const uint8_t> data(owner->data(), owner->size());
  return SharedBuffer(std::move(owner), data);
}

SharedBuffer SharedBuffer::copyOf(std::span<const uint8_t> bytes) {
  return fromVector(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

} // namespace bigarc
