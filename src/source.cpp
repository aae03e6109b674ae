#include <algorithm>
#include <format>
#include <fstream>

#include <bigarc/source.hpp>

namespace bigarc {

bool MemorySource::copyTo(std::span<uint8_t> dest, const std::string &name,
                          Error *outError) const {
  if (dest.size() != data_.size()) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Entry {} expected {} bytes, source holds {}", name, dest.size(),
                                 data_.size()),
                     name);
    return false;
  }
  std::copy(data_.begin(), data_.end(), dest.begin());
  return true;
}

bool FileSource::copyTo(std::span<uint8_t> dest, const std::string &name,
                        Error *outError) const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to open source file for {}: {}", name, path_.string()),
                     name);
    return false;
  }

  if (!in.read(reinterpret_cast<char *>(dest.data()), static_cast<std::streamsize>(dest.size()))) {
    detail::setError(outError, ErrorCode::Io,
                     std::format("Failed to read {} bytes for {} from {} (got {})", dest.size(),
                                 name, path_.string(), in.gcount()),
                     name);
    return false;
  }

  return true;
}

} // namespace bigarc
