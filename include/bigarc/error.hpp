#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bigarc {

enum class ErrorCode : uint8_t {
  None = 0,
  InvalidMagic,       // First 4 bytes are not a recognized tag
  TruncatedHeader,    // Buffer too short for a header field
  TruncatedTable,     // Buffer too short for an entry record
  TruncatedName,      // Entry name runs past the end of the buffer
  OutOfBounds,        // Entry or secret data bounds exceed the buffer, or layout overflows u32
  AttemptCreateEmpty, // Zero-length buffer or zero entries
  UnsupportedKind,    // Kind is neither BIG4 nor BIGF
  Io,                 // Filesystem failure
};

std::string_view toString(ErrorCode code);

// Codec error, filled through the optional `Error *outError` parameter of library calls.
// A default-constructed Error means "no error".
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
  std::vector<uint8_t> magic; // Raw bytes for InvalidMagic
  std::string name;           // Offending entry name or path, where known

  explicit operator bool() const { return code != ErrorCode::None; }

  void clear() { *this = Error{}; }
};

namespace detail {

inline void setError(Error *outError, ErrorCode code, std::string message,
                     std::string name = {}) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
    outError->magic.clear();
    outError->name = std::move(name);
  }
}

inline void clearError(Error *outError) {
  if (outError) {
    outError->clear();
  }
}

} // namespace detail

} // namespace bigarc
