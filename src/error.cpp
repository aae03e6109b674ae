#include <bigarc/error.hpp>

namespace bigarc {

std::string_view toString(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::InvalidMagic:
    return "InvalidMagic";
  case ErrorCode::TruncatedHeader:
    return "TruncatedHeader";
  case ErrorCode::TruncatedTable:
    return "TruncatedTable";
  case ErrorCode::TruncatedName:
    return "TruncatedName";
  case ErrorCode::OutOfBounds:
    return "OutOfBounds";
  case ErrorCode::AttemptCreateEmpty:
    return "AttemptCreateEmpty";
  case ErrorCode::UnsupportedKind:
    return "UnsupportedKind";
  case ErrorCode::Io:
    return "Io";
  }
  return "Unknown";
}

} // namespace bigarc
