// -----------------------------------------------------------------------------
// @file status.cpp
// @brief Names for EuidStatus values, used by the CLI error lines.
// -----------------------------------------------------------------------------
#include "euid/status.hpp"

namespace euid {

const char* status_name(EuidStatus status) {
  switch (status) {
    case EuidStatus::Ok:               return "ok";
    case EuidStatus::Overflow:         return "overflow";
    case EuidStatus::InvalidLength:    return "invalid_length";
    case EuidStatus::InvalidCharacter: return "invalid_character";
    case EuidStatus::ChecksumMismatch: return "checksum_mismatch";
  }
  return "unknown";
}

} // namespace euid
