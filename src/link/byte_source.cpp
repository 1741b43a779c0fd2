#include "link/byte_source.hpp"

namespace telemetry_hub::link {

const char* to_string(const LinkErrorKind kind) noexcept {
  switch (kind) {
    case LinkErrorKind::NONE:
      return "none";
    case LinkErrorKind::REFUSED:
      return "refused";
    case LinkErrorKind::DROPPED:
      return "dropped";
    case LinkErrorKind::TIMEOUT:
      return "timeout";
    case LinkErrorKind::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

}  // namespace telemetry_hub::link
