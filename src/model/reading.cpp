#include "model/reading.hpp"

namespace telemetry_hub::model {

const char* to_string(const reading_fault fault) noexcept {
  switch (fault) {
    case reading_fault::NONE:
      return "none";
    case reading_fault::OUT_OF_RANGE:
      return "out_of_range";
    case reading_fault::TRUNCATED:
      return "truncated";
    case reading_fault::ABSENT:
      return "absent";
  }
  return "unknown";
}

}  // namespace telemetry_hub::model
