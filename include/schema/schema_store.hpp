#pragma once

#include <atomic>
#include <string>

#include "schema/schema.hpp"

namespace telemetry_hub::schema {

// Holds the active schema. Readers take a snapshot per operation; a reload
// builds a new Schema and swaps it in whole, or leaves the current one alone.
class SchemaStore {
 public:
  explicit SchemaStore(SchemaPtr initial);

  [[nodiscard]] SchemaPtr current() const noexcept;

  void replace(SchemaPtr schema) noexcept;
  bool reload(const std::string& path);
  bool reload_from_text(const std::string& text);

  [[nodiscard]] std::uint64_t generation() const noexcept;

 private:
  std::atomic<SchemaPtr> current_;
  std::atomic<std::uint64_t> generation_{0};
};

}  // namespace telemetry_hub::schema
