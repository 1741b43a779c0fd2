#include "schema/schema_store.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace telemetry_hub::schema {

SchemaStore::SchemaStore(SchemaPtr initial) : current_(std::move(initial)) {
  if (current_.load() == nullptr) {
    throw std::invalid_argument("schema store requires an initial schema");
  }
}

SchemaPtr SchemaStore::current() const noexcept { return current_.load(std::memory_order_acquire); }

void SchemaStore::replace(SchemaPtr schema) noexcept {
  if (schema == nullptr) {
    return;
  }
  current_.store(std::move(schema), std::memory_order_release);
  generation_.fetch_add(1, std::memory_order_relaxed);
}

bool SchemaStore::reload(const std::string& path) {
  try {
    replace(load_schema_file(path));
  } catch (const SchemaError& ex) {
    std::cerr << "[schema] reload of " << path << " rejected, keeping version " << current()->version() << ": "
              << ex.what() << '\n';
    return false;
  }

  std::cerr << "[schema] loaded version " << current()->version() << " from " << path << '\n';
  return true;
}

bool SchemaStore::reload_from_text(const std::string& text) {
  try {
    replace(parse_schema(text));
  } catch (const SchemaError& ex) {
    std::cerr << "[schema] reload rejected, keeping version " << current()->version() << ": " << ex.what() << '\n';
    return false;
  }
  return true;
}

std::uint64_t SchemaStore::generation() const noexcept { return generation_.load(std::memory_order_relaxed); }

}  // namespace telemetry_hub::schema
