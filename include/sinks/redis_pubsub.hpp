#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "schema/schema_store.hpp"
#include "sinks/batch_sink.hpp"

struct redisContext;

namespace telemetry_hub::sinks {

struct RedisPubSubOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string channel{"telemetry:batches"};
  // Sensor catalog is stored here with SET whenever the schema changes.
  std::string catalog_key{"telemetry:catalog"};
  std::uint32_t connect_timeout_ms{1000};
};

// PUBLISH <channel> <batch json> per batch. Reconnects on the next publish
// after any failure.
class RedisPubSubSink final : public BatchSink {
 public:
  explicit RedisPubSubSink(RedisPubSubOptions options = {}, const schema::SchemaStore* schemas = nullptr);
  ~RedisPubSubSink() override;

  RedisPubSubSink(const RedisPubSubSink&) = delete;
  RedisPubSubSink& operator=(const RedisPubSubSink&) = delete;

  bool check_connectivity();
  bool publish(const model::ReadingBatch& batch, std::uint64_t gap) override;
  [[nodiscard]] std::string name() const override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool publish_catalog();
  bool run_command(const std::vector<std::string>& args);

  RedisPubSubOptions options_;
  const schema::SchemaStore* schemas_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::uint64_t catalog_generation_{0};
  bool catalog_published_{false};
};

}  // namespace telemetry_hub::sinks
