#include "sinks/redis_pubsub.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "sinks/batch_json.hpp"

namespace telemetry_hub::sinks {

RedisPubSubSink::RedisPubSubSink(RedisPubSubOptions options, const schema::SchemaStore* schemas)
    : options_(std::move(options)), schemas_(schemas) {
  command_argv_.reserve(3);
  command_argv_len_.reserve(3);
}

RedisPubSubSink::~RedisPubSubSink() = default;

void RedisPubSubSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisPubSubSink::check_connectivity() { return ensure_connected(); }

std::string RedisPubSubSink::name() const {
  if (!options_.unix_socket.empty()) {
    return "redis unix://" + options_.unix_socket + " " + options_.channel;
  }
  return "redis " + options_.host + ":" + std::to_string(options_.port) + " " + options_.channel;
}

bool RedisPubSubSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisPubSubSink::reconnect() {
  context_.reset();
  catalog_published_ = false;

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisPubSubSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }
  const bool ok = run_command({"AUTH", options_.password});
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  return ok;
}

bool RedisPubSubSink::select_db() {
  if (options_.db == 0) {
    return true;
  }
  return run_command({"SELECT", std::to_string(options_.db)});
}

bool RedisPubSubSink::publish_catalog() {
  if (schemas_ == nullptr || options_.catalog_key.empty()) {
    return true;
  }

  const std::uint64_t generation = schemas_->generation();
  if (catalog_published_ && generation == catalog_generation_) {
    return true;
  }

  const auto schema = schemas_->current();
  if (!run_command({"SET", options_.catalog_key, catalog_to_json(*schema).dump()})) {
    std::cerr << "[redis] catalog update failed for " << options_.catalog_key << '\n';
    return false;
  }
  catalog_generation_ = generation;
  catalog_published_ = true;
  return true;
}

bool RedisPubSubSink::publish(const model::ReadingBatch& batch, const std::uint64_t gap) {
  if (!ensure_connected()) {
    return false;
  }

  const std::string payload = serialize_batch(batch, gap);
  if (publish_catalog() && run_command({"PUBLISH", options_.channel, payload})) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_catalog() && run_command({"PUBLISH", options_.channel, payload});
}

bool RedisPubSubSink::run_command(const std::vector<std::string>& args) {
  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : args) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] " << args.front() << " rejected: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace telemetry_hub::sinks
