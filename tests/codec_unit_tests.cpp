#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "codec/crc16.hpp"
#include "codec/frame_assembler.hpp"
#include "codec/frame_codec.hpp"
#include "model/frame.hpp"
#include "model/reading.hpp"
#include "schema/schema.hpp"
#include "schema/schema_store.hpp"

using telemetry_hub::codec::DecodeError;
using telemetry_hub::codec::EncodeError;
using telemetry_hub::codec::FrameAssembler;
using telemetry_hub::codec::SensorValues;
using telemetry_hub::codec::crc16_ccitt;
using telemetry_hub::codec::decode;
using telemetry_hub::codec::encode;
using telemetry_hub::codec::encode_pdu;
using telemetry_hub::codec::read_header;
using telemetry_hub::codec::seal_frame;
using telemetry_hub::model::Frame;
using telemetry_hub::model::FrameHeader;
using telemetry_hub::model::ReadingBatch;
using telemetry_hub::model::reading_fault;
using telemetry_hub::schema::FieldType;
using telemetry_hub::schema::Schema;
using telemetry_hub::schema::SchemaError;
using telemetry_hub::schema::SchemaPtr;
using telemetry_hub::schema::SchemaStore;
using telemetry_hub::schema::SensorDefinition;
using telemetry_hub::schema::load_schema_file;
using telemetry_hub::schema::parse_schema;

namespace {

constexpr std::uint64_t kTimestampMs = 1700000000000ULL;

const char* kVehicleSchema = R"({
  "version": 3,
  "sensors": {
    "rpm":         {"group": "Core",   "min": 0,      "max": 10000,  "type": "u16",
                    "emulation": {"rule": "sine", "amplitude": 5000, "offset": 5000, "period": 36}},
    "water_temp":  {"group": "Core",   "min": -20,    "max": 130,    "type": "i16", "scale": 0.1},
    "battery_mv":  {"group": "Power",  "min": 0,      "max": 16000,  "type": "u16"},
    "lambda":      {"group": "Engine", "min": 0.5,    "max": 1.5,    "type": "f32"},
    "odometer_m":  {"group": "Power",  "min": 0,      "max": 1e9,    "type": "f64"},
    "gear":        {"group": "Core",   "min": 0,      "max": 6,      "type": "u8"},
    "yaw_deg":     {"group": "Engine", "min": -100,   "max": 100,    "type": "i8"},
    "pressure_pa": {"group": "Engine", "min": 0,      "max": 200000, "type": "u32"},
    "accel_g":     {"group": "Core",   "min": -100,   "max": 100,    "type": "i32", "scale": 0.001},
    "downforce_n": {"group": "Aero",   "min": 0,      "max": 3000,   "type": "f32", "enable": false}
  }
})";

const char* kFramingSchema = R"({
  "version": 2, "start_byte": 126, "max_payload": 64,
  "sensors": {
    "rpm":        {"min": 0, "max": 10000, "type": "u16"},
    "battery_mv": {"min": 0, "max": 16000, "type": "u16"}
  }
})";

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool near(const double a, const double b, const double eps) { return std::fabs(a - b) <= eps; }

SensorValues full_vehicle_values() {
  return SensorValues{
      {"rpm", 7321.0},          {"water_temp", 87.3},   {"battery_mv", 12600.0},
      {"lambda", 0.987},        {"odometer_m", 123456.789}, {"gear", 4.0},
      {"yaw_deg", -42.0},       {"pressure_pa", 101325.0},  {"accel_g", -12.345},
  };
}

const telemetry_hub::model::Reading* find_reading(const ReadingBatch& batch, const std::string& id) {
  for (const auto& reading : batch.readings) {
    if (reading.sensor_id == id) {
      return &reading;
    }
  }
  return nullptr;
}

std::vector<std::uint8_t> payload_of(const Frame& frame) {
  const auto header = read_header(frame.bytes.data(), frame.bytes.size());
  const auto begin = frame.bytes.begin() + static_cast<std::ptrdiff_t>(telemetry_hub::model::kFrameHeaderSize);
  return std::vector<std::uint8_t>(begin, begin + header->payload_length);
}

int test_crc16_known_answer() {
  const char* check = "123456789";
  const auto crc = crc16_ccitt(reinterpret_cast<const std::uint8_t*>(check), std::strlen(check));
  if (crc != 0x29B1U) {
    return fail("test_crc16_known_answer", "CRC-16/CCITT-FALSE check value mismatch");
  }
  return 0;
}

int test_schema_load_and_lookup() {
  const SchemaPtr schema = parse_schema(kVehicleSchema);

  if (schema->version() != 3U || schema->start_byte() != 0x7EU || schema->max_payload() != 1024U) {
    return fail("test_schema_load_and_lookup", "header fields or defaults not applied");
  }
  if (schema->all().size() != 10U || schema->enabled_count() != 9U) {
    return fail("test_schema_load_and_lookup", "disabled sensor should be declared but not laid out");
  }
  if (schema->all().front().id != "rpm" || schema->all().back().id != "downforce_n") {
    return fail("test_schema_load_and_lookup", "declaration order not preserved");
  }
  const auto& pdu = schema->default_pdu();
  if (schema->pdus().size() != 1U || pdu.id != 0U || pdu.name != "all" || pdu.slots.size() != 9U) {
    return fail("test_schema_load_and_lookup", "catalog without pdus should get one implicit pdu");
  }
  if (pdu.bitmap_size() != 2U || pdu.payload_size != 2U + 28U) {
    return fail("test_schema_load_and_lookup", "unexpected payload layout size");
  }

  const SensorDefinition* rpm = schema->lookup("rpm");
  if (rpm == nullptr || rpm->type != FieldType::U16 || rpm->max != 10000.0 || rpm->name != "rpm") {
    return fail("test_schema_load_and_lookup", "rpm definition not parsed");
  }
  if (schema->lookup("missing") != nullptr) {
    return fail("test_schema_load_and_lookup", "unknown id should not resolve");
  }

  const auto groups = schema->groups();
  if (groups.size() != 3U || groups[0].name != "Core" || groups[1].name != "Power" || groups[2].name != "Engine") {
    return fail("test_schema_load_and_lookup", "groups should follow first appearance of enabled sensors");
  }
  if (groups[0].sensor_ids.size() != 4U || groups[0].sensor_ids[3] != "accel_g") {
    return fail("test_schema_load_and_lookup", "Core group membership wrong");
  }

  return 0;
}

int expect_schema_error(const char* name, const std::string& text, const SchemaError::Kind kind) {
  try {
    (void)parse_schema(text);
  } catch (const SchemaError& ex) {
    if (ex.kind() != kind) {
      std::cerr << "  got " << telemetry_hub::schema::to_string(ex.kind()) << ": " << ex.what() << '\n';
      return fail(name, "wrong SchemaError kind");
    }
    return 0;
  }
  return fail(name, "invalid schema should throw");
}

int test_schema_rejects_invalid_definitions() {
  const char* name = "test_schema_rejects_invalid_definitions";
  const std::string head = R"({"version": 1, "sensors": {)";

  if (int rc = expect_schema_error(name, "{not json", SchemaError::Kind::PARSE); rc != 0) return rc;
  if (int rc = expect_schema_error(name, R"({"sensors": {}})", SchemaError::Kind::MISSING_FIELD); rc != 0) return rc;
  if (int rc = expect_schema_error(name, head + R"("a": {"max": 1}}})", SchemaError::Kind::MISSING_FIELD); rc != 0)
    return rc;
  if (int rc = expect_schema_error(name, head + R"("a": {"min": 5, "max": 1}}})", SchemaError::Kind::INVALID_RANGE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(name, head + R"("a": {"min": 0, "max": 1, "type": "u128"}}})",
                                   SchemaError::Kind::UNKNOWN_TYPE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(name, head + R"("a": {"min": 0, "max": 300, "type": "u8"}}})",
                                   SchemaError::Kind::UNREPRESENTABLE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(name, head + R"("a": {"min": 0, "max": 1, "scale": 0}}})",
                                   SchemaError::Kind::INVALID_VALUE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(name, head + R"("a": {"min": 0, "max": 1, "emulation": {"rule": "eval"}}}})",
                                   SchemaError::Kind::INVALID_RULE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(
          name, head + R"("a": {"min": 0, "max": 1, "emulation": {"rule": "sine", "amplitude": 1, "period": 0}}}})",
          SchemaError::Kind::INVALID_RULE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(
          name, head + R"("a": {"min": 0, "max": 1, "emulation": {"rule": "uniform_random", "low": 2, "high": 1}}}})",
          SchemaError::Kind::INVALID_RULE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(name,
                                   R"({"version": 1, "max_payload": 4, "sensors": {
                                      "a": {"min": 0, "max": 1}, "b": {"min": 0, "max": 1}, "c": {"min": 0, "max": 1}}})",
                                   SchemaError::Kind::INVALID_VALUE);
      rc != 0)
    return rc;

  // Integer fields must be JSON integers within range.
  const std::string one = R"("sensors": {"a": {"min": 0, "max": 1}}})";
  for (const std::string& bad : {std::string(R"({"version": 1.5, )") + one,
                                 std::string(R"({"version": -1, )") + one,
                                 std::string(R"({"version": 4294967296, )") + one,
                                 std::string(R"({"version": 1, "start_byte": 1.5, )") + one,
                                 std::string(R"({"version": 1, "start_byte": 256, )") + one,
                                 std::string(R"({"version": 1, "max_payload": 1e30, )") + one,
                                 std::string(R"({"version": 1, "max_payload": 70000, )") + one,
                                 std::string(R"({"version": 1, "max_payload": 0, )") + one}) {
    if (int rc = expect_schema_error(name, bad, SchemaError::Kind::INVALID_VALUE); rc != 0) {
      std::cerr << "  input: " << bad << '\n';
      return rc;
    }
  }
  if (int rc = expect_schema_error(
          name, head + R"("a": {"min": 0, "max": 1, "emulation": {"rule": "linear", "slope": 1, "period": 2.5}}}})",
          SchemaError::Kind::INVALID_VALUE);
      rc != 0)
    return rc;
  if (int rc = expect_schema_error(
          name, head + R"("a": {"min": 0, "max": 1, "emulation": {"rule": "linear", "slope": 1, "period": -3}}}})",
          SchemaError::Kind::INVALID_VALUE);
      rc != 0)
    return rc;

  // Repeated keys are rejected instead of the last one winning.
  try {
    (void)parse_schema(head +
                       R"("rpm": {"min": 0, "max": 1}, "gear": {"min": 0, "max": 6}, "rpm": {"min": 0, "max": 2}}})");
    return fail(name, "repeated sensor key should throw");
  } catch (const SchemaError& ex) {
    if (ex.kind() != SchemaError::Kind::DUPLICATE_ID || ex.sensor_id() != "rpm") {
      return fail(name, "repeated sensor key should be a duplicate id naming the sensor");
    }
  }
  if (int rc = expect_schema_error(name, head + R"("a": {"min": 0, "max": 1, "min": 2}}})", SchemaError::Kind::PARSE);
      rc != 0)
    return rc;

  const std::string pdus_head = R"({"version": 1, "sensors": {"a": {"min": 0, "max": 1}, "b": {"min": 0, "max": 1}},
                                    "pdus": )";
  for (const char* bad_pdus : {R"({"x": {"id": 1, "sensors": ["a"]}, "y": {"id": 1, "sensors": ["b"]}}})",
                               R"({"x": {"id": 1, "sensors": ["a", "zz"]}}})",
                               R"({"x": {"id": 1, "sensors": []}}})",
                               R"({"x": {"id": 1, "sensors": ["a", "a"]}}})",
                               R"({"x": {"id": 1}}})",
                               R"(["a", "b"]})"}) {
    if (int rc = expect_schema_error(name, pdus_head + bad_pdus, SchemaError::Kind::INVALID_PDU); rc != 0) {
      std::cerr << "  pdus: " << bad_pdus << '\n';
      return rc;
    }
  }
  if (int rc = expect_schema_error(name, pdus_head + R"({"x": {"id": 256, "sensors": ["a"]}}})",
                                   SchemaError::Kind::INVALID_VALUE);
      rc != 0)
    return rc;
  if (int rc =
          expect_schema_error(name, pdus_head + R"({"x": {"sensors": ["a"]}}})", SchemaError::Kind::MISSING_FIELD);
      rc != 0)
    return rc;

  SensorDefinition first{};
  first.id = "rpm";
  first.max = 100.0;
  SensorDefinition duplicate = first;
  try {
    Schema schema(1, 0x7E, 64, {first, duplicate});
    return fail(name, "duplicate id should throw");
  } catch (const SchemaError& ex) {
    if (ex.kind() != SchemaError::Kind::DUPLICATE_ID || ex.sensor_id() != "rpm") {
      return fail(name, "duplicate id should name the sensor");
    }
  }

  SensorDefinition unnamed = first;
  unnamed.id.clear();
  try {
    Schema schema(1, 0x7E, 64, {unnamed});
    return fail(name, "empty id should throw");
  } catch (const SchemaError& ex) {
    if (ex.kind() != SchemaError::Kind::EMPTY_ID) {
      return fail(name, "empty id reported with wrong kind");
    }
  }

  return 0;
}

int test_round_trip_within_declared_precision() {
  const SchemaPtr schema = parse_schema(kVehicleSchema);
  const SensorValues values = full_vehicle_values();

  EncodeError encode_error{};
  const auto frame = encode(values, *schema, 42, kTimestampMs, &encode_error);
  if (!frame.has_value()) {
    return fail("test_round_trip_within_declared_precision", "encode of in-range values failed");
  }
  if (frame->bytes.size() != telemetry_hub::model::kFrameOverhead + schema->default_pdu().payload_size) {
    return fail("test_round_trip_within_declared_precision", "frame size does not match layout");
  }

  DecodeError decode_error{};
  const auto batch = decode(*frame, *schema, &decode_error);
  if (!batch.has_value()) {
    return fail("test_round_trip_within_declared_precision", "decode of fresh frame failed");
  }
  if (batch->sequence != 42U || batch->timestamp_ms != kTimestampMs || batch->schema_version != 3U) {
    return fail("test_round_trip_within_declared_precision", "header fields not carried into batch");
  }
  if (batch->readings.size() != 9U || find_reading(*batch, "downforce_n") != nullptr) {
    return fail("test_round_trip_within_declared_precision", "batch should carry exactly the enabled sensors");
  }

  for (const auto& reading : batch->readings) {
    const SensorDefinition* definition = schema->lookup(reading.sensor_id);
    const double expected = values.at(reading.sensor_id);
    if (!reading.valid || reading.fault != reading_fault::NONE || reading.timestamp_ms != kTimestampMs) {
      return fail("test_round_trip_within_declared_precision", "in-range reading marked invalid");
    }

    double tolerance = 0.0;
    if (definition->type == FieldType::F32) {
      tolerance = std::fabs(expected) * 1e-6;
    } else if (definition->type != FieldType::F64) {
      tolerance = (std::fabs(definition->scale) / 2.0) + 1e-9;
    }
    if (!near(reading.value, expected, tolerance)) {
      std::cerr << "  " << reading.sensor_id << " decoded " << reading.value << " expected " << expected << '\n';
      return fail("test_round_trip_within_declared_precision", "value outside declared precision");
    }
  }

  return 0;
}

int test_partial_frame_marks_missing_fields_truncated() {
  const SchemaPtr schema = parse_schema(kVehicleSchema);
  const auto frame = encode(full_vehicle_values(), *schema, 7, kTimestampMs);
  if (!frame.has_value()) {
    return fail("test_partial_frame_marks_missing_fields_truncated", "encode failed");
  }

  // Bitmap plus rpm, water_temp and battery_mv.
  auto payload = payload_of(*frame);
  payload.resize(schema->default_pdu().bitmap_size() + 6U);
  const FrameHeader header{schema->start_byte(), schema->wire_version(), 0, 7, kTimestampMs, 0};
  const Frame truncated = seal_frame(header, payload);

  DecodeError error{};
  const auto batch = decode(truncated, *schema, &error);
  if (!batch.has_value()) {
    return fail("test_partial_frame_marks_missing_fields_truncated", "short payload should still decode");
  }
  if (batch->readings.size() != schema->enabled_count()) {
    return fail("test_partial_frame_marks_missing_fields_truncated", "every slot should produce a reading");
  }

  for (std::size_t i = 0; i < batch->readings.size(); ++i) {
    const auto& reading = batch->readings[i];
    if (i < 3U) {
      if (!reading.valid) {
        return fail("test_partial_frame_marks_missing_fields_truncated", "fields that fit should stay valid");
      }
      continue;
    }
    if (reading.valid || reading.fault != reading_fault::TRUNCATED || !std::isnan(reading.value)) {
      return fail("test_partial_frame_marks_missing_fields_truncated", "fields past the payload must be truncated");
    }
  }

  const auto empty = decode(seal_frame(header, {}), *schema, &error);
  if (!empty.has_value() || empty->readings.size() != schema->enabled_count()) {
    return fail("test_partial_frame_marks_missing_fields_truncated", "empty payload should decode to all-invalid");
  }
  for (const auto& reading : empty->readings) {
    if (reading.valid || reading.fault != reading_fault::TRUNCATED) {
      return fail("test_partial_frame_marks_missing_fields_truncated", "empty payload readings must be truncated");
    }
  }

  return 0;
}

int test_out_of_range_field_only_invalidates_itself() {
  const SchemaPtr schema = parse_schema(kVehicleSchema);
  SensorValues values = full_vehicle_values();
  values["rpm"] = 15000.0;

  const auto frame = encode(values, *schema, 1, kTimestampMs);
  if (!frame.has_value()) {
    return fail("test_out_of_range_field_only_invalidates_itself", "encode does not check bounds");
  }

  const auto batch = decode(*frame, *schema);
  if (!batch.has_value()) {
    return fail("test_out_of_range_field_only_invalidates_itself", "out-of-range field must not drop the batch");
  }

  const auto* rpm = find_reading(*batch, "rpm");
  if (rpm == nullptr || rpm->valid || rpm->fault != reading_fault::OUT_OF_RANGE || rpm->value != 15000.0) {
    return fail("test_out_of_range_field_only_invalidates_itself", "rpm should be invalid and keep its value");
  }
  for (const auto& reading : batch->readings) {
    if (reading.sensor_id != "rpm" && !reading.valid) {
      return fail("test_out_of_range_field_only_invalidates_itself", "sibling fields must stay valid");
    }
  }

  return 0;
}

int test_absent_sensors_and_trailing_bytes() {
  const SchemaPtr schema = parse_schema(kVehicleSchema);
  const auto frame = encode(SensorValues{{"rpm", 3000.0}, {"downforce_n", 100.0}}, *schema, 5, kTimestampMs);
  if (!frame.has_value()) {
    return fail("test_absent_sensors_and_trailing_bytes", "disabled sensor value should be skipped, not rejected");
  }

  auto payload = payload_of(*frame);
  payload.insert(payload.end(), {0xDE, 0xAD, 0xBE, 0xEF});
  const FrameHeader header{schema->start_byte(), schema->wire_version(), 0, 5, kTimestampMs, 0};
  const auto batch = decode(seal_frame(header, payload), *schema);
  if (!batch.has_value() || batch->readings.size() != schema->enabled_count()) {
    return fail("test_absent_sensors_and_trailing_bytes", "trailing payload bytes should be ignored");
  }

  for (const auto& reading : batch->readings) {
    if (reading.sensor_id == "rpm") {
      if (!reading.valid || reading.value != 3000.0) {
        return fail("test_absent_sensors_and_trailing_bytes", "present sensor should decode");
      }
      continue;
    }
    if (reading.valid || reading.fault != reading_fault::ABSENT || !std::isnan(reading.value)) {
      return fail("test_absent_sensors_and_trailing_bytes", "unset presence bit should read as absent");
    }
  }

  return 0;
}

int test_integrity_and_version_failures_drop_frame() {
  const SchemaPtr schema = parse_schema(kVehicleSchema);
  const auto frame = encode(full_vehicle_values(), *schema, 9, kTimestampMs);
  if (!frame.has_value()) {
    return fail("test_integrity_and_version_failures_drop_frame", "encode failed");
  }

  DecodeError error{};
  Frame corrupted = *frame;
  corrupted.bytes[telemetry_hub::model::kFrameHeaderSize + 3U] ^= 0x5AU;
  if (decode(corrupted, *schema, &error).has_value() || error.kind != DecodeError::Kind::INTEGRITY) {
    return fail("test_integrity_and_version_failures_drop_frame", "crc mismatch should be an integrity error");
  }

  Frame bad_header = *frame;
  bad_header.bytes[4] ^= 0x01U;
  if (decode(bad_header, *schema, &error).has_value() || error.kind != DecodeError::Kind::INTEGRITY) {
    return fail("test_integrity_and_version_failures_drop_frame", "header crc mismatch should be an integrity error");
  }

  Frame bad_marker = *frame;
  bad_marker.bytes[0] = 0x55;
  if (decode(bad_marker, *schema, &error).has_value() || error.kind != DecodeError::Kind::INTEGRITY) {
    return fail("test_integrity_and_version_failures_drop_frame", "bad start byte should be an integrity error");
  }

  Frame padded = *frame;
  padded.bytes.push_back(0x00);
  if (decode(padded, *schema, &error).has_value() || error.kind != DecodeError::Kind::INTEGRITY) {
    return fail("test_integrity_and_version_failures_drop_frame", "bytes past the trailer are an integrity error");
  }

  Frame headless = *frame;
  headless.bytes.resize(telemetry_hub::model::kFrameHeaderSize - 1U);
  if (decode(headless, *schema, &error).has_value() || error.kind != DecodeError::Kind::INTEGRITY) {
    return fail("test_integrity_and_version_failures_drop_frame", "short header should be an integrity error");
  }

  std::string newer(kVehicleSchema);
  newer.replace(newer.find("\"version\": 3"), std::strlen("\"version\": 3"), "\"version\": 4");
  const SchemaPtr next_schema = parse_schema(newer);
  if (decode(*frame, *next_schema, &error).has_value() || error.kind != DecodeError::Kind::VERSION_MISMATCH) {
    return fail("test_integrity_and_version_failures_drop_frame", "frames of another layout version must be rejected");
  }

  const FrameHeader stray{schema->start_byte(), schema->wire_version(), 9, 1, kTimestampMs, 0};
  if (decode(seal_frame(stray, {}), *schema, &error).has_value() || error.kind != DecodeError::Kind::UNKNOWN_PDU) {
    return fail("test_integrity_and_version_failures_drop_frame", "undeclared pdu id must be rejected");
  }

  return 0;
}

int test_cut_off_frame_keeps_fields_that_arrived() {
  const char* name = "test_cut_off_frame_keeps_fields_that_arrived";
  const SchemaPtr schema = parse_schema(kVehicleSchema);
  const auto frame = encode(full_vehicle_values(), *schema, 12, kTimestampMs);
  if (!frame.has_value()) {
    return fail(name, "encode failed");
  }

  // Trailer gone and the last two bytes of accel_g with it.
  Frame cut = *frame;
  cut.bytes.resize(cut.bytes.size() - 4U);
  DecodeError error{};
  const auto batch = decode(cut, *schema, &error);
  if (!batch.has_value()) {
    std::cerr << "  " << error.detail << '\n';
    return fail(name, "cut-off frame should still produce a batch");
  }
  if (batch->sequence != 12U || batch->readings.size() != schema->enabled_count()) {
    return fail(name, "header fields and slot count should survive the cut");
  }
  for (const auto& reading : batch->readings) {
    const bool lost = reading.sensor_id == "accel_g";
    if (lost && (reading.valid || reading.fault != reading_fault::TRUNCATED)) {
      return fail(name, "slot past the cut must be truncated");
    }
    if (!lost && (!reading.valid || reading.fault != reading_fault::NONE)) {
      return fail(name, "slots before the cut must stay valid");
    }
  }

  // Only one trailer byte lost: the payload is whole.
  Frame short_trailer = *frame;
  short_trailer.bytes.pop_back();
  const auto whole = decode(short_trailer, *schema);
  if (!whole.has_value() || !whole->readings.back().valid) {
    return fail(name, "payload that arrived in full should decode in full");
  }

  Frame header_only = *frame;
  header_only.bytes.resize(telemetry_hub::model::kFrameHeaderSize);
  const auto empty = decode(header_only, *schema);
  if (!empty.has_value() || empty->readings.size() != schema->enabled_count()) {
    return fail(name, "header without payload should decode to all-truncated");
  }
  for (const auto& reading : empty->readings) {
    if (reading.valid || reading.fault != reading_fault::TRUNCATED || !std::isnan(reading.value)) {
      return fail(name, "every slot of a header-only frame is truncated");
    }
  }

  return 0;
}

int test_wire_bytes_are_little_endian() {
  const char* name = "test_wire_bytes_are_little_endian";
  const SchemaPtr schema = parse_schema(kFramingSchema);
  const auto frame = encode(SensorValues{{"rpm", 1234.0}, {"battery_mv", 12600.0}}, *schema, 10, kTimestampMs);
  if (!frame.has_value()) {
    return fail(name, "encode failed");
  }

  const std::vector<std::uint8_t> expected = {
      0x7E, 0x02, 0x00,                                // start, version, pdu
      0x0A, 0x00, 0x00, 0x00,                          // sequence 10
      0x00, 0x68, 0xE5, 0xCF, 0x8B, 0x01, 0x00, 0x00,  // 1700000000000 ms
      0x05, 0x00,                                      // payload length
      0xF0, 0x72,                                      // header crc 0x72F0
      0x03, 0xD2, 0x04, 0x38, 0x31,                    // bitmap, rpm 1234, battery_mv 12600
      0x4D, 0x49,                                      // crc 0x494D
  };
  if (frame->bytes != expected) {
    return fail(name, "frame bytes differ from the little-endian wire layout");
  }

  const auto header = read_header(expected.data(), expected.size());
  if (!header.has_value() || header->sequence != 10U || header->timestamp_ms != kTimestampMs ||
      header->payload_length != 5U || !telemetry_hub::codec::header_intact(expected.data(), expected.size())) {
    return fail(name, "header fields should read back from fixed offsets");
  }

  return 0;
}

int test_min_and_max_round_trip_for_every_type() {
  const char* name = "test_min_and_max_round_trip_for_every_type";
  const SchemaPtr schema = parse_schema(R"({
    "version": 6,
    "sensors": {
      "u8_offset": {"min": -40,   "max": 215,   "type": "u8", "offset": -40},
      "u8_scaled": {"min": 0,     "max": 25.5,  "type": "u8", "scale": 0.1},
      "i8_scaled": {"min": -12.8, "max": 12.7,  "type": "i8", "scale": 0.1},
      "tps":       {"min": 0,     "max": 0.3,   "type": "u16", "scale": 0.1},
      "i16_temp":  {"min": -20,   "max": 130,   "type": "i16", "scale": 0.1},
      "u32_cents": {"min": 0.5,   "max": 99.99, "type": "u32", "scale": 0.01},
      "i32_milli": {"min": -100,  "max": 100,   "type": "i32", "scale": 0.001},
      "lambda":    {"min": 0.5,   "max": 1.1,   "type": "f32"},
      "f64_tenth": {"min": -0.1,  "max": 0.7,   "type": "f64", "scale": 0.1}
    }
  })");

  for (const bool at_max : {false, true}) {
    SensorValues values;
    for (const auto& definition : schema->all()) {
      values[definition.id] = at_max ? definition.max : definition.min;
    }

    const auto frame = encode(values, *schema, 1, kTimestampMs);
    if (!frame.has_value()) {
      return fail(name, "bounds should always be encodable");
    }
    const auto batch = decode(*frame, *schema);
    if (!batch.has_value() || batch->readings.size() != schema->all().size()) {
      return fail(name, "bounds frame should decode");
    }

    for (const auto& reading : batch->readings) {
      const SensorDefinition* definition = schema->lookup(reading.sensor_id);
      const double expected = values.at(reading.sensor_id);
      if (!reading.valid || reading.fault != reading_fault::NONE) {
        std::cerr << "  " << reading.sensor_id << " decoded " << reading.value << " at "
                  << (at_max ? "max" : "min") << '\n';
        return fail(name, "declared bound came back out of range");
      }
      double tolerance = (std::fabs(definition->scale) / 2.0) + 1e-9;
      if (definition->type == FieldType::F32) {
        tolerance = std::fabs(expected) * 1e-6;
      } else if (definition->type == FieldType::F64) {
        tolerance = 1e-12;
      }
      if (!near(reading.value, expected, tolerance)) {
        return fail(name, "declared bound lost precision");
      }
    }
  }

  SensorValues over{{"tps", 0.4}};
  const auto batch = decode(*encode(over, *schema, 2, kTimestampMs), *schema);
  if (!batch.has_value() || find_reading(*batch, "tps")->fault != reading_fault::OUT_OF_RANGE) {
    return fail(name, "one step past max must be out of range");
  }

  return 0;
}

const char* kPduSchema = R"({
  "version": 4,
  "sensors": {
    "rpm":         {"group": "Core",   "min": 0,   "max": 10000, "type": "u16"},
    "water_temp":  {"group": "Core",   "min": -20, "max": 130,   "type": "i16", "scale": 0.1},
    "battery_mv":  {"group": "Power",  "min": 0,   "max": 16000, "type": "u16"},
    "downforce_n": {"group": "Aero",   "min": 0,   "max": 3000,  "type": "f32", "enable": false},
    "lambda":      {"group": "Engine", "min": 0.5, "max": 1.5,   "type": "f32"}
  },
  "pdus": {
    "fast": {"id": 1, "sensors": ["rpm", "water_temp"]},
    "slow": {"id": 7, "sensors": ["battery_mv", "downforce_n", "rpm"]}
  }
})";

int test_pdus_carry_their_own_sensor_subsets() {
  const char* name = "test_pdus_carry_their_own_sensor_subsets";
  const SchemaPtr schema = parse_schema(kPduSchema);

  if (schema->pdus().size() != 2U || schema->default_pdu().id != 1U || schema->default_pdu().name != "fast") {
    return fail(name, "pdus should be kept in declaration order");
  }
  const auto* slow = schema->find_pdu(7);
  if (slow == nullptr || slow->slots.size() != 2U || schema->slot(*slow, 0).id != "rpm" ||
      schema->slot(*slow, 1).id != "battery_mv" || slow->payload_size != 1U + 4U) {
    return fail(name, "pdu layout should hold its enabled sensors in declaration order");
  }
  if (schema->find_pdu(2) != nullptr) {
    return fail(name, "undeclared pdu id should not resolve");
  }

  const SensorValues values{{"rpm", 4000.0}, {"water_temp", 90.5}, {"battery_mv", 12400.0}, {"lambda", 1.0}};
  const auto fast = decode(*encode(values, *schema, 1, kTimestampMs), *schema);
  if (!fast.has_value() || fast->pdu_id != 1U || fast->readings.size() != 2U ||
      fast->readings[1].sensor_id != "water_temp" || !fast->readings[1].valid) {
    return fail(name, "default encode should use the first pdu");
  }

  EncodeError error{};
  const auto slow_frame = encode_pdu(values, *schema, 7, 2, kTimestampMs, &error);
  if (!slow_frame.has_value()) {
    return fail(name, "values outside the pdu should be skipped");
  }
  if (slow_frame->bytes[2] != 7U) {
    return fail(name, "pdu id should be carried in the envelope");
  }
  const auto slow_batch = decode(*slow_frame, *schema);
  if (!slow_batch.has_value() || slow_batch->pdu_id != 7U || slow_batch->readings.size() != 2U ||
      slow_batch->readings[1].sensor_id != "battery_mv" || slow_batch->readings[1].value != 12400.0) {
    return fail(name, "slow pdu should decode against its own layout");
  }

  if (encode_pdu(values, *schema, 3, 3, kTimestampMs, &error).has_value() ||
      error.kind != EncodeError::Kind::UNKNOWN_PDU) {
    return fail(name, "encoding into an undeclared pdu should fail");
  }
  if (encode_pdu(SensorValues{{"boost_kpa", 1.0}}, *schema, 7, 3, kTimestampMs, &error).has_value() ||
      error.kind != EncodeError::Kind::UNKNOWN_SENSOR) {
    return fail(name, "unknown sensors should still be rejected");
  }

  const SchemaPtr single = parse_schema(R"({"version": 4, "sensors": {"rpm": {"min": 0, "max": 10000}}})");
  DecodeError decode_error{};
  if (decode(*slow_frame, *single, &decode_error).has_value() ||
      decode_error.kind != DecodeError::Kind::UNKNOWN_PDU) {
    return fail(name, "frame of a pdu the schema lacks should be rejected");
  }

  return 0;
}

int test_encode_errors_produce_no_frame() {
  const SchemaPtr schema = parse_schema(kVehicleSchema);

  EncodeError error{};
  if (encode(SensorValues{{"boost_kpa", 1.0}}, *schema, 0, kTimestampMs, &error).has_value() ||
      error.kind != EncodeError::Kind::UNKNOWN_SENSOR || error.sensor_id != "boost_kpa") {
    return fail("test_encode_errors_produce_no_frame", "unknown sensor id should fail");
  }

  if (encode(SensorValues{{"gear", 300.0}}, *schema, 0, kTimestampMs, &error).has_value() ||
      error.kind != EncodeError::Kind::UNREPRESENTABLE || error.sensor_id != "gear") {
    return fail("test_encode_errors_produce_no_frame", "value wider than u8 should fail");
  }

  if (encode(SensorValues{{"rpm", std::nan("")}}, *schema, 0, kTimestampMs, &error).has_value() ||
      error.kind != EncodeError::Kind::UNREPRESENTABLE) {
    return fail("test_encode_errors_produce_no_frame", "NaN should not be encodable in an integer slot");
  }

  return 0;
}

bool same_batch(const ReadingBatch& a, const ReadingBatch& b) {
  if (a.sequence != b.sequence || a.schema_version != b.schema_version || a.timestamp_ms != b.timestamp_ms ||
      a.readings.size() != b.readings.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.readings.size(); ++i) {
    const auto& x = a.readings[i];
    const auto& y = b.readings[i];
    const bool same_value = (std::isnan(x.value) && std::isnan(y.value)) || x.value == y.value;
    if (x.sensor_id != y.sensor_id || !same_value || x.valid != y.valid || x.fault != y.fault) {
      return false;
    }
  }
  return true;
}

int test_reloading_identical_schema_is_idempotent() {
  const auto path = std::filesystem::temp_directory_path() / "telemetry_hub_idempotent_schema.json";
  {
    std::ofstream out(path);
    out << kVehicleSchema;
  }

  const SchemaPtr first = load_schema_file(path.string());
  const SchemaPtr second = load_schema_file(path.string());
  std::filesystem::remove(path);

  SensorValues values = full_vehicle_values();
  values.erase("lambda");
  values["rpm"] = 12000.0;
  const auto frame = encode(values, *first, 77, kTimestampMs);
  if (!frame.has_value()) {
    return fail("test_reloading_identical_schema_is_idempotent", "encode failed");
  }

  const auto a = decode(*frame, *first);
  const auto b = decode(*frame, *second);
  if (!a.has_value() || !b.has_value() || !same_batch(*a, *b)) {
    return fail("test_reloading_identical_schema_is_idempotent", "identical schemas decoded differently");
  }

  const SchemaPtr shipped = load_schema_file("configs/sensors.json");
  if (shipped->pdus().size() != 2U || shipped->find_pdu(1) == nullptr || shipped->find_pdu(2) == nullptr ||
      shipped->find_pdu(2)->slots.size() != 3U) {
    return fail("test_reloading_identical_schema_is_idempotent", "shipped catalog should define core and aux pdus");
  }

  try {
    (void)load_schema_file("/nonexistent/telemetry_hub/sensors.json");
    return fail("test_reloading_identical_schema_is_idempotent", "missing schema file should throw");
  } catch (const SchemaError& ex) {
    if (ex.kind() != SchemaError::Kind::PARSE) {
      return fail("test_reloading_identical_schema_is_idempotent", "missing file should be a parse error");
    }
  }

  return 0;
}

int test_schema_store_keeps_prior_schema_on_bad_reload() {
  SchemaStore store(parse_schema(kVehicleSchema));
  const SchemaPtr in_flight = store.current();
  const auto generation = store.generation();

  if (store.reload_from_text(R"({"version": 9, "sensors": {"a": {"min": 3, "max": 1}}})")) {
    return fail("test_schema_store_keeps_prior_schema_on_bad_reload", "invalid schema should be rejected");
  }
  if (store.current() != in_flight || store.generation() != generation) {
    return fail("test_schema_store_keeps_prior_schema_on_bad_reload", "rejected reload must not swap");
  }

  if (!store.reload_from_text(kFramingSchema)) {
    return fail("test_schema_store_keeps_prior_schema_on_bad_reload", "valid schema should be accepted");
  }
  if (store.current()->version() != 2U || store.generation() != generation + 1U) {
    return fail("test_schema_store_keeps_prior_schema_on_bad_reload", "new schema not visible after reload");
  }
  if (in_flight->version() != 3U || in_flight->enabled_count() != 9U) {
    return fail("test_schema_store_keeps_prior_schema_on_bad_reload", "captured snapshot changed underneath");
  }

  return 0;
}

Frame framing_frame(const Schema& schema, const std::uint32_t sequence, const std::uint64_t timestamp_ms,
                    const double rpm, const double battery_mv) {
  return *encode(SensorValues{{"rpm", rpm}, {"battery_mv", battery_mv}}, schema, sequence, timestamp_ms);
}

int test_framer_resyncs_past_garbage_in_any_chunking() {
  const SchemaPtr schema = parse_schema(kFramingSchema);
  const Frame a = framing_frame(*schema, 10, kTimestampMs, 1234, 12600);
  const Frame b = framing_frame(*schema, 11, kTimestampMs + 100U, 4321, 12000);

  std::vector<std::uint8_t> stream = {0x00, 0x7E, 0x13, 0x55};
  stream.insert(stream.end(), a.bytes.begin(), a.bytes.end());
  stream.insert(stream.end(), {0xAA, 0x7E});
  stream.insert(stream.end(), b.bytes.begin(), b.bytes.end());

  for (const std::size_t chunk : {std::size_t{1}, std::size_t{5}, std::size_t{7}, stream.size()}) {
    FrameAssembler framer(schema->start_byte(), schema->max_payload());
    std::vector<Frame> frames;
    for (std::size_t offset = 0; offset < stream.size(); offset += chunk) {
      const std::size_t size = std::min(chunk, stream.size() - offset);
      framer.push(stream.data() + offset, size);
      while (auto frame = framer.next()) {
        frames.push_back(std::move(*frame));
      }
    }

    if (frames.size() != 2U || frames[0].bytes != a.bytes || frames[1].bytes != b.bytes) {
      return fail("test_framer_resyncs_past_garbage_in_any_chunking", "frames not recovered intact");
    }
    if (framer.stats().frames != 2U || framer.stats().discarded_bytes != 6U || framer.buffered() != 0U) {
      return fail("test_framer_resyncs_past_garbage_in_any_chunking", "garbage accounting wrong");
    }
    // Both stray start bytes fail the header check.
    if (framer.stats().crc_failures != 2U) {
      return fail("test_framer_resyncs_past_garbage_in_any_chunking", "stray start bytes should fail the header crc");
    }

    const auto batch = decode(frames[1], *schema);
    if (!batch.has_value() || batch->sequence != 11U || batch->readings[0].value != 4321.0) {
      return fail("test_framer_resyncs_past_garbage_in_any_chunking", "recovered frame does not decode");
    }
  }

  return 0;
}

int test_framer_skips_corrupted_frame_and_reset_drops_partial() {
  const SchemaPtr schema = parse_schema(kFramingSchema);
  Frame a = framing_frame(*schema, 10, kTimestampMs, 1234, 12600);
  const Frame b = framing_frame(*schema, 11, kTimestampMs + 100U, 4321, 12000);
  a.bytes[telemetry_hub::model::kHeaderCrcOffset] ^= 0xFFU;

  FrameAssembler framer(schema->start_byte(), schema->max_payload());
  framer.push(a.bytes.data(), a.bytes.size());
  framer.push(b.bytes.data(), b.bytes.size());

  const auto first = framer.next();
  if (!first.has_value() || first->bytes != b.bytes || framer.next().has_value()) {
    return fail("test_framer_skips_corrupted_frame_and_reset_drops_partial", "only the intact frame should emerge");
  }
  if (framer.stats().crc_failures != 1U) {
    return fail("test_framer_skips_corrupted_frame_and_reset_drops_partial", "crc failure not counted");
  }

  // Half a frame, then a reset as on link drop, then a fresh frame.
  framer.push(b.bytes.data(), b.bytes.size() / 2U);
  if (framer.next().has_value() || framer.buffered() == 0U) {
    return fail("test_framer_skips_corrupted_frame_and_reset_drops_partial", "partial frame should stay buffered");
  }
  framer.reset();
  if (framer.buffered() != 0U) {
    return fail("test_framer_skips_corrupted_frame_and_reset_drops_partial", "reset should drop partial frame");
  }
  framer.push(b.bytes.data() + b.bytes.size() / 2U, b.bytes.size() - b.bytes.size() / 2U);
  if (framer.next().has_value()) {
    return fail("test_framer_skips_corrupted_frame_and_reset_drops_partial",
                "tail of a pre-reset frame must not be completed");
  }
  framer.push(b.bytes.data(), b.bytes.size());
  const auto again = framer.next();
  if (!again.has_value() || again->bytes != b.bytes) {
    return fail("test_framer_skips_corrupted_frame_and_reset_drops_partial", "framer did not recover after reset");
  }

  return 0;
}

int test_framer_rejects_oversize_length() {
  const SchemaPtr schema = parse_schema(kFramingSchema);
  const FrameHeader header{schema->start_byte(), schema->wire_version(), 0, 1, kTimestampMs, 0};
  const Frame big = seal_frame(header, std::vector<std::uint8_t>(200, 0x01));

  FrameAssembler framer(schema->start_byte(), schema->max_payload());
  framer.push(big.bytes.data(), big.bytes.size());
  if (framer.next().has_value()) {
    return fail("test_framer_rejects_oversize_length", "payload above max_payload must not be framed");
  }
  if (framer.stats().oversize_lengths != 1U) {
    return fail("test_framer_rejects_oversize_length", "oversize length not counted");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_crc16_known_answer(); rc != 0) return rc;
  if (int rc = test_schema_load_and_lookup(); rc != 0) return rc;
  if (int rc = test_schema_rejects_invalid_definitions(); rc != 0) return rc;
  if (int rc = test_round_trip_within_declared_precision(); rc != 0) return rc;
  if (int rc = test_partial_frame_marks_missing_fields_truncated(); rc != 0) return rc;
  if (int rc = test_out_of_range_field_only_invalidates_itself(); rc != 0) return rc;
  if (int rc = test_absent_sensors_and_trailing_bytes(); rc != 0) return rc;
  if (int rc = test_integrity_and_version_failures_drop_frame(); rc != 0) return rc;
  if (int rc = test_cut_off_frame_keeps_fields_that_arrived(); rc != 0) return rc;
  if (int rc = test_wire_bytes_are_little_endian(); rc != 0) return rc;
  if (int rc = test_min_and_max_round_trip_for_every_type(); rc != 0) return rc;
  if (int rc = test_pdus_carry_their_own_sensor_subsets(); rc != 0) return rc;
  if (int rc = test_encode_errors_produce_no_frame(); rc != 0) return rc;
  if (int rc = test_reloading_identical_schema_is_idempotent(); rc != 0) return rc;
  if (int rc = test_schema_store_keeps_prior_schema_on_bad_reload(); rc != 0) return rc;
  if (int rc = test_framer_resyncs_past_garbage_in_any_chunking(); rc != 0) return rc;
  if (int rc = test_framer_skips_corrupted_frame_and_reset_drops_partial(); rc != 0) return rc;
  if (int rc = test_framer_rejects_oversize_length(); rc != 0) return rc;

  std::cout << "[PASS] codec unit tests\n";
  return 0;
}
