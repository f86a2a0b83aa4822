#include "change_payload_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace storykb::ledger {

std::string EncodePayload(const storykb::ledger::v1::ChangePayload& payload) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("encode change payload: " + std::string(status.message()));
  }
  return json;
}

storykb::ledger::v1::ChangePayload DecodePayload(const std::string& json) {
  storykb::ledger::v1::ChangePayload payload;
  if (json.empty()) {
    return payload;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &payload, options);
  if (!status.ok()) {
    throw util::ValidationError("decode change payload: " + std::string(status.message()));
  }
  return payload;
}

} // namespace storykb::ledger
