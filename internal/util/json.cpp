#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace gearledger::util {

namespace {

google::protobuf::util::JsonParseOptions ParseOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return options;
}

} // namespace

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names   = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(std::string_view json, google::protobuf::Message* message) {
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), message, ParseOptions());
  if (!status.ok()) {
    throw InvalidArgument("Invalid JSON body: " + std::string(status.message()));
  }
}

bool TryFromJson(std::string_view json, google::protobuf::Message* message) {
  return google::protobuf::util::JsonStringToMessage(std::string(json), message, ParseOptions()).ok();
}

} // namespace gearledger::util
