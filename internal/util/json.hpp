#pragma once

#include <google/protobuf/message.h>

#include <string>
#include <string_view>

namespace gearledger::util {

/*
  Protobuf <-> JSON helpers for the HTTP and UDP surfaces.

  Field names are emitted as declared in the .proto files (snake_case) and
  zero values are always printed, so `"version":0` and `"exists":false`
  reach the wire.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws util::InvalidArgument when the payload is not valid JSON for `message`.
// Unknown fields are ignored so that newer peers can talk to older ones.
void FromJson(std::string_view json, google::protobuf::Message* message);

// Non-throwing variant for peer input that is dropped when malformed.
bool TryFromJson(std::string_view json, google::protobuf::Message* message);

} // namespace gearledger::util
