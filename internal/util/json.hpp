#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

namespace causal::util {

/*
  JSON codec for opaque payload/metadata values.

  Backed by the protobuf JSON printer/parser so stored text is canonical
  and round-trips through google::protobuf::Value.
*/

std::string ToJson(const google::protobuf::Value& value);
std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

// Throws std::runtime_error on malformed input. Empty text decodes to an empty struct.
google::protobuf::Value FromJson(const std::string& json);

google::protobuf::Value EmptyStruct();

// Scalar rendering used by payload field matching; structs/lists render as JSON.
std::string ScalarText(const google::protobuf::Value& value);

} // namespace causal::util
