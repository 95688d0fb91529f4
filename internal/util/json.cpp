#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace causal::util {

std::string ToJson(const google::protobuf::Value& value) {
  if (value.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
    return "null";
  }

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(value, &out);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  return out;
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  return out;
}

google::protobuf::Value FromJson(const std::string& json) {
  if (json.empty()) {
    return EmptyStruct();
  }

  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw std::runtime_error("json decode failed: " + std::string(status.message()));
  }
  return value;
}

google::protobuf::Value EmptyStruct() {
  google::protobuf::Value value;
  value.mutable_struct_value();
  return value;
}

std::string ScalarText(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kNumberValue: {
      const double n = value.number_value();
      if (std::floor(n) == n && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<long long>(n));
      }
      std::ostringstream out;
      out << n;
      return out.str();
    }
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return "";
    default:
      return ToJson(value);
  }
}

} // namespace causal::util
