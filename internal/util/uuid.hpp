#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace causal::util {

// 16 raw bytes of an RFC 4122 version 4 UUID.
using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// 8-4-4-4-12 lowercase hex
std::string ToString(const UUID& id);

// Fresh correlation id for a new causal tree.
std::string NewCorrelationId();

} // namespace causal::util
