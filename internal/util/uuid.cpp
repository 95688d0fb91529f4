#include "uuid.hpp"

#include <random>

namespace causal::util {

UUID GenerateUUID() {
  // one engine per thread; appends may come from several writers
  static thread_local std::mt19937_64 engine{std::random_device{}()};

  UUID id{};
  for (size_t i = 0; i < id.size(); i += 8) {
    const uint64_t word = engine();
    for (size_t b = 0; b < 8; ++b) id[i + b] = static_cast<uint8_t>(word >> (b * 8));
  }

  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

std::string NewCorrelationId() {
  return ToString(GenerateUUID());
}

} // namespace causal::util
