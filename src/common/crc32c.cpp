#include "crc32c.hpp"
#include <array>

namespace sendstream {

namespace {

constexpr uint32_t kCastagnoliReflected = 0x82F63B78u;

std::array<uint32_t, 256> make_table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; i++) {
    uint32_t c = i;
    for (int j = 0; j < 8; j++)
      c = (c & 1) ? (kCastagnoliReflected ^ (c >> 1)) : (c >> 1);
    table[i] = c;
  }
  return table;
}

} // namespace

uint32_t crc32c(uint32_t seed, const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = make_table();
  uint32_t c = seed;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return c;
}

} // namespace sendstream
