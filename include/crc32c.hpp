#pragma once
#include <cstdint>
#include <cstddef>

namespace sendstream {

// Raw CRC-32C register update: no pre or post inversion, so a frame can be
// summed piecewise by feeding the previous result back in as the seed.
// Stream frames use seed 0.
uint32_t crc32c(uint32_t seed, const uint8_t* data, size_t len);

} // namespace sendstream
