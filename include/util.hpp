#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>
#include <array>

namespace sendstream {

std::string bytes_to_hex(const uint8_t* data, size_t len);
// 8-4-4-4-12 form.
std::string uuid_to_string(const std::array<uint8_t, 16>& u);
// Text as-is when every byte is printable ASCII (control characters
// included in "not printable"), otherwise hex; cut in the middle past
// `limit` characters.
std::string printable_data(const std::vector<uint8_t>& data, size_t limit = 128);
// Accepts plain bytes or a K/M/G suffix (powers of 1024).
bool parse_size(const std::string& s, uint64_t& out);

} // namespace sendstream
