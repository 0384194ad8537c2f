#include "util.hpp"
#include <cctype>
#include <stdexcept>

namespace sendstream {

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

std::string uuid_to_string(const std::array<uint8_t, 16> &u) {
  std::string hex = bytes_to_hex(u.data(), u.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string printable_data(const std::vector<uint8_t> &data, size_t limit) {
  bool text = true;
  for (uint8_t b : data) {
    if (!std::isprint(b)) {
      text = false;
      break;
    }
  }
  std::string s = text ? std::string(data.begin(), data.end())
                       : bytes_to_hex(data.data(), data.size());
  if (s.size() <= limit)
    return s;
  size_t half = limit / 2;
  return s.substr(0, half) + " <truncated> " + s.substr(s.size() - half);
}

bool parse_size(const std::string &s, uint64_t &out) {
  if (s.empty() || !std::isdigit((unsigned char)s[0]))
    return false;
  size_t pos = 0;
  unsigned long long v;
  try {
    v = std::stoull(s, &pos);
  } catch (const std::exception &) {
    return false;
  }
  uint64_t mult = 1;
  if (pos < s.size()) {
    if (pos + 1 != s.size())
      return false;
    switch (std::toupper((unsigned char)s[pos])) {
    case 'K':
      mult = 1024ull;
      break;
    case 'M':
      mult = 1024ull * 1024;
      break;
    case 'G':
      mult = 1024ull * 1024 * 1024;
      break;
    default:
      return false;
    }
  }
  if (v > UINT64_MAX / mult)
    return false;
  out = (uint64_t)v * mult;
  return true;
}

} // namespace sendstream
