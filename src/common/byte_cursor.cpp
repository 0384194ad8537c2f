#include "byte_cursor.hpp"

namespace sendstream {

uint16_t load_le16(const uint8_t *p) {
  return (uint16_t)(p[0] | ((uint16_t)p[1] << 8));
}

uint32_t load_le32(const uint8_t *p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
         ((uint32_t)p[3] << 24);
}

uint64_t load_le64(const uint8_t *p) {
  return (uint64_t)load_le32(p) | ((uint64_t)load_le32(p + 4) << 32);
}

template <typename T> bool ByteCursor::read_le(T &out) {
  if (remaining() < sizeof(T))
    return false;
  T v = 0;
  for (size_t i = 0; i < sizeof(T); i++)
    v |= (T)data_[pos_ + i] << (8 * i);
  out = v;
  pos_ += sizeof(T);
  return true;
}

bool ByteCursor::read_u8(uint8_t &out) {
  if (remaining() < 1)
    return false;
  out = data_[pos_++];
  return true;
}

bool ByteCursor::read_u16(uint16_t &out) { return read_le(out); }
bool ByteCursor::read_u32(uint32_t &out) { return read_le(out); }
bool ByteCursor::read_u64(uint64_t &out) { return read_le(out); }

bool ByteCursor::read_i64(int64_t &out) {
  uint64_t v;
  if (!read_le(v))
    return false;
  out = (int64_t)v;
  return true;
}

bool ByteCursor::read_exact(size_t n, const uint8_t *&out) {
  if (remaining() < n)
    return false;
  out = data_ + pos_;
  pos_ += n;
  return true;
}

bool ByteCursor::read_exact(size_t n, std::vector<uint8_t> &out) {
  const uint8_t *p;
  if (!read_exact(n, p))
    return false;
  out.assign(p, p + n);
  return true;
}

bool ByteCursor::read_prefixed16(const uint8_t *&out, uint16_t &len) {
  if (remaining() < 2)
    return false;
  uint16_t n = load_le16(data_ + pos_);
  if (remaining() - 2 < n)
    return false;
  pos_ += 2;
  out = data_ + pos_;
  len = n;
  pos_ += n;
  return true;
}

bool ByteCursor::skip(size_t n) {
  if (remaining() < n)
    return false;
  pos_ += n;
  return true;
}

} // namespace sendstream
