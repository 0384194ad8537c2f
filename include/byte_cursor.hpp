#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

namespace sendstream {

// Bounds-checked little-endian reader over bytes it does not own. Every read
// either consumes exactly what it asked for or fails and leaves the position
// where it was.
class ByteCursor {
public:
    ByteCursor() = default;
    ByteCursor(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit ByteCursor(const std::vector<uint8_t>& buf)
        : data_(buf.data()), len_(buf.size()) {}

    bool read_u8(uint8_t& out);
    bool read_u16(uint16_t& out);
    bool read_u32(uint32_t& out);
    bool read_u64(uint64_t& out);
    bool read_i64(int64_t& out);

    // Returns a pointer into the underlying buffer, valid as long as it is.
    bool read_exact(size_t n, const uint8_t*& out);
    bool read_exact(size_t n, std::vector<uint8_t>& out);
    // u16 length followed by that many bytes.
    bool read_prefixed16(const uint8_t*& out, uint16_t& len);

    bool skip(size_t n);

    size_t remaining() const { return len_ - pos_; }
    size_t position() const { return pos_; }
    bool empty() const { return pos_ == len_; }
    const uint8_t* current() const { return data_ + pos_; }

private:
    template <typename T> bool read_le(T& out);

    const uint8_t* data_ = nullptr;
    size_t len_ = 0;
    size_t pos_ = 0;
};

// Little-endian loads from a buffer the caller has already bounds-checked.
uint16_t load_le16(const uint8_t* p);
uint32_t load_le32(const uint8_t* p);
uint64_t load_le64(const uint8_t* p);

} // namespace sendstream
