#include "byte_cursor.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

namespace {

bool test_little_endian_reads() {
    std::vector<uint8_t> buf = {
        0xAB,                                            // u8
        0x34, 0x12,                                      // u16
        0x78, 0x56, 0x34, 0x12,                          // u32
        0xEF, 0xCD, 0xAB, 0x89, 0x67, 0x45, 0x23, 0x01,  // u64
        0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,  // i64 -2
    };
    sendstream::ByteCursor c(buf);

    uint8_t a = 0;
    uint16_t b = 0;
    uint32_t d = 0;
    uint64_t e = 0;
    int64_t f = 0;
    if (!c.read_u8(a) || a != 0xAB) return false;
    if (!c.read_u16(b) || b != 0x1234) return false;
    if (!c.read_u32(d) || d != 0x12345678u) return false;
    if (!c.read_u64(e) || e != 0x0123456789ABCDEFull) return false;
    if (!c.read_i64(f) || f != -2) return false;
    if (!c.empty() || c.position() != buf.size()) return false;
    return true;
}

bool test_short_read_leaves_position() {
    std::vector<uint8_t> buf = {1, 2, 3};
    sendstream::ByteCursor c(buf);

    uint8_t one = 0;
    if (!c.read_u8(one) || one != 1) return false;

    uint32_t v = 0xDEADBEEF;
    if (c.read_u32(v)) return false;
    if (v != 0xDEADBEEF) return false;  // untouched on failure
    if (c.position() != 1 || c.remaining() != 2) return false;

    uint64_t w = 0;
    if (c.read_u64(w)) return false;
    if (c.position() != 1) return false;

    const uint8_t* p = nullptr;
    if (c.read_exact(3, p)) return false;
    if (c.position() != 1) return false;

    uint16_t x = 0;
    if (!c.read_u16(x) || x != 0x0302) return false;
    if (c.read_u8(one)) return false;
    return true;
}

bool test_read_exact_copies_and_views() {
    std::vector<uint8_t> buf = {9, 8, 7, 6, 5};
    sendstream::ByteCursor c(buf);

    const uint8_t* view = nullptr;
    if (!c.read_exact(2, view)) return false;
    if (view != buf.data() || view[1] != 8) return false;

    std::vector<uint8_t> copy;
    if (!c.read_exact(3, copy)) return false;
    if (copy != std::vector<uint8_t>({7, 6, 5})) return false;

    // Zero-length reads succeed at the end.
    if (!c.read_exact(0, copy) || !copy.empty()) return false;
    return c.empty();
}

bool test_prefixed16() {
    std::vector<uint8_t> buf = {3, 0, 'a', 'b', 'c', 5, 0, 'x'};
    sendstream::ByteCursor c(buf);

    const uint8_t* p = nullptr;
    uint16_t len = 0;
    if (!c.read_prefixed16(p, len) || len != 3 || p[0] != 'a' || p[2] != 'c') return false;
    if (c.position() != 5) return false;

    // Declared 5, only 1 byte follows.
    if (c.read_prefixed16(p, len)) return false;
    if (c.position() != 5) return false;
    return true;
}

bool test_skip_and_empty_buffer() {
    sendstream::ByteCursor empty;
    uint8_t b = 0;
    if (empty.read_u8(b)) return false;
    if (!empty.empty() || empty.remaining() != 0) return false;
    if (!empty.skip(0)) return false;

    std::vector<uint8_t> buf = {1, 2, 3, 4};
    sendstream::ByteCursor c(buf);
    if (c.skip(5)) return false;
    if (!c.skip(3)) return false;
    if (!c.read_u8(b) || b != 4) return false;
    return true;
}

bool test_load_helpers() {
    const uint8_t p[8] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    if (sendstream::load_le16(p) != 0x0201) return false;
    if (sendstream::load_le32(p) != 0x04030201u) return false;
    if (sendstream::load_le64(p) != 0x0807060504030201ull) return false;
    return true;
}

}  // namespace

int main() {
    if (!test_little_endian_reads()) {
        std::printf("test_little_endian_reads failed\n");
        return EXIT_FAILURE;
    }
    if (!test_short_read_leaves_position()) {
        std::printf("test_short_read_leaves_position failed\n");
        return EXIT_FAILURE;
    }
    if (!test_read_exact_copies_and_views()) {
        std::printf("test_read_exact_copies_and_views failed\n");
        return EXIT_FAILURE;
    }
    if (!test_prefixed16()) {
        std::printf("test_prefixed16 failed\n");
        return EXIT_FAILURE;
    }
    if (!test_skip_and_empty_buffer()) {
        std::printf("test_skip_and_empty_buffer failed\n");
        return EXIT_FAILURE;
    }
    if (!test_load_helpers()) {
        std::printf("test_load_helpers failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All byte_cursor tests passed\n");
    return EXIT_SUCCESS;
}
