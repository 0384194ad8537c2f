#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace sendstream {

enum class DecodeErrc : uint8_t {
    NotASendstream,
    UnsupportedVersion,
    UnexpectedEnd,
    TruncatedFrame,
    TruncatedAttribute,
    InvalidAttributeLength,
    ChecksumMismatch,
    MissingAttribute,
    UnknownAttributeKind,
    FrameTooLarge,
    SourceFailure
};

const char* errc_name(DecodeErrc code);

// Fields that do not apply to a given code are left zero.
struct DecodeError {
    DecodeErrc code{DecodeErrc::UnexpectedEnd};
    uint16_t command{0};
    uint16_t attribute{0};
    // ChecksumMismatch: stored / computed crc. InvalidAttributeLength:
    // expected / actual width. TruncatedFrame, TruncatedAttribute: needed /
    // available bytes. UnsupportedVersion: minimum / found.
    uint64_t expected{0};
    uint64_t actual{0};
    // Absolute stream offset of the frame, when known.
    uint64_t offset{0};
    std::string detail;

    std::string message() const;
};

bool operator==(const DecodeError& a, const DecodeError& b);
inline bool operator!=(const DecodeError& a, const DecodeError& b) { return !(a == b); }

DecodeError make_error(DecodeErrc code, uint16_t command = 0, uint16_t attribute = 0);

} // namespace sendstream
