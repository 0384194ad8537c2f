#pragma once
#include <cstdint>
#include <cstddef>
#include <variant>
#include "attributes.hpp"
#include "byte_cursor.hpp"
#include "command.hpp"
#include "errors.hpp"

namespace sendstream {

struct DecoderConfig {
    // Reject attribute kinds missing from the attribute table.
    bool strict_attributes{false};
    // Upper bound on a single command's payload; guards buffering of
    // corrupted length fields read from a pipe.
    uint32_t max_payload_len{16u * 1024 * 1024};
};

struct FrameHeader {
    uint32_t len{0};
    uint16_t cmd{0};
    uint32_t crc{0};
};

// Reads the fixed 10 byte command header; false when fewer bytes are given.
bool parse_frame_header(const uint8_t* p, size_t n, FrameHeader& out);

// CRC-32C of the header with its crc field zeroed, followed by the payload.
uint32_t frame_checksum(const uint8_t* header, const uint8_t* payload, size_t len);

using CommandResult = std::variant<Command, DecodeError>;

class CommandDecoder {
public:
    explicit CommandDecoder(uint32_t version, const DecoderConfig& cfg = DecoderConfig());

    // Decodes one frame starting at the cursor. The cursor only advances
    // when a command is returned.
    CommandResult decode_one(ByteCursor& cursor) const;

    uint32_t version() const { return version_; }

private:
    uint32_t version_;
    DecoderConfig cfg_;
};

} // namespace sendstream
