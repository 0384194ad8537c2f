#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include "errors.hpp"
#include "protocol.hpp"

namespace sendstream {

using Bytes = std::vector<uint8_t>;
using Uuid = std::array<uint8_t, 16>;

struct Timespec {
    int64_t sec{0};
    uint32_t nsec{0};
};
inline bool operator==(const Timespec& a, const Timespec& b) { return a.sec == b.sec && a.nsec == b.nsec; }
inline bool operator!=(const Timespec& a, const Timespec& b) { return !(a == b); }

enum class CompressionType : uint32_t {
    NONE = 0,
    ZLIB = 1,
    ZSTD = 2,
    LZO_4K = 3,
    LZO_8K = 4,
    LZO_16K = 5,
    LZO_32K = 6,
    LZO_64K = 7,
};

enum class EncryptionType : uint32_t {
    NONE = 0,
};

// Unknown enumerators come back as "unknown(N)".
std::string compression_name(CompressionType c);
std::string encryption_name(EncryptionType e);

// One alternative per value type in the attribute table. Attribute kinds the
// table does not know decode as Bytes.
using AttrValue = std::variant<uint64_t, uint32_t, uint8_t, Bytes, std::string,
                               Uuid, Timespec, CompressionType, EncryptionType>;

enum class ValueKind : uint8_t { U64, U32, U8, BYTES, STRING, UUID, TIMESPEC, COMPRESSION, ENCRYPTION };

using AttrDecodeFn = void (*)(const uint8_t* p, size_t len, AttrValue& out);

struct AttrSpec {
    AttrType type;
    ValueKind kind;
    // 0 for variable length values.
    uint16_t width;
    AttrDecodeFn decode;
};

// nullptr for kinds outside the table.
const AttrSpec* find_attr_spec(uint16_t type);

// An attribute as it sits in the frame, value copied out of the payload.
struct RawAttribute {
    uint16_t type{0};
    Bytes value;
};
inline bool operator==(const RawAttribute& a, const RawAttribute& b) { return a.type == b.type && a.value == b.value; }

// Typed decode of a single attribute, checking the fixed width of its kind.
bool decode_value(const RawAttribute& attr, AttrValue& out, DecodeError& err);

struct AttrDecodeOptions {
    uint32_t version{kMinVersion};
    // Reject attribute kinds outside the table instead of keeping them as
    // opaque bytes.
    bool strict{false};
};

// Attributes of one frame in wire order. Duplicates are kept; lookups return
// the first occurrence.
class AttributeSet {
public:
    AttributeSet() = default;
    explicit AttributeSet(std::vector<RawAttribute> attrs) : attrs_(std::move(attrs)) {}

    const RawAttribute* find(AttrType type) const;
    const std::vector<RawAttribute>& raw() const { return attrs_; }
    std::vector<RawAttribute> release() { return std::move(attrs_); }
    size_t size() const { return attrs_.size(); }

    // Splits a command payload into attributes. Values are not typed here;
    // that happens on lookup through decode_value.
    static bool decode_all(const uint8_t* payload, size_t len, const AttrDecodeOptions& opts,
                           AttributeSet& out, DecodeError& err);

private:
    std::vector<RawAttribute> attrs_;
};

} // namespace sendstream
