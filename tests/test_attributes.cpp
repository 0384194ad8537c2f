#include "attributes.hpp"
#include "frame_builder.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <variant>
#include <vector>

using sendstream::AttrDecodeOptions;
using sendstream::AttrType;
using sendstream::AttrValue;
using sendstream::AttributeSet;
using sendstream::DecodeErrc;
using sendstream::DecodeError;
using sendstream::RawAttribute;

namespace {

bool decode(const std::vector<uint8_t>& payload, const AttrDecodeOptions& opts, AttributeSet& out,
            DecodeError& err) {
    return AttributeSet::decode_all(payload.data(), payload.size(), opts, out, err);
}

bool test_order_and_duplicates_preserved() {
    testutil::FrameBuilder b(sendstream::CommandType::SET_XATTR);
    b.str(AttrType::PATH, "f")
        .str(AttrType::XATTR_NAME, "user.a")
        .str(AttrType::XATTR_NAME, "user.b")
        .u64(AttrType::INO, 7);

    AttributeSet set;
    DecodeError err;
    if (!decode(b.payload(), AttrDecodeOptions(), set, err)) return false;
    if (set.size() != 4) return false;
    const auto& raw = set.raw();
    if (raw[0].type != static_cast<uint16_t>(AttrType::PATH)) return false;
    if (raw[1].type != static_cast<uint16_t>(AttrType::XATTR_NAME)) return false;
    if (raw[2].type != static_cast<uint16_t>(AttrType::XATTR_NAME)) return false;
    if (raw[3].type != static_cast<uint16_t>(AttrType::INO)) return false;

    // Lookup returns the first of the duplicates.
    const RawAttribute* name = set.find(AttrType::XATTR_NAME);
    if (name == nullptr) return false;
    if (std::string(name->value.begin(), name->value.end()) != "user.a") return false;
    if (set.find(AttrType::UUID) != nullptr) return false;
    return true;
}

bool test_empty_payload() {
    AttributeSet set;
    DecodeError err;
    std::vector<uint8_t> none;
    if (!decode(none, AttrDecodeOptions(), set, err)) return false;
    return set.size() == 0;
}

bool test_truncated_value() {
    // PATH claims 10 bytes, only 3 follow.
    std::vector<uint8_t> payload;
    testutil::put_le(payload, static_cast<uint16_t>(AttrType::PATH), 2);
    testutil::put_le(payload, 10, 2);
    payload.push_back('a');
    payload.push_back('b');
    payload.push_back('c');

    AttributeSet set;
    DecodeError err;
    if (decode(payload, AttrDecodeOptions(), set, err)) return false;
    if (err.code != DecodeErrc::TruncatedAttribute) return false;
    if (err.attribute != static_cast<uint16_t>(AttrType::PATH)) return false;
    if (err.expected != 10 || err.actual != 3) return false;
    return true;
}

bool test_truncated_header() {
    // One good attribute, then three stray bytes.
    testutil::FrameBuilder b(sendstream::CommandType::UNLINK);
    b.str(AttrType::PATH, "x");
    std::vector<uint8_t> payload = b.payload();
    payload.push_back(0x0F);
    payload.push_back(0x00);
    payload.push_back(0x01);

    AttributeSet set;
    DecodeError err;
    if (decode(payload, AttrDecodeOptions(), set, err)) return false;
    return err.code == DecodeErrc::TruncatedAttribute;
}

bool test_unknown_kind_kept_opaque() {
    testutil::FrameBuilder b(sendstream::CommandType::MKFILE);
    b.raw(static_cast<uint16_t>(200), {1, 2, 3}).str(AttrType::PATH, "p");

    AttributeSet set;
    DecodeError err;
    if (!decode(b.payload(), AttrDecodeOptions(), set, err)) return false;
    if (set.size() != 2) return false;

    AttrValue v;
    if (!sendstream::decode_value(set.raw()[0], v, err)) return false;
    const auto* bytes = std::get_if<sendstream::Bytes>(&v);
    if (bytes == nullptr || *bytes != std::vector<uint8_t>({1, 2, 3})) return false;
    return true;
}

bool test_strict_rejects_unknown_kind() {
    testutil::FrameBuilder b(sendstream::CommandType::MKFILE);
    b.str(AttrType::PATH, "p").raw(static_cast<uint16_t>(200), {1});

    AttrDecodeOptions opts;
    opts.strict = true;
    AttributeSet set;
    DecodeError err;
    if (decode(b.payload(), opts, set, err)) return false;
    if (err.code != DecodeErrc::UnknownAttributeKind) return false;
    if (err.attribute != 200) return false;

    // Kind 0 is not a valid attribute either.
    testutil::FrameBuilder z(sendstream::CommandType::MKFILE);
    z.raw(static_cast<uint16_t>(0), {});
    if (decode(z.payload(), opts, set, err)) return false;
    return err.code == DecodeErrc::UnknownAttributeKind;
}

bool test_fixed_width_mismatch() {
    RawAttribute a;
    a.type = static_cast<uint16_t>(AttrType::INO);
    a.value = {1, 2, 3, 4};  // u64 needs 8

    AttrValue v;
    DecodeError err;
    if (sendstream::decode_value(a, v, err)) return false;
    if (err.code != DecodeErrc::InvalidAttributeLength) return false;
    if (err.expected != 8 || err.actual != 4) return false;

    // Too long is as wrong as too short.
    a.type = static_cast<uint16_t>(AttrType::UUID);
    a.value.assign(17, 0);
    if (sendstream::decode_value(a, v, err)) return false;
    if (err.expected != 16 || err.actual != 17) return false;
    return true;
}

bool test_typed_values() {
    testutil::FrameBuilder b(sendstream::CommandType::UTIMES);
    sendstream::Uuid u{};
    for (size_t i = 0; i < u.size(); ++i) u[i] = static_cast<uint8_t>(i + 1);
    b.u64(AttrType::SIZE, 0x1122334455667788ull)
        .u32(AttrType::FALLOCATE_MODE, 3)
        .u8(AttrType::VERITY_ALGORITHM, 1)
        .uuid(AttrType::UUID, u)
        .time(AttrType::MTIME, -5, 999999999)
        .u32(AttrType::COMPRESSION, 2)
        .u32(AttrType::ENCRYPTION, 9)
        .raw(AttrType::PATH, {'d', 'i', 'r', '/', 'f', 0, 0});

    AttributeSet set;
    DecodeError err;
    if (!decode(b.payload(), AttrDecodeOptions(), set, err)) return false;

    AttrValue v;
    if (!sendstream::decode_value(*set.find(AttrType::SIZE), v, err)) return false;
    if (std::get<uint64_t>(v) != 0x1122334455667788ull) return false;

    if (!sendstream::decode_value(*set.find(AttrType::FALLOCATE_MODE), v, err)) return false;
    if (std::get<uint32_t>(v) != 3) return false;

    if (!sendstream::decode_value(*set.find(AttrType::VERITY_ALGORITHM), v, err)) return false;
    if (std::get<uint8_t>(v) != 1) return false;

    if (!sendstream::decode_value(*set.find(AttrType::UUID), v, err)) return false;
    if (std::get<sendstream::Uuid>(v) != u) return false;

    if (!sendstream::decode_value(*set.find(AttrType::MTIME), v, err)) return false;
    const auto& ts = std::get<sendstream::Timespec>(v);
    if (ts.sec != -5 || ts.nsec != 999999999u) return false;

    if (!sendstream::decode_value(*set.find(AttrType::COMPRESSION), v, err)) return false;
    if (std::get<sendstream::CompressionType>(v) != sendstream::CompressionType::ZSTD) return false;

    // Enumerators this decoder does not know survive as their number.
    if (!sendstream::decode_value(*set.find(AttrType::ENCRYPTION), v, err)) return false;
    if (sendstream::encryption_name(std::get<sendstream::EncryptionType>(v)) != "unknown(9)") return false;

    // Trailing NULs stripped from strings.
    if (!sendstream::decode_value(*set.find(AttrType::PATH), v, err)) return false;
    if (std::get<std::string>(v) != "dir/f") return false;
    return true;
}

bool test_v2_data_runs_to_end() {
    testutil::FrameBuilder b(sendstream::CommandType::WRITE);
    std::vector<uint8_t> data(70000, 0xCC);  // larger than a u16 length could say
    b.str(AttrType::PATH, "big").u64(AttrType::FILE_OFFSET, 0).data_v2(data);

    AttrDecodeOptions opts;
    opts.version = 2;
    AttributeSet set;
    DecodeError err;
    if (!decode(b.payload(), opts, set, err)) return false;
    const RawAttribute* d = set.find(AttrType::DATA);
    if (d == nullptr || d->value != data) return false;

    // The same payload read as version 1 misparses the first data bytes as a
    // length and runs out.
    opts.version = 1;
    if (decode(b.payload(), opts, set, err)) return false;
    return err.code == DecodeErrc::TruncatedAttribute;
}

bool test_v1_data_is_tlv() {
    testutil::FrameBuilder b(sendstream::CommandType::WRITE);
    b.raw(AttrType::DATA, {'h', 'i'}).str(AttrType::PATH, "after");

    AttributeSet set;
    DecodeError err;
    if (!decode(b.payload(), AttrDecodeOptions(), set, err)) return false;
    return set.size() == 2 && set.find(AttrType::PATH) != nullptr;
}

bool test_table_is_complete() {
    for (uint16_t t = 1; t <= sendstream::kMaxAttrType; ++t) {
        const sendstream::AttrSpec* spec = sendstream::find_attr_spec(t);
        if (spec == nullptr || static_cast<uint16_t>(spec->type) != t || spec->decode == nullptr) return false;
        if (sendstream::attr_type_name(t) == nullptr) return false;
    }
    if (sendstream::find_attr_spec(0) != nullptr) return false;
    if (sendstream::find_attr_spec(sendstream::kMaxAttrType + 1) != nullptr) return false;
    return true;
}

}  // namespace

int main() {
    if (!test_order_and_duplicates_preserved()) {
        std::printf("test_order_and_duplicates_preserved failed\n");
        return EXIT_FAILURE;
    }
    if (!test_empty_payload()) {
        std::printf("test_empty_payload failed\n");
        return EXIT_FAILURE;
    }
    if (!test_truncated_value()) {
        std::printf("test_truncated_value failed\n");
        return EXIT_FAILURE;
    }
    if (!test_truncated_header()) {
        std::printf("test_truncated_header failed\n");
        return EXIT_FAILURE;
    }
    if (!test_unknown_kind_kept_opaque()) {
        std::printf("test_unknown_kind_kept_opaque failed\n");
        return EXIT_FAILURE;
    }
    if (!test_strict_rejects_unknown_kind()) {
        std::printf("test_strict_rejects_unknown_kind failed\n");
        return EXIT_FAILURE;
    }
    if (!test_fixed_width_mismatch()) {
        std::printf("test_fixed_width_mismatch failed\n");
        return EXIT_FAILURE;
    }
    if (!test_typed_values()) {
        std::printf("test_typed_values failed\n");
        return EXIT_FAILURE;
    }
    if (!test_v2_data_runs_to_end()) {
        std::printf("test_v2_data_runs_to_end failed\n");
        return EXIT_FAILURE;
    }
    if (!test_v1_data_is_tlv()) {
        std::printf("test_v1_data_is_tlv failed\n");
        return EXIT_FAILURE;
    }
    if (!test_table_is_complete()) {
        std::printf("test_table_is_complete failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All attributes tests passed\n");
    return EXIT_SUCCESS;
}
