#include "attributes.hpp"
#include "byte_cursor.hpp"
#include <cstdio>
#include <cstring>

namespace sendstream {

std::string compression_name(CompressionType c) {
  switch (c) {
  case CompressionType::NONE:
    return "none";
  case CompressionType::ZLIB:
    return "zlib";
  case CompressionType::ZSTD:
    return "zstd";
  case CompressionType::LZO_4K:
    return "lzo-4k";
  case CompressionType::LZO_8K:
    return "lzo-8k";
  case CompressionType::LZO_16K:
    return "lzo-16k";
  case CompressionType::LZO_32K:
    return "lzo-32k";
  case CompressionType::LZO_64K:
    return "lzo-64k";
  }
  return "unknown(" + std::to_string((uint32_t)c) + ")";
}

std::string encryption_name(EncryptionType e) {
  if (e == EncryptionType::NONE)
    return "none";
  return "unknown(" + std::to_string((uint32_t)e) + ")";
}

namespace {

void dec_u64(const uint8_t *p, size_t, AttrValue &out) {
  out.emplace<uint64_t>(load_le64(p));
}
void dec_u32(const uint8_t *p, size_t, AttrValue &out) {
  out.emplace<uint32_t>(load_le32(p));
}
void dec_u8(const uint8_t *p, size_t, AttrValue &out) {
  out.emplace<uint8_t>(p[0]);
}
void dec_bytes(const uint8_t *p, size_t len, AttrValue &out) {
  out.emplace<Bytes>(p, p + len);
}
// Paths and names are not NUL terminated on the wire, but tolerate senders
// that include one.
void dec_string(const uint8_t *p, size_t len, AttrValue &out) {
  while (len > 0 && p[len - 1] == 0)
    len--;
  out.emplace<std::string>((const char *)p, len);
}
void dec_uuid(const uint8_t *p, size_t, AttrValue &out) {
  Uuid u;
  std::memcpy(u.data(), p, u.size());
  out.emplace<Uuid>(u);
}
// le64 sec, le32 nsec
void dec_timespec(const uint8_t *p, size_t, AttrValue &out) {
  Timespec ts;
  ts.sec = (int64_t)load_le64(p);
  ts.nsec = load_le32(p + 8);
  out.emplace<Timespec>(ts);
}
void dec_compression(const uint8_t *p, size_t, AttrValue &out) {
  out.emplace<CompressionType>((CompressionType)load_le32(p));
}
void dec_encryption(const uint8_t *p, size_t, AttrValue &out) {
  out.emplace<EncryptionType>((EncryptionType)load_le32(p));
}

// Indexed by attribute type; entry 0 (UNSPEC) is never valid on the wire.
const AttrSpec kAttrTable[kMaxAttrType + 1] = {
    {AttrType::UNSPEC, ValueKind::BYTES, 0, nullptr},
    {AttrType::UUID, ValueKind::UUID, 16, dec_uuid},
    {AttrType::CTRANSID, ValueKind::U64, 8, dec_u64},
    {AttrType::INO, ValueKind::U64, 8, dec_u64},
    {AttrType::SIZE, ValueKind::U64, 8, dec_u64},
    {AttrType::MODE, ValueKind::U64, 8, dec_u64},
    {AttrType::UID, ValueKind::U64, 8, dec_u64},
    {AttrType::GID, ValueKind::U64, 8, dec_u64},
    {AttrType::RDEV, ValueKind::U64, 8, dec_u64},
    {AttrType::CTIME, ValueKind::TIMESPEC, 12, dec_timespec},
    {AttrType::MTIME, ValueKind::TIMESPEC, 12, dec_timespec},
    {AttrType::ATIME, ValueKind::TIMESPEC, 12, dec_timespec},
    {AttrType::OTIME, ValueKind::TIMESPEC, 12, dec_timespec},
    {AttrType::XATTR_NAME, ValueKind::STRING, 0, dec_string},
    {AttrType::XATTR_DATA, ValueKind::BYTES, 0, dec_bytes},
    {AttrType::PATH, ValueKind::STRING, 0, dec_string},
    {AttrType::PATH_TO, ValueKind::STRING, 0, dec_string},
    {AttrType::PATH_LINK, ValueKind::STRING, 0, dec_string},
    {AttrType::FILE_OFFSET, ValueKind::U64, 8, dec_u64},
    {AttrType::DATA, ValueKind::BYTES, 0, dec_bytes},
    {AttrType::CLONE_UUID, ValueKind::UUID, 16, dec_uuid},
    {AttrType::CLONE_CTRANSID, ValueKind::U64, 8, dec_u64},
    {AttrType::CLONE_PATH, ValueKind::STRING, 0, dec_string},
    {AttrType::CLONE_OFFSET, ValueKind::U64, 8, dec_u64},
    {AttrType::CLONE_LEN, ValueKind::U64, 8, dec_u64},
    {AttrType::FALLOCATE_MODE, ValueKind::U32, 4, dec_u32},
    {AttrType::FILEATTR, ValueKind::U64, 8, dec_u64},
    {AttrType::UNENCODED_FILE_LEN, ValueKind::U64, 8, dec_u64},
    {AttrType::UNENCODED_LEN, ValueKind::U64, 8, dec_u64},
    {AttrType::UNENCODED_OFFSET, ValueKind::U64, 8, dec_u64},
    {AttrType::COMPRESSION, ValueKind::COMPRESSION, 4, dec_compression},
    {AttrType::ENCRYPTION, ValueKind::ENCRYPTION, 4, dec_encryption},
    {AttrType::VERITY_ALGORITHM, ValueKind::U8, 1, dec_u8},
    {AttrType::VERITY_BLOCK_SIZE, ValueKind::U32, 4, dec_u32},
    {AttrType::VERITY_SALT_DATA, ValueKind::BYTES, 0, dec_bytes},
    {AttrType::VERITY_SIG_DATA, ValueKind::BYTES, 0, dec_bytes},
};

} // namespace

const AttrSpec *find_attr_spec(uint16_t type) {
  if (type == 0 || type > kMaxAttrType)
    return nullptr;
  return &kAttrTable[type];
}

bool decode_value(const RawAttribute &attr, AttrValue &out, DecodeError &err) {
  const AttrSpec *spec = find_attr_spec(attr.type);
  if (!spec) {
    out.emplace<Bytes>(attr.value);
    return true;
  }
  if (spec->width != 0 && attr.value.size() != spec->width) {
    err = make_error(DecodeErrc::InvalidAttributeLength, 0, attr.type);
    err.expected = spec->width;
    err.actual = attr.value.size();
    return false;
  }
  spec->decode(attr.value.data(), attr.value.size(), out);
  return true;
}

const RawAttribute *AttributeSet::find(AttrType type) const {
  for (const auto &a : attrs_) {
    if (a.type == (uint16_t)type)
      return &a;
  }
  return nullptr;
}

bool AttributeSet::decode_all(const uint8_t *payload, size_t len,
                              const AttrDecodeOptions &opts, AttributeSet &out,
                              DecodeError &err) {
  ByteCursor c(payload, len);
  std::vector<RawAttribute> attrs;
  while (!c.empty()) {
    uint16_t type;
    if (!c.read_u16(type)) {
      err = make_error(DecodeErrc::TruncatedAttribute);
      err.expected = kAttrHeaderLen;
      err.actual = c.remaining();
      return false;
    }
    if (opts.strict && !find_attr_spec(type)) {
      err = make_error(DecodeErrc::UnknownAttributeKind, 0, type);
      return false;
    }
    RawAttribute a;
    a.type = type;
    if (opts.version >= 2 && type == (uint16_t)AttrType::DATA) {
      // No length field from v2 on: DATA runs to the end of the command.
      a.value.assign(c.current(), c.current() + c.remaining());
      attrs.push_back(std::move(a));
      break;
    }
    uint16_t alen;
    if (!c.read_u16(alen)) {
      err = make_error(DecodeErrc::TruncatedAttribute, 0, type);
      err.expected = 2;
      err.actual = c.remaining();
      return false;
    }
    if (!c.read_exact(alen, a.value)) {
      err = make_error(DecodeErrc::TruncatedAttribute, 0, type);
      err.expected = alen;
      err.actual = c.remaining();
      return false;
    }
    attrs.push_back(std::move(a));
  }
  out = AttributeSet(std::move(attrs));
  return true;
}

} // namespace sendstream
