#include "command_decoder.hpp"
#include "crc32c.hpp"
#include "logging.hpp"
#include <cstring>
#include <optional>

namespace sendstream {

bool parse_frame_header(const uint8_t *p, size_t n, FrameHeader &out) {
  if (n < kCommandHeaderLen)
    return false;
  out.len = load_le32(p);
  out.cmd = load_le16(p + 4);
  out.crc = load_le32(p + kCommandCrcOffset);
  return true;
}

uint32_t frame_checksum(const uint8_t *header, const uint8_t *payload,
                        size_t len) {
  uint8_t hdr[kCommandHeaderLen];
  std::memcpy(hdr, header, sizeof(hdr));
  std::memset(hdr + kCommandCrcOffset, 0, 4);
  uint32_t crc = crc32c(0, hdr, sizeof(hdr));
  return crc32c(crc, payload, len);
}

namespace {

// Pulls typed values out of a frame's attributes by kind. The first failure
// is kept and every later request becomes a no-op returning a default.
class Assembler {
public:
  Assembler(const AttributeSet &attrs, uint16_t cmd) : attrs_(attrs), cmd_(cmd) {}

  std::string str(AttrType t) { return required<std::string>(t); }
  uint64_t u64(AttrType t) { return required<uint64_t>(t); }
  uint32_t u32(AttrType t) { return required<uint32_t>(t); }
  uint8_t u8(AttrType t) { return required<uint8_t>(t); }
  Uuid uuid(AttrType t) { return required<Uuid>(t); }
  Timespec time(AttrType t) { return required<Timespec>(t); }
  Bytes bytes(AttrType t) { return required<Bytes>(t); }

  std::optional<uint64_t> opt_u64(AttrType t) {
    uint64_t v = 0;
    if (!fetch(t, false, v))
      return std::nullopt;
    return v;
  }
  std::optional<Timespec> opt_time(AttrType t) {
    Timespec v;
    if (!fetch(t, false, v))
      return std::nullopt;
    return v;
  }
  template <typename T> T opt(AttrType t, T dflt) {
    T v = dflt;
    if (!fetch(t, false, v))
      return dflt;
    return v;
  }

  bool ok() const { return !err_; }
  const DecodeError &error() const { return *err_; }

private:
  template <typename T> T required(AttrType t) {
    T v{};
    fetch(t, true, v);
    return v;
  }

  template <typename T> bool fetch(AttrType t, bool required, T &out) {
    if (err_)
      return false;
    const RawAttribute *raw = attrs_.find(t);
    if (!raw) {
      if (required)
        err_ = make_error(DecodeErrc::MissingAttribute, cmd_, (uint16_t)t);
      return false;
    }
    AttrValue v;
    DecodeError e;
    if (!decode_value(*raw, v, e)) {
      e.command = cmd_;
      err_ = e;
      return false;
    }
    T *p = std::get_if<T>(&v);
    if (!p) {
      DecodeError te = make_error(DecodeErrc::InvalidAttributeLength, cmd_, (uint16_t)t);
      te.actual = raw->value.size();
      te.detail = "value type does not match attribute table";
      err_ = te;
      return false;
    }
    out = std::move(*p);
    return true;
  }

  const AttributeSet &attrs_;
  uint16_t cmd_;
  std::optional<DecodeError> err_;
};

// Kinds without a case here come back as cmd::Unknown.
bool assemble(uint16_t type, AttributeSet &attrs, Command &out, DecodeError &err) {
  Assembler a(attrs, type);
  switch ((CommandType)type) {
  case CommandType::SUBVOL:
    out = cmd::Subvol{a.str(AttrType::PATH), a.uuid(AttrType::UUID),
                      a.u64(AttrType::CTRANSID)};
    break;
  case CommandType::SNAPSHOT:
    out = cmd::Snapshot{a.str(AttrType::PATH), a.uuid(AttrType::UUID),
                        a.u64(AttrType::CTRANSID), a.uuid(AttrType::CLONE_UUID),
                        a.u64(AttrType::CLONE_CTRANSID)};
    break;
  case CommandType::MKFILE:
    out = cmd::Mkfile{a.str(AttrType::PATH), a.opt_u64(AttrType::INO)};
    break;
  case CommandType::MKDIR:
    out = cmd::Mkdir{a.str(AttrType::PATH), a.opt_u64(AttrType::INO)};
    break;
  case CommandType::MKFIFO:
    out = cmd::Mkfifo{a.str(AttrType::PATH), a.u64(AttrType::MODE),
                      a.u64(AttrType::RDEV), a.opt_u64(AttrType::INO)};
    break;
  case CommandType::MKSOCK:
    out = cmd::Mksock{a.str(AttrType::PATH), a.u64(AttrType::MODE),
                      a.u64(AttrType::RDEV), a.opt_u64(AttrType::INO)};
    break;
  case CommandType::MKNOD:
    out = cmd::Mknod{a.str(AttrType::PATH), a.u64(AttrType::MODE),
                     a.u64(AttrType::RDEV), a.opt_u64(AttrType::INO)};
    break;
  case CommandType::SYMLINK:
    out = cmd::Symlink{a.str(AttrType::PATH), a.str(AttrType::PATH_LINK),
                       a.opt_u64(AttrType::INO)};
    break;
  case CommandType::RENAME:
    out = cmd::Rename{a.str(AttrType::PATH), a.str(AttrType::PATH_TO)};
    break;
  case CommandType::LINK:
    out = cmd::Link{a.str(AttrType::PATH), a.str(AttrType::PATH_LINK)};
    break;
  case CommandType::UNLINK:
    out = cmd::Unlink{a.str(AttrType::PATH)};
    break;
  case CommandType::RMDIR:
    out = cmd::Rmdir{a.str(AttrType::PATH)};
    break;
  case CommandType::WRITE:
    out = cmd::Write{a.str(AttrType::PATH), a.u64(AttrType::FILE_OFFSET),
                     a.bytes(AttrType::DATA)};
    break;
  case CommandType::CLONE: {
    cmd::Clone c;
    c.path = a.str(AttrType::PATH);
    c.offset = a.u64(AttrType::FILE_OFFSET);
    c.source.len = a.u64(AttrType::CLONE_LEN);
    c.source.uuid = a.uuid(AttrType::CLONE_UUID);
    c.source.ctransid = a.u64(AttrType::CLONE_CTRANSID);
    c.source.path = a.str(AttrType::CLONE_PATH);
    c.source.offset = a.u64(AttrType::CLONE_OFFSET);
    out = std::move(c);
    break;
  }
  case CommandType::SET_XATTR:
    out = cmd::SetXattr{a.str(AttrType::PATH), a.str(AttrType::XATTR_NAME),
                        a.bytes(AttrType::XATTR_DATA)};
    break;
  case CommandType::REMOVE_XATTR:
    out = cmd::RemoveXattr{a.str(AttrType::PATH), a.str(AttrType::XATTR_NAME)};
    break;
  case CommandType::TRUNCATE:
    out = cmd::Truncate{a.str(AttrType::PATH), a.u64(AttrType::SIZE)};
    break;
  case CommandType::CHMOD:
    out = cmd::Chmod{a.str(AttrType::PATH), a.u64(AttrType::MODE)};
    break;
  case CommandType::CHOWN:
    out = cmd::Chown{a.str(AttrType::PATH), a.u64(AttrType::UID),
                     a.u64(AttrType::GID)};
    break;
  case CommandType::UTIMES:
    out = cmd::Utimes{a.str(AttrType::PATH), a.time(AttrType::ATIME),
                      a.time(AttrType::MTIME), a.time(AttrType::CTIME),
                      a.opt_time(AttrType::OTIME)};
    break;
  case CommandType::END:
    out = cmd::End{};
    break;
  case CommandType::UPDATE_EXTENT:
    out = cmd::UpdateExtent{a.str(AttrType::PATH), a.u64(AttrType::FILE_OFFSET),
                            a.u64(AttrType::SIZE)};
    break;
  case CommandType::FALLOCATE:
    out = cmd::Fallocate{a.str(AttrType::PATH), a.u32(AttrType::FALLOCATE_MODE),
                         a.u64(AttrType::FILE_OFFSET), a.u64(AttrType::SIZE)};
    break;
  case CommandType::FILEATTR:
    out = cmd::Fileattr{a.str(AttrType::PATH), a.u64(AttrType::FILEATTR)};
    break;
  case CommandType::ENCODED_WRITE: {
    cmd::EncodedWrite w;
    w.path = a.str(AttrType::PATH);
    w.offset = a.u64(AttrType::FILE_OFFSET);
    w.unencoded_file_len = a.u64(AttrType::UNENCODED_FILE_LEN);
    w.unencoded_len = a.u64(AttrType::UNENCODED_LEN);
    w.unencoded_offset = a.u64(AttrType::UNENCODED_OFFSET);
    w.compression = a.opt(AttrType::COMPRESSION, CompressionType::NONE);
    w.encryption = a.opt(AttrType::ENCRYPTION, EncryptionType::NONE);
    w.data = a.bytes(AttrType::DATA);
    out = std::move(w);
    break;
  }
  case CommandType::ENABLE_VERITY:
    out = cmd::EnableVerity{a.str(AttrType::PATH),
                            a.u8(AttrType::VERITY_ALGORITHM),
                            a.u32(AttrType::VERITY_BLOCK_SIZE),
                            a.bytes(AttrType::VERITY_SALT_DATA),
                            a.bytes(AttrType::VERITY_SIG_DATA)};
    break;
  default:
    Logger::instance().log(LogLevel::DEBUG,
                           "unknown command %u with %zu attributes",
                           (unsigned)type, attrs.size());
    out = cmd::Unknown{type, attrs.release()};
    return true;
  }
  if (!a.ok()) {
    err = a.error();
    return false;
  }
  return true;
}

} // namespace

CommandDecoder::CommandDecoder(uint32_t version, const DecoderConfig &cfg)
    : version_(version), cfg_(cfg) {}

CommandResult CommandDecoder::decode_one(ByteCursor &cursor) const {
  ByteCursor c = cursor;
  const uint8_t *hdr = c.current();
  FrameHeader h;
  if (!c.read_u32(h.len) || !c.read_u16(h.cmd) || !c.read_u32(h.crc)) {
    DecodeError e = make_error(DecodeErrc::UnexpectedEnd);
    e.expected = kCommandHeaderLen;
    e.actual = cursor.remaining();
    return e;
  }

  if (h.len > cfg_.max_payload_len) {
    DecodeError e = make_error(DecodeErrc::FrameTooLarge, h.cmd);
    e.expected = h.len;
    e.actual = cfg_.max_payload_len;
    return e;
  }

  const uint8_t *payload;
  if (!c.read_exact(h.len, payload)) {
    DecodeError e = make_error(DecodeErrc::TruncatedFrame, h.cmd);
    e.expected = h.len;
    e.actual = c.remaining();
    return e;
  }

  uint32_t crc = frame_checksum(hdr, payload, h.len);
  if (crc != h.crc) {
    DecodeError e = make_error(DecodeErrc::ChecksumMismatch, h.cmd);
    e.expected = h.crc;
    e.actual = crc;
    return e;
  }

  AttrDecodeOptions opts;
  opts.version = version_;
  opts.strict = cfg_.strict_attributes;
  AttributeSet attrs;
  DecodeError err;
  if (!AttributeSet::decode_all(payload, h.len, opts, attrs, err)) {
    err.command = h.cmd;
    return err;
  }

  Command out;
  if (!assemble(h.cmd, attrs, out, err))
    return err;

  cursor = c;
  return out;
}

} // namespace sendstream
