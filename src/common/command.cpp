#include "command.hpp"
#include "util.hpp"
#include <sys/stat.h>
#include <cinttypes>
#include <cstdio>
#include <string>

namespace sendstream {

namespace cmd {

bool operator==(const Subvol &a, const Subvol &b) {
  return a.path == b.path && a.uuid == b.uuid && a.ctransid == b.ctransid;
}
bool operator==(const Snapshot &a, const Snapshot &b) {
  return a.path == b.path && a.uuid == b.uuid && a.ctransid == b.ctransid &&
         a.clone_uuid == b.clone_uuid && a.clone_ctransid == b.clone_ctransid;
}
bool operator==(const Mkfile &a, const Mkfile &b) {
  return a.path == b.path && a.ino == b.ino;
}
bool operator==(const Mkdir &a, const Mkdir &b) {
  return a.path == b.path && a.ino == b.ino;
}
bool operator==(const Mkfifo &a, const Mkfifo &b) {
  return a.path == b.path && a.mode == b.mode && a.rdev == b.rdev &&
         a.ino == b.ino;
}
bool operator==(const Mksock &a, const Mksock &b) {
  return a.path == b.path && a.mode == b.mode && a.rdev == b.rdev &&
         a.ino == b.ino;
}
bool operator==(const Mknod &a, const Mknod &b) {
  return a.path == b.path && a.mode == b.mode && a.rdev == b.rdev &&
         a.ino == b.ino;
}
bool operator==(const Symlink &a, const Symlink &b) {
  return a.path == b.path && a.target == b.target && a.ino == b.ino;
}
bool operator==(const Rename &a, const Rename &b) {
  return a.from == b.from && a.to == b.to;
}
bool operator==(const Link &a, const Link &b) {
  return a.path == b.path && a.target == b.target;
}
bool operator==(const Unlink &a, const Unlink &b) { return a.path == b.path; }
bool operator==(const Rmdir &a, const Rmdir &b) { return a.path == b.path; }
bool operator==(const Write &a, const Write &b) {
  return a.path == b.path && a.offset == b.offset && a.data == b.data;
}
bool operator==(const ClonedExtentRef &a, const ClonedExtentRef &b) {
  return a.uuid == b.uuid && a.ctransid == b.ctransid && a.path == b.path &&
         a.offset == b.offset && a.len == b.len;
}
bool operator==(const Clone &a, const Clone &b) {
  return a.path == b.path && a.offset == b.offset && a.source == b.source;
}
bool operator==(const SetXattr &a, const SetXattr &b) {
  return a.path == b.path && a.name == b.name && a.data == b.data;
}
bool operator==(const RemoveXattr &a, const RemoveXattr &b) {
  return a.path == b.path && a.name == b.name;
}
bool operator==(const Truncate &a, const Truncate &b) {
  return a.path == b.path && a.size == b.size;
}
bool operator==(const Chmod &a, const Chmod &b) {
  return a.path == b.path && a.mode == b.mode;
}
bool operator==(const Chown &a, const Chown &b) {
  return a.path == b.path && a.uid == b.uid && a.gid == b.gid;
}
bool operator==(const Utimes &a, const Utimes &b) {
  return a.path == b.path && a.atime == b.atime && a.mtime == b.mtime &&
         a.ctime == b.ctime && a.otime == b.otime;
}
bool operator==(const End &, const End &) { return true; }
bool operator==(const UpdateExtent &a, const UpdateExtent &b) {
  return a.path == b.path && a.offset == b.offset && a.len == b.len;
}
bool operator==(const Fallocate &a, const Fallocate &b) {
  return a.path == b.path && a.mode == b.mode && a.offset == b.offset &&
         a.len == b.len;
}
bool operator==(const Fileattr &a, const Fileattr &b) {
  return a.path == b.path && a.attr == b.attr;
}
bool operator==(const EncodedWrite &a, const EncodedWrite &b) {
  return a.path == b.path && a.offset == b.offset &&
         a.unencoded_file_len == b.unencoded_file_len &&
         a.unencoded_len == b.unencoded_len &&
         a.unencoded_offset == b.unencoded_offset &&
         a.compression == b.compression && a.encryption == b.encryption &&
         a.data == b.data;
}
bool operator==(const EnableVerity &a, const EnableVerity &b) {
  return a.path == b.path && a.algorithm == b.algorithm &&
         a.block_size == b.block_size && a.salt == b.salt && a.sig == b.sig;
}
bool operator==(const Unknown &a, const Unknown &b) {
  return a.type == b.type && a.attrs == b.attrs;
}

} // namespace cmd

namespace {

CommandType kind(const cmd::Subvol &) { return CommandType::SUBVOL; }
CommandType kind(const cmd::Snapshot &) { return CommandType::SNAPSHOT; }
CommandType kind(const cmd::Mkfile &) { return CommandType::MKFILE; }
CommandType kind(const cmd::Mkdir &) { return CommandType::MKDIR; }
CommandType kind(const cmd::Mknod &) { return CommandType::MKNOD; }
CommandType kind(const cmd::Mkfifo &) { return CommandType::MKFIFO; }
CommandType kind(const cmd::Mksock &) { return CommandType::MKSOCK; }
CommandType kind(const cmd::Symlink &) { return CommandType::SYMLINK; }
CommandType kind(const cmd::Rename &) { return CommandType::RENAME; }
CommandType kind(const cmd::Link &) { return CommandType::LINK; }
CommandType kind(const cmd::Unlink &) { return CommandType::UNLINK; }
CommandType kind(const cmd::Rmdir &) { return CommandType::RMDIR; }
CommandType kind(const cmd::Write &) { return CommandType::WRITE; }
CommandType kind(const cmd::Clone &) { return CommandType::CLONE; }
CommandType kind(const cmd::SetXattr &) { return CommandType::SET_XATTR; }
CommandType kind(const cmd::RemoveXattr &) { return CommandType::REMOVE_XATTR; }
CommandType kind(const cmd::Truncate &) { return CommandType::TRUNCATE; }
CommandType kind(const cmd::Chmod &) { return CommandType::CHMOD; }
CommandType kind(const cmd::Chown &) { return CommandType::CHOWN; }
CommandType kind(const cmd::Utimes &) { return CommandType::UTIMES; }
CommandType kind(const cmd::End &) { return CommandType::END; }
CommandType kind(const cmd::UpdateExtent &) { return CommandType::UPDATE_EXTENT; }
CommandType kind(const cmd::Fallocate &) { return CommandType::FALLOCATE; }
CommandType kind(const cmd::Fileattr &) { return CommandType::FILEATTR; }
CommandType kind(const cmd::EncodedWrite &) { return CommandType::ENCODED_WRITE; }
CommandType kind(const cmd::EnableVerity &) { return CommandType::ENABLE_VERITY; }
CommandType kind(const cmd::Unknown &u) { return (CommandType)u.type; }

std::string u64_field(const char *key, uint64_t v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), " %s=%" PRIu64, key, v);
  return buf;
}

std::string oct_field(const char *key, uint64_t v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), " %s=%" PRIo64, key, v);
  return buf;
}

std::string time_field(const char *key, const Timespec &t) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), " %s=%" PRId64 ".%09u", key, t.sec,
                (unsigned)t.nsec);
  return buf;
}

std::string ino_field(const std::optional<uint64_t> &ino) {
  return ino ? u64_field("ino", *ino) : std::string();
}

// Attributes of unknown commands are rendered by the type the attribute table
// gives their kind; values that do not decode are shown raw.
std::string attr_field(const RawAttribute &a) {
  const AttrSpec *spec = find_attr_spec(a.type);
  AttrValue v;
  DecodeError err;
  if (!spec || !decode_value(a, v, err))
    return printable_data(a.value, 32);
  char buf[64];
  switch (spec->kind) {
  case ValueKind::U64:
    std::snprintf(buf, sizeof(buf), "%" PRIu64, std::get<uint64_t>(v));
    return buf;
  case ValueKind::U32:
    return std::to_string(std::get<uint32_t>(v));
  case ValueKind::U8:
    return std::to_string((unsigned)std::get<uint8_t>(v));
  case ValueKind::STRING:
    return std::get<std::string>(v);
  case ValueKind::UUID:
    return uuid_to_string(std::get<Uuid>(v));
  case ValueKind::TIMESPEC:
    std::snprintf(buf, sizeof(buf), "%" PRId64 ".%09u",
                  std::get<Timespec>(v).sec,
                  (unsigned)std::get<Timespec>(v).nsec);
    return buf;
  case ValueKind::COMPRESSION:
    return compression_name(std::get<CompressionType>(v));
  case ValueKind::ENCRYPTION:
    return encryption_name(std::get<EncryptionType>(v));
  case ValueKind::BYTES:
    break;
  }
  return printable_data(a.value, 32);
}

struct Describer {
  std::string operator()(const cmd::Subvol &c) const {
    return c.path + " uuid=" + uuid_to_string(c.uuid) +
           u64_field("transid", c.ctransid);
  }
  std::string operator()(const cmd::Snapshot &c) const {
    return c.path + " uuid=" + uuid_to_string(c.uuid) +
           u64_field("transid", c.ctransid) +
           " parent_uuid=" + uuid_to_string(c.clone_uuid) +
           u64_field("parent_transid", c.clone_ctransid);
  }
  std::string operator()(const cmd::Mkfile &c) const { return c.path + ino_field(c.ino); }
  std::string operator()(const cmd::Mkdir &c) const { return c.path + ino_field(c.ino); }
  std::string operator()(const cmd::Mkfifo &c) const {
    return special(c.path, c.mode, c.rdev, c.ino);
  }
  std::string operator()(const cmd::Mksock &c) const {
    return special(c.path, c.mode, c.rdev, c.ino);
  }
  std::string operator()(const cmd::Mknod &c) const {
    return special(c.path, c.mode, c.rdev, c.ino);
  }
  std::string operator()(const cmd::Symlink &c) const {
    return c.path + " dest=" + c.target + ino_field(c.ino);
  }
  std::string operator()(const cmd::Rename &c) const { return c.from + " dest=" + c.to; }
  std::string operator()(const cmd::Link &c) const { return c.path + " dest=" + c.target; }
  std::string operator()(const cmd::Unlink &c) const { return c.path; }
  std::string operator()(const cmd::Rmdir &c) const { return c.path; }
  std::string operator()(const cmd::Write &c) const {
    return c.path + u64_field("offset", c.offset) +
           u64_field("len", c.data.size());
  }
  std::string operator()(const cmd::Clone &c) const {
    return c.path + u64_field("offset", c.offset) +
           u64_field("len", c.source.len) + " from=" + c.source.path +
           u64_field("clone_offset", c.source.offset) +
           " clone_uuid=" + uuid_to_string(c.source.uuid) +
           u64_field("clone_transid", c.source.ctransid);
  }
  std::string operator()(const cmd::SetXattr &c) const {
    return c.path + " name=" + c.name + " data=" + printable_data(c.data) +
           u64_field("len", c.data.size());
  }
  std::string operator()(const cmd::RemoveXattr &c) const {
    return c.path + " name=" + c.name;
  }
  std::string operator()(const cmd::Truncate &c) const {
    return c.path + u64_field("size", c.size);
  }
  std::string operator()(const cmd::Chmod &c) const {
    return c.path + oct_field("mode", c.mode);
  }
  std::string operator()(const cmd::Chown &c) const {
    return c.path + u64_field("gid", c.gid) + u64_field("uid", c.uid);
  }
  std::string operator()(const cmd::Utimes &c) const {
    std::string s = c.path + time_field("atime", c.atime) +
                    time_field("mtime", c.mtime) + time_field("ctime", c.ctime);
    if (c.otime)
      s += time_field("otime", *c.otime);
    return s;
  }
  std::string operator()(const cmd::End &) const { return std::string(); }
  std::string operator()(const cmd::UpdateExtent &c) const {
    return c.path + u64_field("offset", c.offset) + u64_field("len", c.len);
  }
  std::string operator()(const cmd::Fallocate &c) const {
    return c.path + u64_field("mode", c.mode) + u64_field("offset", c.offset) +
           u64_field("len", c.len);
  }
  std::string operator()(const cmd::Fileattr &c) const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), " fileattr=0x%" PRIx64, c.attr);
    return c.path + buf;
  }
  std::string operator()(const cmd::EncodedWrite &c) const {
    return c.path + u64_field("offset", c.offset) +
           u64_field("len", c.data.size()) +
           u64_field("unencoded_file_len", c.unencoded_file_len) +
           u64_field("unencoded_len", c.unencoded_len) +
           u64_field("unencoded_offset", c.unencoded_offset) +
           " compression=" + compression_name(c.compression) +
           " encryption=" + encryption_name(c.encryption);
  }
  std::string operator()(const cmd::EnableVerity &c) const {
    return c.path + u64_field("algorithm", c.algorithm) +
           u64_field("block_size", c.block_size) +
           " salt=" + bytes_to_hex(c.salt.data(), c.salt.size()) +
           " sig=" + printable_data(c.sig);
  }
  std::string operator()(const cmd::Unknown &c) const {
    std::string s = "attrs=" + std::to_string(c.attrs.size());
    for (const auto &a : c.attrs) {
      const char *name = attr_type_name(a.type);
      s += " ";
      s += name ? name : std::to_string(a.type);
      s += "=" + attr_field(a);
    }
    return s;
  }

private:
  static std::string special(const std::string &path, uint64_t mode,
                             uint64_t rdev, const std::optional<uint64_t> &ino) {
    return path + oct_field("mode", mode_perm(mode)) + " type=" +
           file_type_name(mode) + u64_field("rdev", rdev) + ino_field(ino);
  }
};

} // namespace

uint16_t command_type(const Command &c) {
  return (uint16_t)std::visit([](const auto &v) { return kind(v); }, c);
}

const char *command_name(const Command &c) {
  const char *name = command_type_name(command_type(c));
  if (!name || std::holds_alternative<cmd::Unknown>(c))
    return "unknown";
  return name;
}

bool is_end(const Command &c) { return std::holds_alternative<cmd::End>(c); }

const char *file_type_name(uint64_t mode) {
  switch (mode_type(mode)) {
  case S_IFIFO:
    return "fifo";
  case S_IFCHR:
    return "chr";
  case S_IFDIR:
    return "dir";
  case S_IFBLK:
    return "blk";
  case S_IFREG:
    return "reg";
  case S_IFLNK:
    return "lnk";
  case S_IFSOCK:
    return "sock";
  }
  return "unknown";
}

std::string describe(const Command &c) {
  char head[32];
  if (std::holds_alternative<cmd::Unknown>(c))
    std::snprintf(head, sizeof(head), "unknown(%u)", (unsigned)command_type(c));
  else
    std::snprintf(head, sizeof(head), "%s", command_name(c));
  char padded[40];
  std::snprintf(padded, sizeof(padded), "%-16s", head);
  std::string body = std::visit(Describer{}, c);
  std::string line = padded;
  line += body;
  while (!line.empty() && line.back() == ' ')
    line.pop_back();
  return line;
}

} // namespace sendstream
