#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "attributes.hpp"
#include "protocol.hpp"

namespace sendstream {

namespace cmd {

struct Subvol {
    std::string path;
    Uuid uuid{};
    uint64_t ctransid{0};
};

struct Snapshot {
    std::string path;
    Uuid uuid{};
    uint64_t ctransid{0};
    Uuid clone_uuid{};
    uint64_t clone_ctransid{0};
};

// The path is usually a temporary name that a later rename moves into place.
struct Mkfile {
    std::string path;
    std::optional<uint64_t> ino;
};
struct Mkdir {
    std::string path;
    std::optional<uint64_t> ino;
};

// Special files. The sender includes mode and rdev for all three kinds; rdev
// is 0 for fifos and sockets.
struct Mknod {
    std::string path;
    uint64_t mode{0};
    uint64_t rdev{0};
    std::optional<uint64_t> ino;
};
struct Mkfifo {
    std::string path;
    uint64_t mode{0};
    uint64_t rdev{0};
    std::optional<uint64_t> ino;
};
struct Mksock {
    std::string path;
    uint64_t mode{0};
    uint64_t rdev{0};
    std::optional<uint64_t> ino;
};

struct Symlink {
    std::string path;
    std::string target;
    std::optional<uint64_t> ino;
};

struct Rename {
    std::string from;
    std::string to;
};

// Hard link: `path` is the new name, `target` the existing one.
struct Link {
    std::string path;
    std::string target;
};

struct Unlink {
    std::string path;
};

struct Rmdir {
    std::string path;
};

struct Write {
    std::string path;
    uint64_t offset{0};
    Bytes data;
};

// Where a clone copies its extent from.
struct ClonedExtentRef {
    Uuid uuid{};
    uint64_t ctransid{0};
    std::string path;
    uint64_t offset{0};
    uint64_t len{0};
};

struct Clone {
    std::string path;
    uint64_t offset{0};
    ClonedExtentRef source;
};

struct SetXattr {
    std::string path;
    std::string name;
    Bytes data;
};

struct RemoveXattr {
    std::string path;
    std::string name;
};

struct Truncate {
    std::string path;
    uint64_t size{0};
};

struct Chmod {
    std::string path;
    uint64_t mode{0};
};

struct Chown {
    std::string path;
    uint64_t uid{0};
    uint64_t gid{0};
};

struct Utimes {
    std::string path;
    Timespec atime;
    Timespec mtime;
    Timespec ctime;
    // Creation time, sent by newer kernels only.
    std::optional<Timespec> otime;
};

struct End {};

struct UpdateExtent {
    std::string path;
    uint64_t offset{0};
    uint64_t len{0};
};

struct Fallocate {
    std::string path;
    uint32_t mode{0};
    uint64_t offset{0};
    uint64_t len{0};
};

struct Fileattr {
    std::string path;
    uint64_t attr{0};
};

struct EncodedWrite {
    std::string path;
    uint64_t offset{0};
    uint64_t unencoded_file_len{0};
    uint64_t unencoded_len{0};
    uint64_t unencoded_offset{0};
    CompressionType compression{CompressionType::NONE};
    EncryptionType encryption{EncryptionType::NONE};
    Bytes data;
};

struct EnableVerity {
    std::string path;
    uint8_t algorithm{0};
    uint32_t block_size{0};
    Bytes salt;
    Bytes sig;
};

// A command kind this decoder has no table entry for, kept verbatim.
struct Unknown {
    uint16_t type{0};
    std::vector<RawAttribute> attrs;
};

bool operator==(const Subvol& a, const Subvol& b);
bool operator==(const Snapshot& a, const Snapshot& b);
bool operator==(const Mkfile& a, const Mkfile& b);
bool operator==(const Mkdir& a, const Mkdir& b);
bool operator==(const Mkfifo& a, const Mkfifo& b);
bool operator==(const Mksock& a, const Mksock& b);
bool operator==(const Mknod& a, const Mknod& b);
bool operator==(const Symlink& a, const Symlink& b);
bool operator==(const Rename& a, const Rename& b);
bool operator==(const Link& a, const Link& b);
bool operator==(const Unlink& a, const Unlink& b);
bool operator==(const Rmdir& a, const Rmdir& b);
bool operator==(const Write& a, const Write& b);
bool operator==(const ClonedExtentRef& a, const ClonedExtentRef& b);
bool operator==(const Clone& a, const Clone& b);
bool operator==(const SetXattr& a, const SetXattr& b);
bool operator==(const RemoveXattr& a, const RemoveXattr& b);
bool operator==(const Truncate& a, const Truncate& b);
bool operator==(const Chmod& a, const Chmod& b);
bool operator==(const Chown& a, const Chown& b);
bool operator==(const Utimes& a, const Utimes& b);
bool operator==(const End& a, const End& b);
bool operator==(const UpdateExtent& a, const UpdateExtent& b);
bool operator==(const Fallocate& a, const Fallocate& b);
bool operator==(const Fileattr& a, const Fileattr& b);
bool operator==(const EncodedWrite& a, const EncodedWrite& b);
bool operator==(const EnableVerity& a, const EnableVerity& b);
bool operator==(const Unknown& a, const Unknown& b);

} // namespace cmd

using Command = std::variant<
    cmd::Subvol, cmd::Snapshot, cmd::Mkfile, cmd::Mkdir, cmd::Mknod, cmd::Mkfifo,
    cmd::Mksock, cmd::Symlink, cmd::Rename, cmd::Link, cmd::Unlink, cmd::Rmdir,
    cmd::Write, cmd::Clone, cmd::SetXattr, cmd::RemoveXattr, cmd::Truncate,
    cmd::Chmod, cmd::Chown, cmd::Utimes, cmd::End, cmd::UpdateExtent,
    cmd::Fallocate, cmd::Fileattr, cmd::EncodedWrite, cmd::EnableVerity,
    cmd::Unknown>;

// Wire kind of the command; for Unknown, the raw kind it was read with.
uint16_t command_type(const Command& c);
const char* command_name(const Command& c);
bool is_end(const Command& c);

// Single line: padded name, path, then key=value fields.
std::string describe(const Command& c);

// Split of a MODE attribute into its file type bits (S_IFMT) and permission
// bits, setuid/setgid/sticky included.
inline uint32_t mode_type(uint64_t mode) { return static_cast<uint32_t>(mode & 0170000); }
inline uint32_t mode_perm(uint64_t mode) { return static_cast<uint32_t>(mode & 07777); }
// "fifo", "chr", "dir", "blk", "reg", "lnk", "sock", or "unknown".
const char* file_type_name(uint64_t mode);

} // namespace sendstream
