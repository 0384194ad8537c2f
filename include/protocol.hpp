#pragma once
#include <cstdint>
#include <cstddef>

namespace sendstream {

// "btrfs-stream" plus its terminating NUL.
constexpr char kMagic[] = "btrfs-stream";
constexpr size_t kMagicLen = sizeof(kMagic);
static_assert(kMagicLen == 13, "stream magic must be 13 bytes");

constexpr uint32_t kMinVersion = 1;
constexpr uint32_t kMaxKnownVersion = 3;
constexpr size_t kStreamHeaderLen = kMagicLen + 4;

// le32 len, le16 cmd, le32 crc
constexpr size_t kCommandHeaderLen = 10;
constexpr size_t kCommandCrcOffset = 6;

// le16 type, le16 len
constexpr size_t kAttrHeaderLen = 4;

enum class CommandType : uint16_t {
    UNSPEC = 0,
    SUBVOL = 1,
    SNAPSHOT = 2,
    MKFILE = 3,
    MKDIR = 4,
    MKNOD = 5,
    MKFIFO = 6,
    MKSOCK = 7,
    SYMLINK = 8,
    RENAME = 9,
    LINK = 10,
    UNLINK = 11,
    RMDIR = 12,
    SET_XATTR = 13,
    REMOVE_XATTR = 14,
    WRITE = 15,
    CLONE = 16,
    TRUNCATE = 17,
    CHMOD = 18,
    CHOWN = 19,
    UTIMES = 20,
    END = 21,
    UPDATE_EXTENT = 22,
    // version 2
    FALLOCATE = 23,
    FILEATTR = 24,
    ENCODED_WRITE = 25,
    // version 3
    ENABLE_VERITY = 26,
};
constexpr uint16_t kMaxCommandType = 26;

enum class AttrType : uint16_t {
    UNSPEC = 0,
    UUID = 1,
    CTRANSID = 2,
    INO = 3,
    SIZE = 4,
    MODE = 5,
    UID = 6,
    GID = 7,
    RDEV = 8,
    CTIME = 9,
    MTIME = 10,
    ATIME = 11,
    OTIME = 12,
    XATTR_NAME = 13,
    XATTR_DATA = 14,
    PATH = 15,
    PATH_TO = 16,
    PATH_LINK = 17,
    FILE_OFFSET = 18,
    DATA = 19,
    CLONE_UUID = 20,
    CLONE_CTRANSID = 21,
    CLONE_PATH = 22,
    CLONE_OFFSET = 23,
    CLONE_LEN = 24,
    // version 2
    FALLOCATE_MODE = 25,
    FILEATTR = 26,
    UNENCODED_FILE_LEN = 27,
    UNENCODED_LEN = 28,
    UNENCODED_OFFSET = 29,
    COMPRESSION = 30,
    ENCRYPTION = 31,
    // version 3
    VERITY_ALGORITHM = 32,
    VERITY_BLOCK_SIZE = 33,
    VERITY_SALT_DATA = 34,
    VERITY_SIG_DATA = 35,
};
constexpr uint16_t kMaxAttrType = 35;

// Returns nullptr for kinds this decoder does not know.
const char* command_type_name(uint16_t type);
const char* attr_type_name(uint16_t type);

} // namespace sendstream
