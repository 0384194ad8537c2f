#include "protocol.hpp"

namespace sendstream {

const char *command_type_name(uint16_t type) {
  static const char *const kNames[kMaxCommandType + 1] = {
      nullptr,         "subvol",       "snapshot",  "mkfile",
      "mkdir",         "mknod",        "mkfifo",    "mksock",
      "symlink",       "rename",       "link",      "unlink",
      "rmdir",         "set_xattr",    "remove_xattr", "write",
      "clone",         "truncate",     "chmod",     "chown",
      "utimes",        "end",          "update_extent", "fallocate",
      "fileattr",      "encoded_write", "enable_verity"};
  if (type > kMaxCommandType)
    return nullptr;
  return kNames[type];
}

const char *attr_type_name(uint16_t type) {
  static const char *const kNames[kMaxAttrType + 1] = {
      nullptr,
      "uuid",
      "ctransid",
      "ino",
      "size",
      "mode",
      "uid",
      "gid",
      "rdev",
      "ctime",
      "mtime",
      "atime",
      "otime",
      "xattr_name",
      "xattr_data",
      "path",
      "path_to",
      "path_link",
      "file_offset",
      "data",
      "clone_uuid",
      "clone_ctransid",
      "clone_path",
      "clone_offset",
      "clone_len",
      "fallocate_mode",
      "fileattr",
      "unencoded_file_len",
      "unencoded_len",
      "unencoded_offset",
      "compression",
      "encryption",
      "verity_algorithm",
      "verity_block_size",
      "verity_salt_data",
      "verity_sig_data"};
  if (type > kMaxAttrType)
    return nullptr;
  return kNames[type];
}

} // namespace sendstream
