#include "errors.hpp"
#include "protocol.hpp"
#include <cinttypes>
#include <cstdio>

namespace sendstream {

const char *errc_name(DecodeErrc code) {
  switch (code) {
  case DecodeErrc::NotASendstream:
    return "not a sendstream";
  case DecodeErrc::UnsupportedVersion:
    return "unsupported version";
  case DecodeErrc::UnexpectedEnd:
    return "unexpected end of input";
  case DecodeErrc::TruncatedFrame:
    return "truncated command";
  case DecodeErrc::TruncatedAttribute:
    return "truncated attribute";
  case DecodeErrc::InvalidAttributeLength:
    return "invalid attribute length";
  case DecodeErrc::ChecksumMismatch:
    return "checksum mismatch";
  case DecodeErrc::MissingAttribute:
    return "missing attribute";
  case DecodeErrc::UnknownAttributeKind:
    return "unknown attribute kind";
  case DecodeErrc::FrameTooLarge:
    return "command too large";
  case DecodeErrc::SourceFailure:
    return "read error";
  }
  return "unknown error";
}

static std::string kind_label(const char *name, uint16_t v) {
  char buf[48];
  if (name)
    std::snprintf(buf, sizeof(buf), "%s(%u)", name, (unsigned)v);
  else
    std::snprintf(buf, sizeof(buf), "%u", (unsigned)v);
  return buf;
}

std::string DecodeError::message() const {
  std::string m = errc_name(code);
  char buf[128];
  switch (code) {
  case DecodeErrc::ChecksumMismatch:
    std::snprintf(buf, sizeof(buf), ": stored 0x%08" PRIx64 " computed 0x%08" PRIx64,
                  expected, actual);
    m += buf;
    break;
  case DecodeErrc::InvalidAttributeLength:
    std::snprintf(buf, sizeof(buf), ": want %" PRIu64 " bytes, got %" PRIu64,
                  expected, actual);
    m += buf;
    break;
  case DecodeErrc::FrameTooLarge:
    std::snprintf(buf, sizeof(buf), ": %" PRIu64 " bytes, limit %" PRIu64,
                  expected, actual);
    m += buf;
    break;
  case DecodeErrc::TruncatedFrame:
  case DecodeErrc::TruncatedAttribute:
    std::snprintf(buf, sizeof(buf), ": need %" PRIu64 " bytes, have %" PRIu64,
                  expected, actual);
    m += buf;
    break;
  case DecodeErrc::UnsupportedVersion:
    std::snprintf(buf, sizeof(buf), ": minimum %" PRIu64 ", found %" PRIu64,
                  expected, actual);
    m += buf;
    break;
  default:
    break;
  }
  if (code == DecodeErrc::MissingAttribute ||
      code == DecodeErrc::UnknownAttributeKind ||
      code == DecodeErrc::InvalidAttributeLength ||
      code == DecodeErrc::TruncatedAttribute)
    m += " attr=" + kind_label(attr_type_name(attribute), attribute);
  if (command != 0)
    m += " cmd=" + kind_label(command_type_name(command), command);
  if (offset != 0) {
    std::snprintf(buf, sizeof(buf), " at offset %" PRIu64, offset);
    m += buf;
  }
  if (!detail.empty())
    m += " (" + detail + ")";
  return m;
}

bool operator==(const DecodeError &a, const DecodeError &b) {
  return a.code == b.code && a.command == b.command &&
         a.attribute == b.attribute && a.expected == b.expected &&
         a.actual == b.actual && a.offset == b.offset && a.detail == b.detail;
}

DecodeError make_error(DecodeErrc code, uint16_t command, uint16_t attribute) {
  DecodeError e;
  e.code = code;
  e.command = command;
  e.attribute = attribute;
  return e;
}

} // namespace sendstream
