#include "stream_decoder.hpp"
#include "logging.hpp"
#include <cinttypes>
#include <cstring>

namespace sendstream {

const char *state_name(StreamDecoder::State s) {
  switch (s) {
  case StreamDecoder::State::Start:
    return "start";
  case StreamDecoder::State::HeaderValidated:
    return "header-validated";
  case StreamDecoder::State::Streaming:
    return "streaming";
  case StreamDecoder::State::Finished:
    return "finished";
  case StreamDecoder::State::Error:
    return "error";
  }
  return "?";
}

StreamDecoder::StreamDecoder(ByteSource &src, const DecoderConfig &cfg)
    : src_(src), cfg_(cfg) {}

// Reads until buf_ holds `need` bytes, never past that.
bool StreamDecoder::fill(size_t need) {
  while (buf_.size() < need) {
    size_t old = buf_.size();
    buf_.resize(need);
    size_t k = src_.read_some(buf_.data() + old, need - old);
    buf_.resize(old + k);
    bytes_read_ += k;
    if (k == 0)
      return false;
  }
  return true;
}

DecodeError StreamDecoder::fail(DecodeError e) {
  Logger::instance().log(LogLevel::DEBUG, "sendstream: %s (while %s)",
                         e.message().c_str(), state_name(state_));
  state_ = State::Error;
  error_ = e;
  buf_.clear();
  buf_.shrink_to_fit();
  return error_;
}

DecodeError StreamDecoder::source_error() {
  DecodeError e = make_error(DecodeErrc::SourceFailure);
  e.offset = offset_;
  e.detail = src_.error_message();
  return e;
}

HeaderResult StreamDecoder::open() {
  if (state_ == State::Error)
    return error_;
  if (state_ != State::Start)
    return header_;

  bool complete = fill(kStreamHeaderLen);
  if (!complete && src_.failed())
    return fail(source_error());
  if (buf_.size() < kMagicLen || std::memcmp(buf_.data(), kMagic, kMagicLen) != 0)
    return fail(make_error(DecodeErrc::NotASendstream));
  if (!complete) {
    DecodeError e = make_error(DecodeErrc::UnexpectedEnd);
    e.expected = kStreamHeaderLen;
    e.actual = buf_.size();
    return fail(e);
  }

  ByteCursor c(buf_);
  uint32_t version = 0;
  if (!c.skip(kMagicLen) || !c.read_u32(version)) {
    DecodeError e = make_error(DecodeErrc::UnexpectedEnd);
    e.expected = kStreamHeaderLen;
    e.actual = buf_.size();
    return fail(e);
  }
  if (version < kMinVersion) {
    DecodeError e = make_error(DecodeErrc::UnsupportedVersion);
    e.expected = kMinVersion;
    e.actual = version;
    return fail(e);
  }
  header_.version = version;
  header_.known_version = version <= kMaxKnownVersion;
  if (!header_.known_version)
    Logger::instance().log(LogLevel::WARN,
                           "sendstream version %u is newer than %u, "
                           "unknown commands will be passed through",
                           (unsigned)version, (unsigned)kMaxKnownVersion);
  else
    Logger::instance().log(LogLevel::DEBUG, "sendstream version %u",
                           (unsigned)version);

  decoder_.emplace(version, cfg_);
  offset_ = kStreamHeaderLen;
  buf_.clear();
  state_ = State::HeaderValidated;
  return header_;
}

NextResult StreamDecoder::next() {
  if (state_ == State::Finished)
    return StreamEnd{};
  if (state_ == State::Error)
    return error_;
  if (state_ == State::Start) {
    HeaderResult h = open();
    if (auto *e = std::get_if<DecodeError>(&h))
      return *e;
  }
  state_ = State::Streaming;

  FrameHeader h;
  if (fill(kCommandHeaderLen) &&
      parse_frame_header(buf_.data(), buf_.size(), h)) {
    if (h.len <= cfg_.max_payload_len &&
        !fill(kCommandHeaderLen + (size_t)h.len) && src_.failed())
      return fail(source_error());
  } else if (src_.failed()) {
    return fail(source_error());
  } else if (buf_.empty()) {
    // Input ended on a frame boundary without an end command.
    state_ = State::Finished;
    Logger::instance().log(LogLevel::DEBUG,
                           "sendstream ended without end command after %" PRIu64
                           " commands",
                           commands_);
    return StreamEnd{};
  }

  ByteCursor c(buf_);
  CommandResult r = decoder_->decode_one(c);
  if (auto *e = std::get_if<DecodeError>(&r)) {
    DecodeError err = *e;
    err.offset = offset_;
    return fail(err);
  }
  offset_ += c.position();
  buf_.clear();
  commands_++;

  Command &cmd = std::get<Command>(r);
  if (Logger::instance().enabled(LogLevel::TRACE))
    Logger::instance().log(LogLevel::TRACE, "%s", describe(cmd).c_str());
  if (is_end(cmd))
    state_ = State::Finished;
  return std::move(cmd);
}

std::variant<size_t, DecodeError> decode_streams(ByteSource &src,
                                                 const DecoderConfig &cfg,
                                                 bool single,
                                                 const CommandSink &sink) {
  size_t streams = 0;
  for (;;) {
    StreamDecoder dec(src, cfg);
    HeaderResult h = dec.open();
    if (auto *e = std::get_if<DecodeError>(&h)) {
      // Nothing left after a complete stream is the normal way to stop.
      if (streams > 0 && dec.bytes_read() == 0 &&
          e->code == DecodeErrc::NotASendstream)
        return streams;
      return *e;
    }
    for (;;) {
      NextResult r = dec.next();
      if (auto *e = std::get_if<DecodeError>(&r))
        return *e;
      if (std::holds_alternative<StreamEnd>(r))
        break;
      sink(streams, dec.header(), std::get<Command>(r));
    }
    streams++;
    Logger::instance().log(LogLevel::DEBUG,
                           "stream %zu done: %" PRIu64 " commands, %" PRIu64
                           " bytes",
                           streams, dec.commands(), dec.offset());
    if (single)
      return streams;
  }
}

} // namespace sendstream
