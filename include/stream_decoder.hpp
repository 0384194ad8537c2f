#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <variant>
#include <vector>
#include "byte_source.hpp"
#include "command.hpp"
#include "command_decoder.hpp"
#include "errors.hpp"

namespace sendstream {

struct StreamHeader {
    uint32_t version{0};
    // False for versions newer than this decoder knows about.
    bool known_version{true};
};

// Returned by next() once the stream is over, as often as it is asked.
struct StreamEnd {};

using HeaderResult = std::variant<StreamHeader, DecodeError>;
using NextResult = std::variant<Command, StreamEnd, DecodeError>;

// Pull decoder over one stream. Commands are produced one per next() call and
// nothing is kept once returned. The source is consumed exactly up to the end
// of the last frame returned, so another stream may follow on the same source.
class StreamDecoder {
public:
    enum class State { Start, HeaderValidated, Streaming, Finished, Error };

    explicit StreamDecoder(ByteSource& src, const DecoderConfig& cfg = DecoderConfig());

    // Reads and checks the stream header. Later calls return the same result.
    HeaderResult open();
    // Opens the stream first if that has not happened yet.
    NextResult next();

    State state() const { return state_; }
    const StreamHeader& header() const { return header_; }
    // Stream offset just past the last command returned.
    uint64_t offset() const { return offset_; }
    uint64_t bytes_read() const { return bytes_read_; }
    uint64_t commands() const { return commands_; }

private:
    bool fill(size_t need);
    DecodeError fail(DecodeError e);
    DecodeError source_error();

    ByteSource& src_;
    DecoderConfig cfg_;
    State state_{State::Start};
    StreamHeader header_;
    std::optional<CommandDecoder> decoder_;
    std::vector<uint8_t> buf_;
    uint64_t offset_{0};
    uint64_t bytes_read_{0};
    uint64_t commands_{0};
    DecodeError error_;
};

const char* state_name(StreamDecoder::State s);

using CommandSink = std::function<void(size_t stream_index, const StreamHeader&, const Command&)>;

// Decodes streams laid back to back on one source until the input runs out,
// or after the first stream when `single` is set. Returns the number of
// streams decoded or the first error.
std::variant<size_t, DecodeError> decode_streams(ByteSource& src, const DecoderConfig& cfg,
                                                 bool single, const CommandSink& sink);

} // namespace sendstream
