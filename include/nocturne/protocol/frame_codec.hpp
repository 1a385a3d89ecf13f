#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <nocturne/core/error.hpp>
#include <nocturne/transport/transport.hpp>

namespace nocturne::protocol {

using transport::Bytes;

// A frame that could not be delivered. Never fatal for the session.
struct DecodeIssue {
    core::ErrorCode code = core::ErrorCode::DecodeError;
    std::string message;
    std::string raw;   // offending bytes, possibly truncated
};

struct DecodedInput {
    std::vector<std::string> frames;
    std::vector<DecodeIssue> issues;
};

// Turns one application message into the units handed to Transport::send
class FrameEncoder {
public:
    virtual ~FrameEncoder() = default;
    virtual core::Result<std::vector<Bytes>> encode(std::string_view text) = 0;
};

// Turns whatever Transport::receive returned into complete frames.
// Stateful; one instance per connection.
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;
    virtual DecodedInput feed(const Bytes& data) = 0;
    virtual void reset() = 0;
};

// Newline-delimited text for stream transports
class LineFrameEncoder : public FrameEncoder {
public:
    core::Result<std::vector<Bytes>> encode(std::string_view text) override;
};

// Splits on '\n'. Trailing '\r' and surrounding whitespace are trimmed; blank
// lines are keep-alives, not frames. A line longer than max_frame_size (0 = unlimited) is
// dropped with a FrameTooLarge issue and decoding resumes after its newline.
class LineFrameDecoder : public FrameDecoder {
public:
    explicit LineFrameDecoder(std::size_t max_frame_size = 0);

    DecodedInput feed(const Bytes& data) override;
    void reset() override;

    std::size_t buffered() const { return buffer_.size(); }

    // Blank lines seen so far; head units send them as keep-alives
    std::size_t keepAlives() const { return keep_alives_; }

private:
    void completeLine(DecodedInput& out);

    std::size_t max_frame_size_;
    std::string buffer_;
    bool discarding_ = false;
    std::size_t keep_alives_ = 0;
};

// Chunk header, all fields big-endian:
//   [message id: u16][chunk index: u16][chunk count: u16][payload...]
// Every message is wrapped, including ones that fit in a single chunk.
struct ChunkHeader {
    static constexpr std::size_t kSize = 6;
    static constexpr std::size_t kMaxChunks = 0xFFFF;

    uint16_t message_id = 0;
    uint16_t index = 0;
    uint16_t total = 0;

    void write(uint8_t* out) const;
    static ChunkHeader read(const uint8_t* in);
};

// Chunking for message transports. max_payload_size bounds each chunk
// including its header; 0 means unbounded (always one chunk).
class ChunkFrameEncoder : public FrameEncoder {
public:
    explicit ChunkFrameEncoder(std::size_t max_payload_size);

    core::Result<std::vector<Bytes>> encode(std::string_view text) override;

    std::size_t chunkCapacity() const { return chunk_capacity_; }

private:
    std::size_t chunk_capacity_;
    uint16_t next_message_id_ = 0;
};

// Reassembles one message at a time. Chunks of the current message may arrive
// in any order. A chunk of a newer message replaces an incomplete one; chunks
// of older messages (late or duplicated datagrams) are reported and ignored.
class ChunkFrameDecoder : public FrameDecoder {
public:
    // Consecutive stale chunks tolerated before the id sequence is considered restarted
    static constexpr std::size_t kMaxStaleChunks = 16;

    explicit ChunkFrameDecoder(std::size_t max_frame_size = 0);

    DecodedInput feed(const Bytes& data) override;
    void reset() override;

    bool assembling() const { return slot_.has_value(); }

private:
    struct Slot {
        uint16_t message_id = 0;
        uint16_t total = 0;
        std::size_t received = 0;
        std::size_t bytes = 0;
        std::vector<std::optional<std::string>> parts;
    };

    std::size_t max_frame_size_;
    std::optional<Slot> slot_;
    std::optional<uint16_t> last_completed_;
    std::size_t stale_chunks_ = 0;
};

std::unique_ptr<FrameEncoder> makeFrameEncoder(transport::TransportKind kind,
                                               std::size_t max_payload_size);
std::unique_ptr<FrameDecoder> makeFrameDecoder(transport::TransportKind kind,
                                               std::size_t max_frame_size);

// JSON text of one frame; DecodeError when malformed
core::Result<nlohmann::json> decodeJson(std::string_view frame);

} // namespace nocturne::protocol
