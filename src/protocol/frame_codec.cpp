#include "nocturne/protocol/frame_codec.hpp"
#include "nocturne/core/logger.hpp"

#include <algorithm>

namespace nocturne::protocol {

using core::ErrorCode;
using core::Result;

namespace {

// Diagnostics carry at most this much of the offending input
constexpr std::size_t kRawExcerpt = 128;

std::string excerpt(std::string_view raw) {
    if (raw.size() <= kRawExcerpt) {
        return std::string(raw);
    }
    return std::string(raw.substr(0, kRawExcerpt)) + "...";
}

std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

// Serial number comparison over the 16-bit id space
bool isNewerMessage(uint16_t id, uint16_t reference) {
    return static_cast<int16_t>(static_cast<uint16_t>(id - reference)) > 0;
}

} // namespace

// LineFrameEncoder

Result<std::vector<Bytes>> LineFrameEncoder::encode(std::string_view text) {
    if (text.find('\n') != std::string_view::npos) {
        return {ErrorCode::InvalidArgument, "Frame text contains a newline"};
    }

    Bytes line(text.begin(), text.end());
    line.push_back('\n');
    return std::vector<Bytes>{std::move(line)};
}

// LineFrameDecoder

LineFrameDecoder::LineFrameDecoder(std::size_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

DecodedInput LineFrameDecoder::feed(const Bytes& data) {
    DecodedInput out;

    auto begin = data.begin();
    while (begin != data.end()) {
        auto newline = std::find(begin, data.end(), static_cast<uint8_t>('\n'));

        if (!discarding_) {
            buffer_.append(begin, newline);
        }

        if (newline == data.end()) {
            if (!discarding_ && max_frame_size_ > 0 && buffer_.size() > max_frame_size_) {
                out.issues.push_back({ErrorCode::FrameTooLarge,
                    "Frame exceeds " + std::to_string(max_frame_size_) + " bytes, skipping to next line",
                    excerpt(buffer_)});
                buffer_.clear();
                discarding_ = true;
            }
            break;
        }

        if (discarding_) {
            discarding_ = false;
        } else {
            completeLine(out);
        }
        buffer_.clear();
        begin = newline + 1;
    }

    return out;
}

void LineFrameDecoder::completeLine(DecodedInput& out) {
    auto line = trim(buffer_);
    if (line.empty()) {
        // Keep-alive, not a frame
        keep_alives_++;
        core::Logger::debug("Keep-alive line received");
        return;
    }
    if (max_frame_size_ > 0 && line.size() > max_frame_size_) {
        out.issues.push_back({ErrorCode::FrameTooLarge,
            "Frame exceeds " + std::to_string(max_frame_size_) + " bytes",
            excerpt(line)});
        return;
    }
    out.frames.emplace_back(line);
}

void LineFrameDecoder::reset() {
    buffer_.clear();
    discarding_ = false;
    keep_alives_ = 0;
}

// ChunkHeader

void ChunkHeader::write(uint8_t* out) const {
    out[0] = static_cast<uint8_t>(message_id >> 8);
    out[1] = static_cast<uint8_t>(message_id & 0xFF);
    out[2] = static_cast<uint8_t>(index >> 8);
    out[3] = static_cast<uint8_t>(index & 0xFF);
    out[4] = static_cast<uint8_t>(total >> 8);
    out[5] = static_cast<uint8_t>(total & 0xFF);
}

ChunkHeader ChunkHeader::read(const uint8_t* in) {
    ChunkHeader header;
    header.message_id = static_cast<uint16_t>((in[0] << 8) | in[1]);
    header.index = static_cast<uint16_t>((in[2] << 8) | in[3]);
    header.total = static_cast<uint16_t>((in[4] << 8) | in[5]);
    return header;
}

// ChunkFrameEncoder

ChunkFrameEncoder::ChunkFrameEncoder(std::size_t max_payload_size)
    : chunk_capacity_(0) {
    if (max_payload_size == 0) {
        return;
    }
    if (max_payload_size <= ChunkHeader::kSize) {
        core::throw_error(ErrorCode::InvalidArgument,
            "Max payload size " + std::to_string(max_payload_size) +
            " leaves no room after the chunk header");
    }
    chunk_capacity_ = max_payload_size - ChunkHeader::kSize;
}

Result<std::vector<Bytes>> ChunkFrameEncoder::encode(std::string_view text) {
    std::size_t total = 1;
    if (chunk_capacity_ > 0 && text.size() > chunk_capacity_) {
        total = (text.size() + chunk_capacity_ - 1) / chunk_capacity_;
    }
    if (total > ChunkHeader::kMaxChunks) {
        return {ErrorCode::FrameTooLarge,
            "Message of " + std::to_string(text.size()) + " bytes needs more than " +
            std::to_string(ChunkHeader::kMaxChunks) + " chunks"};
    }

    ChunkHeader header;
    header.message_id = next_message_id_++;
    header.total = static_cast<uint16_t>(total);

    std::vector<Bytes> chunks;
    chunks.reserve(total);

    std::size_t offset = 0;
    for (std::size_t i = 0; i < total; ++i) {
        std::size_t length = chunk_capacity_ > 0
            ? std::min(chunk_capacity_, text.size() - offset)
            : text.size();

        Bytes chunk(ChunkHeader::kSize + length);
        header.index = static_cast<uint16_t>(i);
        header.write(chunk.data());
        std::copy_n(text.data() + offset, length, chunk.begin() + ChunkHeader::kSize);

        chunks.push_back(std::move(chunk));
        offset += length;
    }

    return chunks;
}

// ChunkFrameDecoder

ChunkFrameDecoder::ChunkFrameDecoder(std::size_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

DecodedInput ChunkFrameDecoder::feed(const Bytes& data) {
    DecodedInput out;
    std::string raw(data.begin(), data.end());

    if (data.size() < ChunkHeader::kSize) {
        out.issues.push_back({ErrorCode::DecodeError,
            "Chunk of " + std::to_string(data.size()) + " bytes is shorter than its header",
            excerpt(raw)});
        return out;
    }

    auto header = ChunkHeader::read(data.data());
    if (header.total == 0 || header.index >= header.total) {
        out.issues.push_back({ErrorCode::DecodeError,
            "Invalid chunk " + std::to_string(header.index) + "/" + std::to_string(header.total) +
            " of message " + std::to_string(header.message_id),
            excerpt(raw)});
        return out;
    }

    if (!slot_ || slot_->message_id != header.message_id) {
        // Ids only move forward; anything at or behind the newest id seen is a late copy
        std::optional<uint16_t> newest = slot_ ? std::optional<uint16_t>(slot_->message_id) : last_completed_;
        if (newest && !isNewerMessage(header.message_id, *newest)) {
            if (++stale_chunks_ <= kMaxStaleChunks) {
                out.issues.push_back({ErrorCode::DecodeError,
                    "Stale chunk " + std::to_string(header.index) + "/" + std::to_string(header.total) +
                    " of message " + std::to_string(header.message_id) + " ignored",
                    excerpt(raw)});
                return out;
            }
            // A run of old ids means the peer restarted its numbering
            core::Logger::info("Chunk message ids restarted at {}, resynchronizing", header.message_id);
            last_completed_.reset();
        }
        stale_chunks_ = 0;

        if (slot_) {
            out.issues.push_back({ErrorCode::DecodeError,
                "Discarded incomplete message " + std::to_string(slot_->message_id) + " (" +
                std::to_string(slot_->received) + "/" + std::to_string(slot_->total) + " chunks)",
                ""});
            slot_.reset();
        }
    }

    if (!slot_) {
        Slot slot;
        slot.message_id = header.message_id;
        slot.total = header.total;
        slot.parts.resize(header.total);
        slot_ = std::move(slot);
    } else if (slot_->total != header.total) {
        out.issues.push_back({ErrorCode::DecodeError,
            "Chunk count changed from " + std::to_string(slot_->total) + " to " +
            std::to_string(header.total) + " within message " + std::to_string(header.message_id),
            excerpt(raw)});
        return out;
    }

    auto& part = slot_->parts[header.index];
    if (part) {
        core::Logger::debug("Duplicate chunk {} of message {}", header.index, header.message_id);
        return out;
    }

    part = raw.substr(ChunkHeader::kSize);
    slot_->received++;
    slot_->bytes += part->size();

    if (max_frame_size_ > 0 && slot_->bytes > max_frame_size_) {
        out.issues.push_back({ErrorCode::FrameTooLarge,
            "Message " + std::to_string(header.message_id) + " exceeds " +
            std::to_string(max_frame_size_) + " bytes",
            ""});
        slot_.reset();
        return out;
    }

    if (slot_->received < slot_->total) {
        return out;
    }

    std::string message;
    message.reserve(slot_->bytes);
    for (const auto& chunk : slot_->parts) {
        message += *chunk;
    }
    last_completed_ = slot_->message_id;
    slot_.reset();

    auto frame = trim(message);
    if (!frame.empty()) {
        out.frames.emplace_back(frame);
    }
    return out;
}

void ChunkFrameDecoder::reset() {
    slot_.reset();
    last_completed_.reset();
    stale_chunks_ = 0;
}

// Factories

std::unique_ptr<FrameEncoder> makeFrameEncoder(transport::TransportKind kind,
                                               std::size_t max_payload_size) {
    if (kind == transport::TransportKind::Message) {
        return std::make_unique<ChunkFrameEncoder>(max_payload_size);
    }
    return std::make_unique<LineFrameEncoder>();
}

std::unique_ptr<FrameDecoder> makeFrameDecoder(transport::TransportKind kind,
                                               std::size_t max_frame_size) {
    if (kind == transport::TransportKind::Message) {
        return std::make_unique<ChunkFrameDecoder>(max_frame_size);
    }
    return std::make_unique<LineFrameDecoder>(max_frame_size);
}

Result<nlohmann::json> decodeJson(std::string_view frame) {
    auto parsed = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return {ErrorCode::DecodeError, "Malformed JSON frame"};
    }
    return parsed;
}

} // namespace nocturne::protocol
