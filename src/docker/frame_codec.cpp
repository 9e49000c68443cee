#include "docker/frame_codec.hpp"

namespace codebox::docker {
namespace {

constexpr const char kReplacement[] = "\xEF\xBF\xBD";

std::uint32_t ReadBigEndian32(const char* data) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    return (static_cast<std::uint32_t>(bytes[0]) << 24) |
           (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) |
           static_cast<std::uint32_t>(bytes[3]);
}

StreamType ToStreamType(unsigned char value) {
    // stdin (0) only shows up when the daemon echoes input; report it as stdout.
    return value == 2 ? StreamType::kStderr : StreamType::kStdout;
}

}  // namespace

const char* ToString(StreamType stream) {
    switch (stream) {
        case StreamType::kStdin: return "stdin";
        case StreamType::kStdout: return "stdout";
        case StreamType::kStderr: return "stderr";
    }
    return "stdout";
}

std::vector<Frame> FrameDecoder::Feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
    std::vector<Frame> frames;
    while (buffer_.size() - offset_ >= kFrameHeaderSize) {
        const char* header = buffer_.data() + offset_;
        const std::size_t length = ReadBigEndian32(header + 4);
        if (buffer_.size() - offset_ < kFrameHeaderSize + length) {
            break;
        }
        Frame frame{};
        frame.stream = ToStreamType(static_cast<unsigned char>(header[0]));
        frame.payload.assign(header + kFrameHeaderSize, length);
        frames.push_back(std::move(frame));
        offset_ += kFrameHeaderSize + length;
    }
    Compact();
    return frames;
}

void FrameDecoder::Reset() {
    buffer_.clear();
    offset_ = 0;
}

void FrameDecoder::Compact() {
    if (offset_ == 0) {
        return;
    }
    if (offset_ == buffer_.size()) {
        buffer_.clear();
    } else {
        buffer_.erase(0, offset_);
    }
    offset_ = 0;
}

std::string EncodeFrame(StreamType stream, std::string_view payload) {
    const auto length = static_cast<std::uint32_t>(payload.size());
    std::string frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    frame.push_back(static_cast<char>(stream));
    frame.append(3, '\0');
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame.append(payload.data(), payload.size());
    return frame;
}

std::string SanitizeUtf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    const std::size_t size = bytes.size();
    while (i < size) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        std::size_t needed = 0;
        unsigned char lower = 0x80;
        unsigned char upper = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            needed = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            needed = 2;
            if (lead == 0xE0) {
                lower = 0xA0;
            } else if (lead == 0xED) {
                upper = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            needed = 3;
            if (lead == 0xF0) {
                lower = 0x90;
            } else if (lead == 0xF4) {
                upper = 0x8F;
            }
        } else {
            out.append(kReplacement);
            ++i;
            continue;
        }

        // Maximal subpart: consume the valid prefix, then emit one replacement.
        std::size_t consumed = 1;
        bool valid = true;
        for (std::size_t k = 0; k < needed; ++k) {
            if (i + consumed >= size) {
                valid = false;
                break;
            }
            const auto next = static_cast<unsigned char>(bytes[i + consumed]);
            const unsigned char lo = (k == 0) ? lower : 0x80;
            const unsigned char hi = (k == 0) ? upper : 0xBF;
            if (next < lo || next > hi) {
                valid = false;
                break;
            }
            ++consumed;
        }
        if (valid) {
            out.append(bytes.data() + i, consumed);
        } else {
            out.append(kReplacement);
        }
        i += consumed;
    }
    return out;
}

std::string Utf8StreamDecoder::Decode(std::string_view bytes) {
    std::string data = std::move(pending_);
    pending_.clear();
    data.append(bytes.data(), bytes.size());

    // Look for a lead byte among the last three bytes whose sequence is cut short.
    const std::size_t size = data.size();
    const std::size_t window = size < 3 ? size : 3;
    for (std::size_t back = 1; back <= window; ++back) {
        const auto byte = static_cast<unsigned char>(data[size - back]);
        if ((byte & 0xC0) == 0x80) {
            continue;
        }
        std::size_t expected = 0;
        if (byte >= 0xC2 && byte <= 0xDF) {
            expected = 2;
        } else if (byte >= 0xE0 && byte <= 0xEF) {
            expected = 3;
        } else if (byte >= 0xF0 && byte <= 0xF4) {
            expected = 4;
        }
        if (expected > back) {
            pending_ = data.substr(size - back);
            data.resize(size - back);
        }
        break;
    }
    return SanitizeUtf8(data);
}

std::string Utf8StreamDecoder::Flush() {
    if (pending_.empty()) {
        return {};
    }
    auto text = SanitizeUtf8(pending_);
    pending_.clear();
    return text;
}

}  // namespace codebox::docker
