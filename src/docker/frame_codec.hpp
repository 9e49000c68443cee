#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codebox::docker {

enum class StreamType : std::uint8_t {
    kStdin = 0,
    kStdout = 1,
    kStderr = 2
};

const char* ToString(StreamType stream);

struct Frame {
    StreamType stream = StreamType::kStdout;
    std::string payload;
};

constexpr std::size_t kFrameHeaderSize = 8;

// Incremental decoder for the multiplexed attach stream (Tty=false):
//   [stream:1][reserved:3][length:4 big-endian][payload:length]
// Bytes of an incomplete frame stay buffered until the rest arrives.
class FrameDecoder {
public:
    std::vector<Frame> Feed(std::string_view bytes);
    std::size_t Buffered() const { return buffer_.size() - offset_; }
    void Reset();

private:
    void Compact();

    std::string buffer_;
    std::size_t offset_ = 0;
};

std::string EncodeFrame(StreamType stream, std::string_view payload);

// Decodes as UTF-8, substituting U+FFFD for each invalid sequence.
std::string SanitizeUtf8(std::string_view bytes);

// Per-stream text decoder: a multi-byte character split across two frames is
// held back and completed by the next payload instead of being replaced.
class Utf8StreamDecoder {
public:
    std::string Decode(std::string_view bytes);
    std::string Flush();

private:
    std::string pending_;
};

}  // namespace codebox::docker
