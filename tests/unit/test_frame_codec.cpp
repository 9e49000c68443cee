#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "docker/frame_codec.hpp"

using codebox::docker::EncodeFrame;
using codebox::docker::Frame;
using codebox::docker::FrameDecoder;
using codebox::docker::SanitizeUtf8;
using codebox::docker::StreamType;
using codebox::docker::Utf8StreamDecoder;

namespace {

std::string SampleStream() {
    std::string bytes;
    bytes += EncodeFrame(StreamType::kStdout, "hello ");
    bytes += EncodeFrame(StreamType::kStderr, "oops\n");
    bytes += EncodeFrame(StreamType::kStdout, "");
    bytes += EncodeFrame(StreamType::kStdout, std::string(70000, 'x'));
    bytes += EncodeFrame(StreamType::kStdout, "world\n");
    return bytes;
}

std::vector<Frame> DecodeInChunks(const std::string& bytes, std::size_t chunk) {
    FrameDecoder decoder;
    std::vector<Frame> frames;
    for (std::size_t offset = 0; offset < bytes.size(); offset += chunk) {
        for (auto& frame : decoder.Feed(std::string_view(bytes).substr(offset, chunk))) {
            frames.push_back(std::move(frame));
        }
    }
    REQUIRE(decoder.Buffered() == 0);
    return frames;
}

}  // namespace

TEST_CASE("encoded header is stream, three reserved bytes, big-endian length", "[codec]") {
    const auto frame = EncodeFrame(StreamType::kStderr, std::string(0x0102, 'a'));
    REQUIRE(frame.size() == 8 + 0x0102);
    CHECK(static_cast<unsigned char>(frame[0]) == 2);
    CHECK(frame[1] == 0);
    CHECK(frame[2] == 0);
    CHECK(frame[3] == 0);
    CHECK(static_cast<unsigned char>(frame[4]) == 0);
    CHECK(static_cast<unsigned char>(frame[5]) == 0);
    CHECK(static_cast<unsigned char>(frame[6]) == 0x01);
    CHECK(static_cast<unsigned char>(frame[7]) == 0x02);
}

TEST_CASE("decoding does not depend on how the stream is chunked", "[codec]") {
    const auto bytes = SampleStream();
    const auto whole = DecodeInChunks(bytes, bytes.size());
    REQUIRE(whole.size() == 5);
    CHECK(whole[0].payload == "hello ");
    CHECK(whole[1].stream == StreamType::kStderr);
    CHECK(whole[3].payload.size() == 70000);
    CHECK(whole[4].payload == "world\n");

    for (std::size_t chunk : {1u, 3u, 7u, 8u, 9u, 4096u}) {
        const auto frames = DecodeInChunks(bytes, chunk);
        REQUIRE(frames.size() == whole.size());
        for (std::size_t i = 0; i < frames.size(); ++i) {
            CHECK(frames[i].stream == whole[i].stream);
            CHECK(frames[i].payload == whole[i].payload);
        }
    }
}

TEST_CASE("partial frames stay buffered until complete", "[codec]") {
    FrameDecoder decoder;
    const auto frame = EncodeFrame(StreamType::kStdout, "abc");

    CHECK(decoder.Feed(std::string_view(frame).substr(0, 5)).empty());
    CHECK(decoder.Buffered() == 5);
    CHECK(decoder.Feed(std::string_view(frame).substr(5, 5)).empty());

    const auto frames = decoder.Feed(std::string_view(frame).substr(10));
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].payload == "abc");
    CHECK(decoder.Buffered() == 0);
}

TEST_CASE("stdin and unknown stream bytes are reported as stdout", "[codec]") {
    FrameDecoder decoder;
    std::string bytes = EncodeFrame(StreamType::kStdin, "in");
    bytes += EncodeFrame(static_cast<StreamType>(7), "odd");
    const auto frames = decoder.Feed(bytes);
    REQUIRE(frames.size() == 2);
    CHECK(frames[0].stream == StreamType::kStdout);
    CHECK(frames[1].stream == StreamType::kStdout);
}

TEST_CASE("invalid UTF-8 is replaced, valid text passes through", "[codec][utf8]") {
    const std::string replacement = "\xEF\xBF\xBD";

    CHECK(SanitizeUtf8("plain ascii") == "plain ascii");
    CHECK(SanitizeUtf8("caf\xC3\xA9 \xF0\x9F\x98\x80") == "caf\xC3\xA9 \xF0\x9F\x98\x80");

    SECTION("stray continuation byte") {
        CHECK(SanitizeUtf8("a\x80z") == "a" + replacement + "z");
    }
    SECTION("overlong encoding") {
        CHECK(SanitizeUtf8("\xC0\xAF") == replacement + replacement);
    }
    SECTION("surrogate code point") {
        CHECK(SanitizeUtf8("\xED\xA0\x80") == replacement + replacement + replacement);
    }
    SECTION("above U+10FFFF") {
        CHECK(SanitizeUtf8("\xF4\x90\x80\x80").find("\xF4") == std::string::npos);
    }
    SECTION("truncated sequence at the end") {
        CHECK(SanitizeUtf8("ok\xE2\x82") == "ok" + replacement);
    }
}

TEST_CASE("a character split across payloads is completed, not replaced", "[codec][utf8]") {
    Utf8StreamDecoder decoder;
    CHECK(decoder.Decode("h\xC3") == "h");
    CHECK(decoder.Decode("\xA9llo") == "\xC3\xA9llo");
    CHECK(decoder.Flush().empty());

    CHECK(decoder.Decode("x\xE2\x82").size() == 1);
    CHECK(decoder.Flush() == "\xEF\xBF\xBD");
}
