#include <catch2/catch.hpp>

#include <poll.h>

#include "sandbox/input_channel.hpp"

using codebox::sandbox::InputChannel;

namespace {

bool Readable(int fd) {
    pollfd entry{};
    entry.fd = fd;
    entry.events = POLLIN;
    return ::poll(&entry, 1, 0) == 1;
}

}  // namespace

TEST_CASE("pushed input wakes the poller and drains in order", "[input]") {
    InputChannel channel;
    CHECK_FALSE(Readable(channel.WakeHandle()));

    REQUIRE(channel.Push("first"));
    REQUIRE(channel.Push("second"));
    CHECK(Readable(channel.WakeHandle()));

    const auto items = channel.Drain();
    REQUIRE(items.size() == 2);
    CHECK(items[0] == "first");
    CHECK(items[1] == "second");
    CHECK_FALSE(Readable(channel.WakeHandle()));
    CHECK(channel.Drain().empty());
}

TEST_CASE("a closed channel refuses input and stays readable", "[input]") {
    InputChannel channel;
    channel.Close();
    channel.Close();

    CHECK(channel.IsClosed());
    CHECK(Readable(channel.WakeHandle()));
    CHECK_FALSE(channel.Push("late"));
}
