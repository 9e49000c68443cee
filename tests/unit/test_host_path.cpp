#include <catch2/catch.hpp>

#include "docker/host_path.hpp"
#include "fake_runtime.hpp"

using codebox::docker::MapThroughMounts;
using codebox::docker::MountPoint;
using codebox::docker::TranslateToHostPath;

TEST_CASE("the longest covering mount wins", "[host-path]") {
    const std::vector<MountPoint> mounts{
        {"/srv/data", "/data"},
        {"/srv/work", "/data/work"},
        {"/var/lib/root", "/"}};

    CHECK(MapThroughMounts("/data/work/job-1", mounts) == std::optional<std::string>("/srv/work/job-1"));
    CHECK(MapThroughMounts("/data/other", mounts) == std::optional<std::string>("/srv/data/other"));
    CHECK(MapThroughMounts("/data/work", mounts) == std::optional<std::string>("/srv/work"));
    CHECK(MapThroughMounts("/etc/x", mounts) == std::optional<std::string>("/var/lib/root/etc/x"));
}

TEST_CASE("prefixes must end on a path component boundary", "[host-path]") {
    const std::vector<MountPoint> mounts{{"/host/app", "/app"}};

    CHECK_FALSE(MapThroughMounts("/application/job", mounts));
    CHECK(MapThroughMounts("/app/job", mounts) == std::optional<std::string>("/host/app/job"));
    CHECK(MapThroughMounts("/app/", mounts) == std::optional<std::string>("/host/app"));
    CHECK_FALSE(MapThroughMounts("/tmp/job", mounts));
}

TEST_CASE("translation falls back to the original path", "[host-path]") {
    codebox::testing::FakeRuntime runtime;
    runtime.SetMounts("self123", {{"/host/tmp", "/tmp"}});

    CHECK(TranslateToHostPath(runtime, "/tmp/codebox/job-1", "self123") == "/host/tmp/codebox/job-1");
    CHECK(TranslateToHostPath(runtime, "/opt/codebox/job-1", "self123") == "/opt/codebox/job-1");
    // Unknown container: not running under the daemon we talk to.
    CHECK(TranslateToHostPath(runtime, "/tmp/codebox/job-1", "someone-else") == "/tmp/codebox/job-1");
}
