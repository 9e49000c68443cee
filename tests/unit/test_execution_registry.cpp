#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sandbox/execution_registry.hpp"

using codebox::sandbox::ExecutionRegistry;
using codebox::sandbox::SandboxHandle;

namespace {

std::shared_ptr<SandboxHandle> MakeHandle(const std::string& job_id, const std::string& client_id) {
    auto handle = std::make_shared<SandboxHandle>();
    handle->job_id = job_id;
    handle->client_id = client_id;
    handle->container_id = "c-" + job_id;
    return handle;
}

}  // namespace

TEST_CASE("register rejects a job id that is already live", "[registry]") {
    ExecutionRegistry registry;
    REQUIRE(registry.Register("job-1", MakeHandle("job-1", "alice")));
    CHECK_FALSE(registry.Register("job-1", MakeHandle("job-1", "bob")));
    CHECK_FALSE(registry.Register("job-2", nullptr));
    CHECK(registry.Size() == 1);
    CHECK(registry.Find("job-1")->client_id == "alice");
}

TEST_CASE("pop removes the entry exactly once", "[registry]") {
    ExecutionRegistry registry;
    registry.Register("job-1", MakeHandle("job-1", "alice"));

    auto first = registry.PopIfPresent("job-1");
    REQUIRE(first);
    CHECK(first->container_id == "c-job-1");
    CHECK_FALSE(registry.PopIfPresent("job-1"));
    CHECK_FALSE(registry.Contains("job-1"));
    CHECK_FALSE(registry.Find("job-1"));
    CHECK(registry.Size() == 0);
}

TEST_CASE("lookup by client returns only that client's jobs", "[registry]") {
    ExecutionRegistry registry;
    registry.Register("a1", MakeHandle("a1", "alice"));
    registry.Register("a2", MakeHandle("a2", "alice"));
    registry.Register("b1", MakeHandle("b1", "bob"));

    auto ids = registry.FindByClient("alice");
    std::sort(ids.begin(), ids.end());
    CHECK(ids == std::vector<std::string>{"a1", "a2"});
    CHECK(registry.FindByClient("carol").empty());
    CHECK(registry.JobIds().size() == 3);
}

TEST_CASE("concurrent pops hand each handle to a single caller", "[registry][concurrency]") {
    ExecutionRegistry registry;
    constexpr int kJobs = 200;
    for (int i = 0; i < kJobs; ++i) {
        const auto id = "job-" + std::to_string(i);
        registry.Register(id, MakeHandle(id, "client"));
    }

    std::atomic<int> popped{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kJobs; ++i) {
                if (registry.PopIfPresent("job-" + std::to_string(i))) {
                    ++popped;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(popped == kJobs);
    CHECK(registry.Size() == 0);
}

TEST_CASE("a reserved id cannot be submitted twice", "[registry]") {
    ExecutionRegistry registry;
    REQUIRE(registry.Reserve("job-1", "alice"));
    CHECK_FALSE(registry.Reserve("job-1", "bob"));

    registry.Register("job-2", MakeHandle("job-2", "alice"));
    CHECK_FALSE(registry.Reserve("job-2", "alice"));

    registry.Unreserve("job-1");
    CHECK(registry.Reserve("job-1", "bob"));
}

TEST_CASE("a job can be cancelled before its container exists", "[registry]") {
    ExecutionRegistry registry;
    CHECK_FALSE(registry.Cancel("ghost"));
    CHECK_FALSE(registry.IsCancelled("ghost"));

    registry.Reserve("queued", "alice");
    CHECK_FALSE(registry.IsCancelled("queued"));
    CHECK(registry.Cancel("queued"));
    CHECK(registry.IsCancelled("queued"));

    registry.Unreserve("queued");
    CHECK_FALSE(registry.IsCancelled("queued"));
    CHECK(registry.Size() == 0);
}

TEST_CASE("lookup by client includes jobs that are only reserved", "[registry]") {
    ExecutionRegistry registry;
    registry.Reserve("a1", "alice");
    registry.Register("a1", MakeHandle("a1", "alice"));
    registry.Reserve("a2", "alice");
    registry.Reserve("b1", "bob");

    auto ids = registry.FindByClient("alice");
    std::sort(ids.begin(), ids.end());
    CHECK(ids == std::vector<std::string>{"a1", "a2"});

    registry.CancelAll();
    CHECK(registry.IsCancelled("a2"));
    CHECK(registry.IsCancelled("b1"));
}
