#include "sandbox/execution_engine.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>

#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

using codebox::utils::LogLevel;
using codebox::utils::LogLine;

constexpr const char* kUnavailableMessage = "Code execution is unavailable on this server.";

constexpr std::size_t kReleaseThreads = 2;

std::size_t PoolSize(const config::Config& config) {
    return static_cast<std::size_t>(std::max(1, config.execution.worker_threads));
}

}  // namespace

ExecutionEngine::ExecutionEngine(config::Config config,
                                 std::shared_ptr<docker::ContainerRuntime> runtime,
                                 bus::EventBus& bus)
    : config_(std::move(config))
    , runtime_(std::move(runtime))
    , bus_(bus)
    , supervisor_(config_, *runtime_, registry_, bus_)
    , pool_(PoolSize(config_))
    , release_pool_(kReleaseThreads) {}

ExecutionEngine::~ExecutionEngine() {
    Shutdown();
}

bool ExecutionEngine::Start() {
    try {
        runtime_->Ping();
        available_ = true;
        LogLine(LogLevel::kInfo, "engine").Field("workers", static_cast<long long>(PoolSize(config_)))
            << "container engine reachable";
    } catch (const docker::DockerError& ex) {
        available_ = false;
        LogLine(LogLevel::kError, "engine").Field("kind", docker::ToString(ex.Kind()))
            << "container engine unavailable, code execution disabled: " << ex.what();
    }
    return available_;
}

bool ExecutionEngine::Submit(Job job) {
    if (!available_ || shutdown_) {
        bus_.Publish(bus::MakeFinished(job.job_id, job.client_id, -1, std::string(kUnavailableMessage)));
        return false;
    }
    if (!registry_.Reserve(job.job_id, job.client_id)) {
        LogLine(LogLevel::kWarn, "engine").Field("job", job.job_id).Field("client", job.client_id)
            << "job id already in use, submission refused";
        return false;
    }
    LogLine(LogLevel::kDebug, "engine").Field("job", job.job_id).Field("language", job.language) << "submitted";
    boost::asio::post(pool_, [this, job = std::move(job)]() {
        supervisor_.Run(job);
    });
    return true;
}

void ExecutionEngine::SendInput(const std::string& job_id, const std::string& text) {
    const auto handle = registry_.Find(job_id);
    if (!handle || !handle->input || !handle->input->Push(text)) {
        LogLine(LogLevel::kDebug, "engine").Field("job", job_id) << "input for inactive job ignored";
    }
}

void ExecutionEngine::Stop(const std::string& job_id) {
    // Cancel first: a supervisor that registers after this sees the mark.
    const bool reserved = registry_.Cancel(job_id);
    auto handle = registry_.PopIfPresent(job_id);
    if (!handle) {
        if (reserved) {
            LogLine(LogLevel::kInfo, "engine").Field("job", job_id) << "stop requested before start";
        } else {
            LogLine(LogLevel::kDebug, "engine").Field("job", job_id) << "stop for inactive job ignored";
        }
        return;
    }
    handle->stop_requested = true;
    // Both only flip descriptors; the daemon work goes to the pool.
    handle->input->Close();
    handle->stream->Close();
    LogLine(LogLevel::kInfo, "engine").Field("job", job_id) << "stop requested";
    auto runtime = runtime_;
    boost::asio::post(release_pool_, [runtime, handle]() {
        ReleaseSandbox(*runtime, *handle);
    });
}

void ExecutionEngine::CleanupClient(const std::string& client_id) {
    const auto job_ids = registry_.FindByClient(client_id);
    for (const auto& job_id : job_ids) {
        Stop(job_id);
    }
    if (!job_ids.empty()) {
        LogLine(LogLevel::kInfo, "engine").Field("client", client_id)
            .Field("jobs", static_cast<long long>(job_ids.size())) << "client cleaned up";
    }
}

void ExecutionEngine::Shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    registry_.CancelAll();
    for (const auto& job_id : registry_.JobIds()) {
        Stop(job_id);
    }
    pool_.join();
    release_pool_.join();
}

}  // namespace codebox::sandbox
