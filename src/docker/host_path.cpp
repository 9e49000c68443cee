#include "docker/host_path.hpp"

#include <algorithm>
#include <filesystem>
#include <unistd.h>

#include "utils/logging.hpp"

namespace codebox::docker {
namespace {

using codebox::utils::LogLevel;
using codebox::utils::LogLine;

std::string StripTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

bool IsComponentPrefix(const std::string& prefix, const std::string& path) {
    if (prefix == "/") {
        return !path.empty() && path.front() == '/';
    }
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

}  // namespace

std::optional<std::string> MapThroughMounts(const std::string& container_path,
                                            const std::vector<MountPoint>& mounts) {
    const auto path = StripTrailingSlash(
        std::filesystem::path(container_path).lexically_normal().string());

    std::vector<MountPoint> sorted = mounts;
    std::stable_sort(sorted.begin(), sorted.end(), [](const MountPoint& a, const MountPoint& b) {
        return a.destination.size() > b.destination.size();
    });

    for (const auto& mount : sorted) {
        const auto destination = StripTrailingSlash(mount.destination);
        if (destination.empty() || !IsComponentPrefix(destination, path)) {
            continue;
        }
        const auto relative = std::filesystem::path(path).lexically_relative(destination);
        auto host = std::filesystem::path(StripTrailingSlash(mount.source));
        if (!relative.empty() && relative != ".") {
            host /= relative;
        }
        return host.lexically_normal().string();
    }
    return std::nullopt;
}

std::string CurrentContainerId() {
    char name[256] = {};
    if (::gethostname(name, sizeof(name) - 1) != 0) {
        return {};
    }
    return std::string(name);
}

std::string TranslateToHostPath(ContainerRuntime& runtime,
                                const std::string& container_path,
                                const std::string& self_id) {
    const auto id = self_id.empty() ? CurrentContainerId() : self_id;
    if (id.empty()) {
        return container_path;
    }
    try {
        const auto mounts = runtime.Mounts(id);
        const auto mapped = MapThroughMounts(container_path, mounts);
        if (!mapped) {
            LogLine(LogLevel::kDebug, "host-path").Field("path", container_path)
                << "no mount covers path, using it as is";
            return container_path;
        }
        LogLine(LogLevel::kDebug, "host-path").Field("from", container_path).Field("to", *mapped)
            << "translated workspace path";
        return *mapped;
    } catch (const DockerError& ex) {
        // Not running inside a container (or the daemon cannot see us).
        LogLine(LogLevel::kDebug, "host-path").Field("self", id).Field("kind", ToString(ex.Kind()))
            << "translation skipped: " << ex.what();
    } catch (const std::exception& ex) {
        LogLine(LogLevel::kWarn, "host-path").Field("self", id)
            << "translation failed: " << ex.what();
    }
    return container_path;
}

}  // namespace codebox::docker
