#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docker/container_runtime.hpp"

namespace codebox::docker {

// Rewrites a path as seen inside this service's container into the path the
// daemon sees on the host, using the mount whose destination is the longest
// component-wise prefix. Returns nullopt when no mount covers the path.
std::optional<std::string> MapThroughMounts(const std::string& container_path,
                                            const std::vector<MountPoint>& mounts);

// Looks up our own container (hostname == container id) and maps the path.
// Any failure falls back to the untranslated path.
std::string TranslateToHostPath(ContainerRuntime& runtime,
                                const std::string& container_path,
                                const std::string& self_id = {});

std::string CurrentContainerId();

}  // namespace codebox::docker
