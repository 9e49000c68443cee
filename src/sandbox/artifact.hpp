#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "bus/events.hpp"

namespace codebox::sandbox {

std::string EncodeBase64(const std::string& data);
std::string Sha256Hex(const std::string& data);
std::string MimeTypeFor(const std::filesystem::path& path);

// Reads <workspace>/<relative_path> when present and not larger than
// max_bytes. Only a regular file reached without following any symlink is
// read; anything else, unreadable or oversized files included, is skipped.
std::optional<bus::Artifact> CollectArtifact(const std::filesystem::path& workspace,
                                             const std::string& relative_path,
                                             std::size_t max_bytes);

}  // namespace codebox::sandbox
