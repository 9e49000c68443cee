#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace codebox::sandbox {

using SourceFile = std::pair<std::string, std::string>;

// Per-job directory holding the submitted sources. The directory is bind
// mounted into the container and removed by Remove() or the destructor.
class Workspace {
public:
    Workspace(const std::filesystem::path& root,
              const std::string& job_id,
              const std::vector<SourceFile>& files);
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& Path() const { return path_; }
    void Remove();

private:
    std::filesystem::path path_;
};

// Throws JobError(kProvisioning) for empty, absolute or escaping paths.
std::filesystem::path ValidateRelativePath(const std::string& path);

std::string SanitizeName(const std::string& value);

}  // namespace codebox::sandbox
