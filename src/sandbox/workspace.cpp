#include "sandbox/workspace.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>
#include <system_error>

#include "sandbox/job_error.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

using codebox::utils::LogLevel;
using codebox::utils::LogLine;

std::string RandomSuffix() {
    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << dist(engine);
    return oss.str();
}

}  // namespace

std::string SanitizeName(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('_');
        }
    }
    if (result.size() > 48) {
        result.resize(48);
    }
    return result.empty() ? "job" : result;
}

std::filesystem::path ValidateRelativePath(const std::string& path) {
    if (path.empty()) {
        throw JobError(JobErrorKind::kProvisioning, "File path must not be empty.");
    }
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute() || candidate.has_root_name() || candidate.has_root_directory()) {
        throw JobError(JobErrorKind::kProvisioning, "Absolute file path not allowed: " + path);
    }
    std::filesystem::path normalized;
    for (const auto& part : candidate) {
        const auto text = part.string();
        if (text == "..") {
            throw JobError(JobErrorKind::kProvisioning, "File path escapes the workspace: " + path);
        }
        if (text.empty() || text == ".") {
            continue;
        }
        normalized /= part;
    }
    if (normalized.empty()) {
        throw JobError(JobErrorKind::kProvisioning, "File path must name a file: " + path);
    }
    return normalized;
}

Workspace::Workspace(const std::filesystem::path& root,
                     const std::string& job_id,
                     const std::vector<SourceFile>& files) {
    if (files.empty()) {
        throw JobError(JobErrorKind::kProvisioning, "No source files to execute.");
    }
    std::vector<std::pair<std::filesystem::path, const std::string*>> targets;
    std::set<std::string> seen;
    for (const auto& file : files) {
        auto relative = ValidateRelativePath(file.first);
        if (!seen.insert(relative.generic_string()).second) {
            throw JobError(JobErrorKind::kProvisioning, "Duplicate file path: " + file.first);
        }
        targets.emplace_back(std::move(relative), &file.second);
    }

    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw JobError(JobErrorKind::kProvisioning,
                       "Cannot create workspace root " + root.string() + ": " + ec.message());
    }
    for (int attempt = 0; attempt < 8 && path_.empty(); ++attempt) {
        auto candidate = root / ("job-" + SanitizeName(job_id) + "-" + RandomSuffix());
        if (std::filesystem::create_directory(candidate, ec)) {
            path_ = std::move(candidate);
        } else if (ec) {
            throw JobError(JobErrorKind::kProvisioning,
                           "Cannot create workspace " + candidate.string() + ": " + ec.message());
        }
    }
    if (path_.empty()) {
        throw JobError(JobErrorKind::kProvisioning, "Cannot allocate a unique workspace directory.");
    }

    try {
        for (const auto& target : targets) {
            const auto destination = path_ / target.first;
            std::filesystem::create_directories(destination.parent_path(), ec);
            if (ec) {
                throw JobError(JobErrorKind::kProvisioning,
                               "Cannot create directory for " + target.first.string() + ": " + ec.message());
            }
            std::ofstream output(destination, std::ios::binary | std::ios::trunc);
            output << *target.second;
            if (!output) {
                throw JobError(JobErrorKind::kProvisioning, "Failed to write " + target.first.string());
            }
        }
    } catch (const JobError&) {
        Remove();
        throw;
    }
    LogLine(LogLevel::kDebug, "workspace").Field("path", path_.string())
        .Field("files", static_cast<long long>(targets.size())) << "materialized";
}

Workspace::~Workspace() {
    Remove();
}

void Workspace::Remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LogLine(LogLevel::kWarn, "workspace").Field("path", path_.string())
            << "cleanup failed: " << ec.message();
    }
    path_.clear();
}

}  // namespace codebox::sandbox
