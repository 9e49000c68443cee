#include "sandbox/artifact.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

using codebox::utils::LogLevel;
using codebox::utils::LogLine;

class ScopedFd {
public:
    explicit ScopedFd(int fd)
        : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& path) {
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it) {
        if (path_it == path.end() || *root_it != *path_it) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::string EncodeBase64(const std::string& data) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);
    std::size_t i = 0;
    while (i < data.size()) {
        const std::size_t start = i;
        const unsigned int octet_a = static_cast<unsigned char>(data[i++]);
        const unsigned int octet_b = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;
        const unsigned int octet_c = i < data.size() ? static_cast<unsigned char>(data[i++]) : 0;

        const unsigned int triple = (octet_a << 16) + (octet_b << 8) + octet_c;
        encoded.push_back(table[(triple >> 18) & 0x3F]);
        encoded.push_back(table[(triple >> 12) & 0x3F]);
        encoded.push_back(start + 1 < data.size() ? table[(triple >> 6) & 0x3F] : '=');
        encoded.push_back(start + 2 < data.size() ? table[triple & 0x3F] : '=');
    }
    return encoded;
}

std::string Sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : hash) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string MimeTypeFor(const std::filesystem::path& path) {
    const auto ext = codebox::utils::ToLower(path.extension().string());
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".webp") return "image/webp";
    return "application/octet-stream";
}

std::optional<bus::Artifact> CollectArtifact(const std::filesystem::path& workspace,
                                             const std::string& relative_path,
                                             std::size_t max_bytes) {
    if (workspace.empty() || relative_path.empty()) {
        return std::nullopt;
    }
    const std::filesystem::path relative(relative_path);
    if (relative.is_absolute()) {
        LogLine(LogLevel::kWarn, "artifact").Field("path", relative_path) << "absolute artifact path refused";
        return std::nullopt;
    }

    // The workspace is writable from inside the container, so nothing on the
    // way down may be a link.
    std::error_code ec;
    auto path = workspace;
    for (const auto& part : relative) {
        if (part == ".." || part.empty() || part == ".") {
            LogLine(LogLevel::kWarn, "artifact").Field("path", relative_path) << "artifact path must stay inside the workspace";
            return std::nullopt;
        }
        path /= part;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (ec || !std::filesystem::exists(status)) {
            return std::nullopt;
        }
        if (std::filesystem::is_symlink(status)) {
            LogLine(LogLevel::kWarn, "artifact").Field("path", path.string()) << "symlink refused";
            return std::nullopt;
        }
    }

    const auto root = std::filesystem::canonical(workspace, ec);
    std::filesystem::path resolved;
    if (!ec) {
        resolved = std::filesystem::weakly_canonical(path, ec);
    }
    if (ec || !IsWithin(root, resolved)) {
        LogLine(LogLevel::kWarn, "artifact").Field("path", path.string()) << "resolves outside the workspace";
        return std::nullopt;
    }

    ScopedFd fd(::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK));
    if (fd.get() < 0) {
        LogLine(LogLevel::kWarn, "artifact").Field("path", path.string()) << "cannot open: " << std::strerror(errno);
        return std::nullopt;
    }
    struct stat info {};
    if (::fstat(fd.get(), &info) != 0 || !S_ISREG(info.st_mode)) {
        return std::nullopt;
    }
    const auto size = static_cast<std::size_t>(info.st_size);
    if (size > max_bytes) {
        LogLine(LogLevel::kWarn, "artifact").Field("path", path.string())
            .Field("bytes", static_cast<long long>(size)) << "too large, skipped";
        return std::nullopt;
    }

    std::string bytes;
    bytes.reserve(size);
    char buffer[8192];
    while (true) {
        const auto read = ::read(fd.get(), buffer, sizeof(buffer));
        if (read < 0) {
            if (errno == EINTR) {
                continue;
            }
            LogLine(LogLevel::kWarn, "artifact").Field("path", path.string()) << "read failed: " << std::strerror(errno);
            return std::nullopt;
        }
        if (read == 0) {
            break;
        }
        bytes.append(buffer, static_cast<std::size_t>(read));
        if (bytes.size() > max_bytes) {
            LogLine(LogLevel::kWarn, "artifact").Field("path", path.string()) << "grew past the limit, skipped";
            return std::nullopt;
        }
    }

    bus::Artifact artifact{};
    artifact.name = path.filename().string();
    artifact.mime_type = MimeTypeFor(path);
    artifact.data_base64 = EncodeBase64(bytes);
    artifact.sha256 = Sha256Hex(bytes);
    artifact.size = bytes.size();
    return artifact;
}

}  // namespace codebox::sandbox
