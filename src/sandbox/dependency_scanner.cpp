#include "sandbox/dependency_scanner.hpp"

#include <filesystem>
#include <regex>
#include <iterator>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

using codebox::utils::LogLevel;
using codebox::utils::LogLine;

const std::unordered_set<std::string>& StandardModules() {
    static const std::unordered_set<std::string> modules{
        "__future__", "abc", "argparse", "array", "ast", "asyncio", "base64", "binascii",
        "bisect", "builtins", "bz2", "calendar", "cmath", "codecs", "collections",
        "concurrent", "configparser", "contextlib", "copy", "copyreg", "csv", "ctypes",
        "dataclasses", "datetime", "decimal", "difflib", "dis", "email", "enum", "errno",
        "fractions", "functools", "gc", "getpass", "glob", "gzip", "hashlib", "heapq",
        "hmac", "html", "http", "importlib", "inspect", "io", "ipaddress", "itertools",
        "json", "keyword", "locale", "logging", "lzma", "math", "mimetypes",
        "multiprocessing", "numbers", "operator", "os", "pathlib", "pickle", "platform",
        "pprint", "queue", "random", "re", "sched", "secrets", "select", "shlex",
        "shutil", "signal", "socket", "sqlite3", "ssl", "stat", "statistics", "string",
        "struct", "subprocess", "sys", "tempfile", "textwrap", "threading", "time",
        "timeit", "tkinter", "traceback", "types", "typing", "unicodedata", "unittest",
        "urllib", "uuid", "warnings", "weakref", "xml", "zipfile", "zlib", "zoneinfo"
    };
    return modules;
}

const std::unordered_map<std::string, std::string>& DistributionNames() {
    static const std::unordered_map<std::string, std::string> names{
        {"cv2", "opencv-python"},
        {"PIL", "pillow"},
        {"sklearn", "scikit-learn"},
        {"yaml", "pyyaml"},
        {"bs4", "beautifulsoup4"},
        {"dateutil", "python-dateutil"},
        {"dotenv", "python-dotenv"},
        {"skimage", "scikit-image"},
        {"Crypto", "pycryptodome"},
        {"attr", "attrs"}
    };
    return names;
}

bool IsIdentifier(const std::string& name) {
    static const std::regex pattern(R"([A-Za-z_][A-Za-z0-9_]*)");
    return std::regex_match(name, pattern);
}

std::string TopLevel(const std::string& dotted) {
    const auto dot = dotted.find('.');
    return dot == std::string::npos ? dotted : dotted.substr(0, dot);
}

// Module names a job can import from its own files: "pkg/util.py" gives
// "pkg" and "util" is only local when it sits at the top level.
std::unordered_set<std::string> LocalModules(const std::vector<SourceFile>& files) {
    std::unordered_set<std::string> local;
    for (const auto& file : files) {
        const std::filesystem::path path(file.first);
        auto it = path.begin();
        if (it == path.end()) {
            continue;
        }
        const std::filesystem::path first = *it;
        if (std::next(it) == path.end()) {
            local.insert(first.stem().string());
        } else {
            local.insert(first.string());
        }
    }
    return local;
}

}  // namespace

std::vector<std::string> ParsePythonImports(const std::string& source) {
    static const std::regex import_line(R"(^\s*import\s+(.+)$)");
    static const std::regex from_line(R"(^\s*from\s+([A-Za-z_][\w\.]*)\s+import\s+)");

    std::vector<std::string> modules;
    std::set<std::string> seen;
    auto add = [&](const std::string& dotted) {
        const auto name = TopLevel(dotted);
        if (IsIdentifier(name) && seen.insert(name).second) {
            modules.push_back(name);
        }
    };

    std::istringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        std::smatch match;
        if (std::regex_search(line, match, from_line)) {
            add(match[1].str());
            continue;
        }
        if (!std::regex_search(line, match, import_line)) {
            continue;
        }
        // "import a.b as c, d"
        std::istringstream names(match[1].str());
        std::string item;
        while (std::getline(names, item, ',')) {
            std::istringstream words(item);
            std::string word;
            if (words >> word) {
                add(word);
            }
        }
    }
    return modules;
}

std::vector<std::string> ScanPythonDependencies(const std::vector<SourceFile>& files) {
    std::vector<std::string> packages;
    try {
        const auto local = LocalModules(files);
        std::set<std::string> seen;
        for (const auto& file : files) {
            if (std::filesystem::path(file.first).extension() != ".py") {
                continue;
            }
            for (const auto& module : ParsePythonImports(file.second)) {
                if (StandardModules().count(module) > 0 || local.count(module) > 0) {
                    continue;
                }
                const auto mapped = DistributionNames().find(module);
                const auto package = mapped == DistributionNames().end() ? module : mapped->second;
                if (seen.insert(package).second) {
                    packages.push_back(package);
                }
            }
        }
    } catch (const std::exception& ex) {
        LogLine(LogLevel::kWarn, "deps") << "import scan failed, installing nothing: " << ex.what();
        return {};
    }
    return packages;
}

std::string WrapWithInstall(const std::vector<std::string>& packages, const std::string& entry) {
    if (packages.empty()) {
        return entry;
    }
    return "pip install --quiet --disable-pip-version-check --no-cache-dir "
        + codebox::utils::Join(packages, " ") + " >/dev/null && " + entry;
}

}  // namespace codebox::sandbox
