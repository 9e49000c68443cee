#pragma once

#include <string>
#include <vector>

#include "sandbox/workspace.hpp"

namespace codebox::sandbox {

// Top-level module names imported by one Python source, in first-seen order.
std::vector<std::string> ParsePythonImports(const std::string& source);

// Third-party distributions needed by the job's Python files: standard
// library and job-local modules removed, import names mapped to pip names.
std::vector<std::string> ScanPythonDependencies(const std::vector<SourceFile>& files);

// "pip install ... <packages> >/dev/null && <entry>", or entry unchanged.
std::string WrapWithInstall(const std::vector<std::string>& packages, const std::string& entry);

}  // namespace codebox::sandbox
