#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "sandbox/dependency_scanner.hpp"

using codebox::sandbox::ParsePythonImports;
using codebox::sandbox::ScanPythonDependencies;
using codebox::sandbox::WrapWithInstall;

TEST_CASE("import statements yield top-level module names", "[deps]") {
    const std::string source =
        "import os, sys\n"
        "import numpy as np\n"
        "from matplotlib import pyplot as plt\n"
        "from os.path import join\n"
        "    import requests.adapters  # nested\n"
        "# import commented_out\n"
        "from . import sibling\n"
        "x = 'import not_a_module'\n";

    const auto modules = ParsePythonImports(source);
    CHECK(modules == std::vector<std::string>{"os", "sys", "numpy", "matplotlib", "requests"});
}

TEST_CASE("dependencies exclude stdlib and local modules and map pip names", "[deps]") {
    const std::vector<codebox::sandbox::SourceFile> files{
        {"main.py", "import cv2\nimport helper\nfrom PIL import Image\nimport json\nimport sklearn.linear_model\n"},
        {"helper.py", "import yaml\nimport numpy\nfrom utils import tool\n"},
        {"utils/tool.py", "from bs4 import BeautifulSoup\nimport numpy\n"},
        {"notes.txt", "import ignored_in_text_files\n"}};

    const auto packages = ScanPythonDependencies(files);
    CHECK(packages == std::vector<std::string>{
        "opencv-python", "pillow", "scikit-learn", "pyyaml", "numpy", "beautifulsoup4"});
}

TEST_CASE("install prefix is added only when packages are needed", "[deps]") {
    CHECK(WrapWithInstall({}, "python -u main.py") == "python -u main.py");
    CHECK(WrapWithInstall({"numpy", "pyyaml"}, "python -u main.py") ==
          "pip install --quiet --disable-pip-version-check --no-cache-dir numpy pyyaml >/dev/null"
          " && python -u main.py");
}
