#include <doctest/doctest.h>

#include "deps/dependency_inference.hpp"

using namespace healbox;

TEST_CASE("PythonImportInferrer keeps third-party imports only") {
    const sandbox::FileSet files{
        {"main.py",
         "import os, sys\n"
         "import numpy as np\n"
         "from flask import Flask\n"
         "from os.path import join\n"
         "import helpers\n"
         "from pkg.sub import thing\n"
         "def f():\n"
         "    import requests\n"},
        {"helpers.py", "import json\n"},
        {"pkg/sub.py", "X = 1\n"},
        {"notes.txt", "import pandas\n"}};

    const auto inferred = deps::PythonImportInferrer().Infer(files);
    CHECK(inferred.packages == std::vector<std::string>{"flask", "numpy", "requests"});
    CHECK(inferred.gui_toolkits.empty());
}

TEST_CASE("PythonImportInferrer maps import names to distributions") {
    const sandbox::FileSet files{
        {"main.py", "import cv2\nfrom bs4 import BeautifulSoup\nimport yaml\nfrom PIL import Image\n"}};

    const auto inferred = deps::PythonImportInferrer().Infer(files);
    CHECK(inferred.packages ==
          std::vector<std::string>{"beautifulsoup4", "opencv-python", "pillow", "pyyaml"});
}

TEST_CASE("GUI toolkits are flagged but tkinter is never a requirement") {
    const sandbox::FileSet files{{"app.py", "import tkinter as tk\nimport pygame\n"}};

    const auto inferred = deps::PythonImportInferrer().Infer(files);
    CHECK(inferred.packages == std::vector<std::string>{"pygame"});
    CHECK(inferred.gui_toolkits == std::vector<std::string>{"pygame", "tkinter"});
    CHECK(deps::DetectGuiToolkits(files) == inferred.gui_toolkits);
}

TEST_CASE("stdlib-only projects infer nothing") {
    const sandbox::FileSet files{{"main.py", "import json\nimport re\nprint(json.dumps({}))\n"}};
    CHECK(deps::PythonImportInferrer().Infer(files).Empty());
}

TEST_CASE("less common standard library modules are never installed") {
    const sandbox::FileSet files{{"main.py",
        "import codecs, smtplib, webbrowser\n"
        "from zoneinfo import ZoneInfo\n"
        "import tomllib\nimport atexit\nimport getopt\nimport binascii\nimport numbers\n"
        "import turtle\nimport tarfile\nimport unicodedata\nimport cProfile\n"
        "import _thread\n"
        "import requests\n"}};
    const auto inferred = deps::PythonImportInferrer().Infer(files);
    CHECK(inferred.packages == std::vector<std::string>{"requests"});
}

TEST_CASE("RenderRequirements lists packages with GUI guidance") {
    deps::InferredDependencies inferred{};
    inferred.packages = {"matplotlib", "requests"};
    inferred.gui_toolkits = {"matplotlib"};

    const auto text = deps::RenderRequirements(inferred);
    CHECK(text.rfind("# Auto-detected dependencies\n", 0) == 0);
    CHECK(text.find("\nmatplotlib\nrequests\n") != std::string::npos);
    CHECK(text.find("python3-tk") != std::string::npos);
}

TEST_CASE("module and distribution names translate both ways") {
    CHECK(deps::ModuleForDistribution("beautifulsoup4") == "bs4");
    CHECK(deps::ModuleForDistribution("Flask-Cors") == "flask_cors");
    CHECK(deps::ModuleForDistribution("requests") == "requests");
    CHECK(deps::DistributionForModule("sklearn") == "scikit-learn");
    CHECK(deps::DistributionForModule("torch") == "torch");
}
