#include "deps/dependency_inference.hpp"

#include <cctype>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include "utils/common.hpp"

namespace healbox::deps {
namespace {

// Public names from CPython 3.11 sys.stdlib_module_names.
const std::unordered_set<std::string>& StandardLibrary() {
    static const std::unordered_set<std::string> kModules = {
        "__future__", "abc", "aifc", "antigravity", "argparse", "array", "ast", "asynchat",
        "asyncio", "asyncore", "atexit", "audioop", "base64", "bdb", "binascii", "bisect",
        "builtins", "bz2", "cProfile", "calendar", "cgi", "cgitb", "chunk", "cmath", "cmd",
        "code", "codecs", "codeop", "collections", "colorsys", "compileall", "concurrent",
        "configparser", "contextlib", "contextvars", "copy", "copyreg", "crypt", "csv",
        "ctypes", "curses", "dataclasses", "datetime", "dbm", "decimal", "difflib", "dis",
        "distutils", "doctest", "email", "encodings", "ensurepip", "enum", "errno",
        "faulthandler", "fcntl", "filecmp", "fileinput", "fnmatch", "fractions", "ftplib",
        "functools", "gc", "genericpath", "getopt", "getpass", "gettext", "glob", "graphlib",
        "grp", "gzip", "hashlib", "heapq", "hmac", "html", "http", "idlelib", "imaplib",
        "imghdr", "imp", "importlib", "inspect", "io", "ipaddress", "itertools", "json",
        "keyword", "lib2to3", "linecache", "locale", "logging", "lzma", "mailbox", "mailcap",
        "marshal", "math", "mimetypes", "mmap", "modulefinder", "msilib", "msvcrt",
        "multiprocessing", "netrc", "nis", "nntplib", "nt", "ntpath", "nturl2path", "numbers",
        "opcode", "operator", "optparse", "os", "ossaudiodev", "pathlib", "pdb", "pickle",
        "pickletools", "pipes", "pkgutil", "platform", "plistlib", "poplib", "posix",
        "posixpath", "pprint", "profile", "pstats", "pty", "pwd", "py_compile", "pyclbr",
        "pydoc", "pydoc_data", "pyexpat", "queue", "quopri", "random", "re", "readline",
        "reprlib", "resource", "rlcompleter", "runpy", "sched", "secrets", "select",
        "selectors", "shelve", "shlex", "shutil", "signal", "site", "smtpd", "smtplib",
        "sndhdr", "socket", "socketserver", "spwd", "sqlite3", "sre_compile", "sre_constants",
        "sre_parse", "ssl", "stat", "statistics", "string", "stringprep", "struct",
        "subprocess", "sunau", "symtable", "sys", "sysconfig", "syslog", "tabnanny", "tarfile",
        "telnetlib", "tempfile", "termios", "textwrap", "this", "threading", "time", "timeit",
        "tkinter", "token", "tokenize", "tomllib", "trace", "traceback", "tracemalloc", "tty",
        "turtle", "turtledemo", "types", "typing", "unicodedata", "unittest", "urllib", "uu",
        "uuid", "venv", "warnings", "wave", "weakref", "webbrowser", "winreg", "winsound",
        "wsgiref", "xdrlib", "xml", "xmlrpc", "zipapp", "zipfile", "zipimport", "zlib",
        "zoneinfo"
    };
    return kModules;
}

bool IsStandardLibrary(const std::string& module) {
    return module.front() == '_' || StandardLibrary().count(module) > 0;
}

const std::unordered_set<std::string>& GuiToolkits() {
    static const std::unordered_set<std::string> kToolkits = {
        "tkinter", "Tkinter", "tk", "wx", "pygame", "matplotlib",
        "PyQt5", "PyQt6", "PySide2", "PySide6", "kivy"
    };
    return kToolkits;
}

// Import name -> distribution name where the two differ.
const std::unordered_map<std::string, std::string>& ModuleAliases() {
    static const std::unordered_map<std::string, std::string> kAliases = {
        {"bs4", "beautifulsoup4"},
        {"cv2", "opencv-python"},
        {"dateutil", "python-dateutil"},
        {"dotenv", "python-dotenv"},
        {"PIL", "pillow"},
        {"sklearn", "scikit-learn"},
        {"yaml", "pyyaml"},
        {"jwt", "pyjwt"},
        {"serial", "pyserial"},
        {"docx", "python-docx"}
    };
    return kAliases;
}

std::unordered_set<std::string> LocalModules(const sandbox::FileSet& files) {
    std::unordered_set<std::string> local;
    for (const auto& [path, content] : files) {
        const auto slash = path.find('/');
        if (slash != std::string::npos) {
            local.insert(path.substr(0, slash));
            continue;
        }
        if (utils::EndsWith(path, ".py")) {
            local.insert(path.substr(0, path.size() - 3));
        }
    }
    return local;
}

std::string LeadingIdentifier(const std::string& text) {
    std::size_t end = 0;
    while (end < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '_')) {
        ++end;
    }
    return text.substr(0, end);
}

std::vector<std::string> ImportedModules(const std::string& source) {
    static const std::regex kImport(R"(^\s*import\s+(.+)$)");
    static const std::regex kFrom(R"(^\s*from\s+([A-Za-z_]\w*))");

    std::vector<std::string> modules;
    std::istringstream stream(source);
    std::string line;
    std::smatch match;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (std::regex_search(line, match, kFrom)) {
            modules.push_back(match[1].str());
            continue;
        }
        if (std::regex_search(line, match, kImport)) {
            std::istringstream names(match[1].str());
            std::string item;
            while (std::getline(names, item, ',')) {
                const auto name = LeadingIdentifier(utils::Trim(item));
                if (!name.empty()) {
                    modules.push_back(name);
                }
            }
        }
    }
    return modules;
}

}  // namespace

InferredDependencies PythonImportInferrer::Infer(const sandbox::FileSet& files) const {
    const auto local = LocalModules(files);
    std::set<std::string> packages;

    for (const auto& [path, content] : files) {
        if (!utils::EndsWith(path, ".py")) {
            continue;
        }
        for (const auto& module : ImportedModules(content)) {
            if (IsStandardLibrary(module) || local.count(module) > 0) {
                continue;
            }
            if (module == "Tkinter" || module == "tk") {
                continue;
            }
            packages.insert(DistributionForModule(module));
        }
    }

    InferredDependencies inferred{};
    inferred.packages.assign(packages.begin(), packages.end());
    inferred.gui_toolkits = DetectGuiToolkits(files);
    return inferred;
}

std::vector<std::string> DetectGuiToolkits(const sandbox::FileSet& files) {
    std::set<std::string> gui;
    for (const auto& [path, content] : files) {
        if (!utils::EndsWith(path, ".py")) {
            continue;
        }
        for (const auto& module : ImportedModules(content)) {
            if (GuiToolkits().count(module) > 0) {
                gui.insert(module);
            }
        }
    }
    return {gui.begin(), gui.end()};
}

std::string RenderRequirements(const InferredDependencies& inferred) {
    std::ostringstream oss;
    oss << "# Auto-detected dependencies\n";
    for (const auto& package : inferred.packages) {
        oss << package << "\n";
    }
    if (!inferred.gui_toolkits.empty()) {
        oss << "\n# GUI dependencies detected (" << utils::Join(inferred.gui_toolkits, ", ")
            << ") - may require system packages\n";
        oss << "# For tkinter: apt-get install python3-tk\n";
        oss << "# For matplotlib: apt-get install python3-tk python3-dev\n";
    }
    return oss.str();
}

std::string ModuleForDistribution(const std::string& distribution) {
    const auto lowered = utils::ToLower(distribution);
    for (const auto& [module, dist] : ModuleAliases()) {
        if (dist == lowered) {
            return module;
        }
    }
    std::string module = lowered;
    for (auto& ch : module) {
        if (ch == '-' || ch == '.') {
            ch = '_';
        }
    }
    return module;
}

std::string DistributionForModule(const std::string& module) {
    const auto it = ModuleAliases().find(module);
    if (it != ModuleAliases().end()) {
        return it->second;
    }
    return module;
}

}  // namespace healbox::deps
