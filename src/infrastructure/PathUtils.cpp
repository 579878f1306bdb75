#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace marklens::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetPreviewDir() {
    fs::path base = fs::temp_directory_path() / "marklens-preview";
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Cannot create " << base << ": " << ec.message() << std::endl;
        return fs::temp_directory_path();
    }
    return base;
}

std::string PathUtils::SanitizeStem(const std::string& stem) {
    std::string out;
    out.reserve(stem.size());
    for (char ch : stem) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 || ch == '/' || ch == '\\' || ch == ':' || ch == '*' || ch == '?'
            || ch == '"' || ch == '<' || ch == '>' || ch == '|') {
            out.push_back('_');
        } else {
            out.push_back(ch);
        }
    }
    // Leading dots would hide the directory or collide with temp names.
    while (!out.empty() && out.front() == '.') out.erase(0, 1);
    return out.empty() ? "document" : out;
}

} // namespace marklens::infrastructure
