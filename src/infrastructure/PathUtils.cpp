#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace dobdecoder::infrastructure {

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

fs::path PathUtils::GetDecoderConfigDir() {
    const char* overrideDir = std::getenv("DOBDECODER_CONFIG_DIR");
    if (overrideDir && *overrideDir) {
        return fs::path(overrideDir);
    }
    return GetConfigHome() / "dobdecoder";
}

std::optional<std::string> PathUtils::ReadFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace dobdecoder::infrastructure
