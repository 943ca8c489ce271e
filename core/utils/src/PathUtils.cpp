#include "PathUtils.h"
#include <cstdlib>

namespace PinDrop {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home);
    }
    return std::filesystem::temp_directory_path();
}

std::filesystem::path PathUtils::getConfigDir() {
    if (const char* config = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(config) / "pindrop";
    }
    return getHome() / ".config" / "pindrop";
}

std::filesystem::path PathUtils::getConfigPath() {
    return getConfigDir() / "pindrop.conf";
}

std::filesystem::path PathUtils::getDefaultSaveDir() {
    return getHome() / "Downloads";
}

std::filesystem::path PathUtils::expandHome(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        return getHome() / path.substr(path.size() > 1 ? 2 : 1);
    }
    return std::filesystem::path(path);
}

pd::Result<void> PathUtils::ensureDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
        return pd::Ok();
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return pd::Err(pd::ErrorCode::DirectoryCreateFailed,
                       "Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    }
    return pd::Ok();
}

} // namespace PinDrop
