#pragma once

#include "Result.h"
#include <filesystem>
#include <string>

namespace PinDrop {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static std::filesystem::path getConfigPath();
    static std::filesystem::path getDefaultSaveDir();

    /// Expands a leading "~" to $HOME
    static std::filesystem::path expandHome(const std::string& path);

    /// Creates the directory (and parents) if missing
    static pd::Result<void> ensureDirectory(const std::filesystem::path& dir);
};

} // namespace PinDrop
