#pragma once
#include <string>
#include <filesystem>

namespace util {
    void setup_logging(const std::string& name, const std::string& level);
    std::string current_iso8601();

    // Creates the file if missing and bumps its modification time
    void touch_file(const std::filesystem::path& path);
}
