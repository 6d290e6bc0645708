#pragma once
#include <filesystem>
#include <optional>
#include <string>

constexpr size_t kMaxSubpathLength = 4096;

// Character filter: word characters, '-', '.', '/' and '\' only, no ".." segment
bool is_valid_subpath(const std::string& subpath);

// Joins subpath onto root, resolves symlinks and dot segments, and returns the
// result only if it stays inside root.
std::optional<std::filesystem::path> resolve_within_root(const std::filesystem::path& root,
                                                         const std::string& subpath);

class PathValidator {
public:
    explicit PathValidator(const std::filesystem::path& root);

    bool validate(const std::string& subpath) const;
    std::optional<std::filesystem::path> resolve(const std::string& subpath) const;

private:
    std::filesystem::path root_;
};
