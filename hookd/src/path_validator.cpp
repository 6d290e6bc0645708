#include "path_validator.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {

bool is_descendant(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++cand_it) {
        // A trailing separator leaves an empty last component
        if (root_it->empty()) {
            continue;
        }
        if (cand_it == candidate.end() || *cand_it != *root_it) {
            return false;
        }
    }
    return true;
}

}

bool is_valid_subpath(const std::string& subpath) {
    static const std::regex allowed(R"(^[\w\-./\\]+$)");
    // std::regex recurses per character; bound the input before matching
    if (subpath.empty() || subpath.size() > kMaxSubpathLength ||
        !std::regex_match(subpath, allowed)) {
        return false;
    }

    std::string normalized = subpath;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::stringstream ss(normalized);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "..") {
            return false;
        }
    }
    return true;
}

std::optional<fs::path> resolve_within_root(const fs::path& root, const std::string& subpath) {
    std::string relative = subpath;
    std::replace(relative.begin(), relative.end(), '\\', '/');
    relative.erase(0, relative.find_first_not_of('/'));
    if (relative.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    auto canonical_root = fs::weakly_canonical(root, ec);
    if (ec) {
        return std::nullopt;
    }

    auto resolved = fs::weakly_canonical(canonical_root / relative, ec);
    if (ec) {
        return std::nullopt;
    }

    if (!is_descendant(canonical_root, resolved)) {
        return std::nullopt;
    }
    return resolved;
}

PathValidator::PathValidator(const fs::path& root) : root_(root) {}

bool PathValidator::validate(const std::string& subpath) const {
    return is_valid_subpath(subpath);
}

std::optional<fs::path> PathValidator::resolve(const std::string& subpath) const {
    return resolve_within_root(root_, subpath);
}
