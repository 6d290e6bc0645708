#pragma once
#include "config.hpp"
#include <filesystem>
#include <string>
#include <vector>

struct SyncResult {
    bool ok = false;
    std::string diagnostic;

    static SyncResult success() { return {true, ""}; }
    static SyncResult failure(std::string diagnostic) { return {false, std::move(diagnostic)}; }
};

// Brings a working tree in line with its remote: local modifications and
// untracked files are discarded and the current branch is moved to the
// remote's latest commit. Either the tree ends up clean at the remote commit
// or a failure with a readable diagnostic is reported.
class RepoSynchronizer {
public:
    virtual ~RepoSynchronizer() = default;
    virtual SyncResult synchronize(const std::filesystem::path& repo_dir) = 0;
};

class GitSynchronizer : public RepoSynchronizer {
public:
    explicit GitSynchronizer(const Config& config);

    SyncResult synchronize(const std::filesystem::path& repo_dir) override;

private:
    const Config& config_;

    SyncResult run_git(const std::vector<std::string>& args,
                       const std::filesystem::path& repo_dir,
                       std::string* output = nullptr) const;
};
