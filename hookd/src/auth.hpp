#pragma once
#include "config.hpp"
#include <optional>
#include <string>

// Open mode when no secret is configured. Otherwise the presented token must
// match the secret exactly.
bool authorize(const std::optional<std::string>& presented_token,
               const std::optional<std::string>& configured_secret);

class AccessGuard {
public:
    explicit AccessGuard(const Config& config);

    bool authorize(const std::optional<std::string>& presented_token) const;
    bool is_open() const;

private:
    const Config& config_;
};
