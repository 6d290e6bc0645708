#include "auth.hpp"
#include <spdlog/spdlog.h>

namespace {

// Runtime depends only on the secret length
bool constant_time_equals(const std::string& presented, const std::string& secret) {
    unsigned char diff = presented.size() == secret.size() ? 0 : 1;
    for (size_t i = 0; i < secret.size(); ++i) {
        unsigned char p = i < presented.size() ? static_cast<unsigned char>(presented[i]) : 0;
        diff |= p ^ static_cast<unsigned char>(secret[i]);
    }
    return diff == 0;
}

}

bool authorize(const std::optional<std::string>& presented_token,
               const std::optional<std::string>& configured_secret) {
    if (!configured_secret) {
        return true;
    }
    if (!presented_token) {
        return false;
    }
    return constant_time_equals(*presented_token, *configured_secret);
}

AccessGuard::AccessGuard(const Config& config) : config_(config) {}

bool AccessGuard::authorize(const std::optional<std::string>& presented_token) const {
    if (config_.debug && config_.security_token) {
        spdlog::debug("Received token: {}", presented_token.value_or("<none>"));
    }
    return ::authorize(presented_token, config_.security_token);
}

bool AccessGuard::is_open() const {
    return !config_.security_token.has_value();
}
