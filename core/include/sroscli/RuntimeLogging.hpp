// Transcript logging policy. Device transcripts can carry secrets (passwords
// in config lines), so they reach the log only in a dev environment with
// explicit opt-in: SROSCLI_ENV=dev|development|local|debug and
// SROSCLI_LOG_SENSITIVE=1|true|yes|on.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace sroscli {

// Trimmed, lower-cased value of an environment variable; empty when unset.
inline std::string lowerEnv(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    const auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

inline bool sensitiveLoggingEnabled() {
    const std::string env = lowerEnv("SROSCLI_ENV");
    const bool dev = env == "dev" || env == "development" || env == "local" ||
                     env == "debug";
    if (!dev)
        return false;
    const std::string flag = lowerEnv("SROSCLI_LOG_SENSITIVE");
    return flag == "1" || flag == "true" || flag == "yes" || flag == "on";
}

// The text itself when sensitive logging is on, otherwise only its size.
inline std::string loggableTranscript(const std::string &text) {
    if (sensitiveLoggingEnabled())
        return text;
    return "<" + std::to_string(text.size()) + " bytes>";
}

} // namespace sroscli
