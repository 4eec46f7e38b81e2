// Environment switches for diagnostics. Usernames only reach the logs in a dev
// environment (PULLFEED_ENV=dev|development|local|debug) with
// PULLFEED_LOG_SENSITIVE enabled. Passwords are never logged.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace pullfeed {

// Lower-cased, whitespace-trimmed value of an environment variable.
inline std::string envLower(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = envLower(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

inline bool sensitiveLoggingEnabled() {
    const std::string env = envLower("PULLFEED_ENV");
    const bool dev = env == "dev" || env == "development" || env == "local" ||
                     env == "debug";
    return dev && envFlagEnabled("PULLFEED_LOG_SENSITIVE");
}

// "user@host:port" when sensitive logging is on, "host:port" otherwise.
inline std::string describeEndpoint(const std::string &host, std::uint16_t port,
                                    const std::string &user) {
    std::string out = host + ":" + std::to_string(port);
    if (sensitiveLoggingEnabled() && !user.empty())
        out = user + "@" + out;
    return out;
}

} // namespace pullfeed
