// Whether host names, user names and paths may appear in log lines.
// Verbatim values need TSCP_ENV=dev|development|local|debug and
// TSCP_LOG_SENSITIVE=1|true|yes|on; everything else is redacted.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace tscp {

// Lower-cased value of an environment variable without surrounding blanks.
inline std::string envToken(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    std::string v = raw ? raw : "";
    auto blank = [](unsigned char c) { return std::isspace(c) != 0; };
    v.erase(v.begin(), std::find_if_not(v.begin(), v.end(), blank));
    v.erase(std::find_if_not(v.rbegin(), v.rend(), blank).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

inline bool sensitiveLoggingEnabled() {
    const std::string env = envToken("TSCP_ENV");
    const std::string flag = envToken("TSCP_LOG_SENSITIVE");
    const bool dev = env == "dev" || env == "development" || env == "local" || env == "debug";
    const bool on = flag == "1" || flag == "true" || flag == "yes" || flag == "on";
    return dev && on;
}

inline std::string loggable(const std::string &value) {
    if (value.empty() || sensitiveLoggingEnabled())
        return value;
    return "<redacted>";
}

} // namespace tscp
