#pragma once

#include <string>

namespace romfetch {

constexpr const char* kAppName = "romfetch";

inline const char* appVersion() {
#ifdef ROMFETCH_APP_VERSION
    return ROMFETCH_APP_VERSION;
#else
    return "0.0.0";
#endif
}

// "romfetch/<version>", the product token sent on plain HTTP requests.
inline std::string productToken() {
    return std::string(kAppName) + "/" + appVersion();
}

} // namespace romfetch
