#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace romfetch {

enum class ErrorCategory {
    None,
    Config,
    Setup,
    Network,
    Http,
    Url,
    Filesystem,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigInvalid,
    MissingBinary,
    SpawnFailure,
    TransportFailure,
    Timeout,
    DnsFailure,
    ConnectFailure,
    HttpStatus,
    HttpUnauthorized,
    HttpForbidden,
    HttpNotFound,
    InvalidUrl,
    WriteFailure
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    int httpStatus{0};
    bool retryable{false};
    std::string userMessage;
    std::string detail;
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Setup: return "Setup";
        case ErrorCategory::Network: return "Network";
        case ErrorCategory::Http: return "HTTP";
        case ErrorCategory::Url: return "URL";
        case ErrorCategory::Filesystem: return "Filesystem";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::MissingBinary: return "MissingBinary";
        case ErrorCode::SpawnFailure: return "SpawnFailure";
        case ErrorCode::TransportFailure: return "TransportFailure";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::DnsFailure: return "DnsFailure";
        case ErrorCode::ConnectFailure: return "ConnectFailure";
        case ErrorCode::HttpStatus: return "HttpStatus";
        case ErrorCode::HttpUnauthorized: return "HttpUnauthorized";
        case ErrorCode::HttpForbidden: return "HttpForbidden";
        case ErrorCode::HttpNotFound: return "HttpNotFound";
        case ErrorCode::InvalidUrl: return "InvalidUrl";
        case ErrorCode::WriteFailure: return "WriteFailure";
        default: return "Unknown";
    }
}

inline std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

inline int parseHttpStatusFromMessage(const std::string& msg) {
    // Accept "HTTP 404", "HTTP error 404 (404 Not Found)" and "(HTTP 503)".
    auto pos = msg.find("HTTP ");
    if (pos == std::string::npos) pos = msg.find("HTTP");
    if (pos == std::string::npos) return 0;
    pos = msg.find_first_of("0123456789", pos);
    if (pos == std::string::npos) return 0;
    int code = 0;
    int digits = 0;
    while (pos < msg.size() && std::isdigit(static_cast<unsigned char>(msg[pos])) && digits < 4) {
        code = code * 10 + (msg[pos] - '0');
        ++pos;
        ++digits;
    }
    if (digits != 3) return 0;
    return (code >= 100 && code < 600) ? code : 0;
}

// Ordered substring table; first match wins. Needles are lowercase.
struct ErrorMarker {
    const char* needle;
    ErrorCategory category;
    ErrorCode code;
    const char* userMessage;
    bool retryable;
};

inline const ErrorMarker* errorMarkers(size_t& count) {
    static const ErrorMarker kMarkers[] = {
        {"binary not found", ErrorCategory::Setup, ErrorCode::MissingBinary, "Transfer tool is not installed.", false},
        {"invalid config", ErrorCategory::Config, ErrorCode::ConfigInvalid, "Configuration is invalid.", false},
        {"invalid url", ErrorCategory::Url, ErrorCode::InvalidUrl, "The download URL is malformed.", false},
        {"unsupported protocol", ErrorCategory::Url, ErrorCode::InvalidUrl, "The download URL is malformed.", false},
        {"empty relative path", ErrorCategory::Url, ErrorCode::InvalidUrl, "The download URL is malformed.", false},
        {"spawn failed", ErrorCategory::Setup, ErrorCode::SpawnFailure, "Could not start the transfer tool.", false},
        {"no such host", ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true},
        {"temporary failure", ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true},
        {"could not resolve", ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true},
        {"name resolution", ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true},
        {"i/o timeout", ErrorCategory::Network, ErrorCode::Timeout, "Network operation timed out.", true},
        {"timed out", ErrorCategory::Network, ErrorCode::Timeout, "Network operation timed out.", true},
        {"timeout", ErrorCategory::Network, ErrorCode::Timeout, "Network operation timed out.", true},
        {"failed to respond", ErrorCategory::Network, ErrorCode::Timeout, "Server failed to respond.", true},
        {"connectex", ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true},
        {"connection attempt failed", ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true},
        {"connection refused", ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true},
        {"connection reset", ErrorCategory::Network, ErrorCode::ConnectFailure, "Connection was reset.", true},
        {"connect failed", ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true},
        {"write failed", ErrorCategory::Filesystem, ErrorCode::WriteFailure, "Failed to write to storage.", false},
        {"no space left", ErrorCategory::Filesystem, ErrorCode::WriteFailure, "Storage is full.", false},
    };
    count = sizeof(kMarkers) / sizeof(kMarkers[0]);
    return kMarkers;
}

inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const int http = parseHttpStatusFromMessage(detail);
    if (http >= 400) {
        out.httpStatus = http;
        out.category = ErrorCategory::Http;
        out.retryable = false;
        if (http == 401) {
            out.code = ErrorCode::HttpUnauthorized;
            out.userMessage = "Authentication failed (401).";
        } else if (http == 403) {
            out.code = ErrorCode::HttpForbidden;
            out.userMessage = "Access denied (403).";
        } else if (http == 404 || http == 410) {
            out.code = ErrorCode::HttpNotFound;
            out.userMessage = "Requested file was not found.";
        } else {
            out.code = ErrorCode::HttpStatus;
            out.userMessage = "Server returned an HTTP error.";
        }
        return out;
    }

    const std::string l = toLowerCopy(detail);
    size_t count = 0;
    const ErrorMarker* markers = errorMarkers(count);
    for (size_t i = 0; i < count; ++i) {
        if (l.find(markers[i].needle) == std::string::npos) continue;
        out.category = markers[i].category;
        out.code = markers[i].code;
        out.userMessage = markers[i].userMessage;
        out.retryable = markers[i].retryable;
        return out;
    }

    if (out.category == ErrorCategory::None) out.category = ErrorCategory::Internal;
    out.userMessage = "Transfer failed.";
    return out;
}

// Transient transport failures that the failover chain may act on.
inline bool isRetryableTransportError(const std::string& message) {
    return classifyError(message).retryable;
}

} // namespace romfetch
