#pragma once

#include "romfetch/engine.hpp"
#include <string>
#include <vector>

namespace romfetch {

struct HandoffEntry {
    std::string url;
    std::string destPath;
    std::string filename;
};

struct HandoffRequest {
    std::vector<HandoffEntry> entries;
    bool autostart{true};
    std::string packageName{"romfetch queue"};
    std::string source{"romfetch"};
    std::string referer;
};

struct HandoffResult {
    bool success{false};
    int statusCode{0};
    std::string endpoint;
    std::string body;
    std::vector<std::string> attempts;
    std::string error;
};

// Build a request from download targets; invalid targets are reported in errors.
HandoffRequest makeHandoffRequest(const std::vector<DownloadTarget>& targets, bool autostart,
                                  const std::string& packageName, std::vector<std::string>& errors);

// Form-urlencoded body for a flashgot-style endpoint.
std::string buildHandoffForm(const HandoffRequest& req);

// Endpoints to try, normalised to a /flashgot path.
std::vector<std::string> handoffEndpointCandidates(const std::string& endpoint);

// POST the batch to a local download manager. The engine never calls this;
// it is a sink for callers that prefer an external manager.
bool postHandoff(const std::string& endpoint, const HandoffRequest& req, int timeoutSec,
                 HandoffResult& out, std::string& err);

} // namespace romfetch
