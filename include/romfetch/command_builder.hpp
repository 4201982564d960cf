#pragma once

#include "romfetch/config.hpp"
#include "romfetch/provider.hpp"
#include <string>
#include <vector>

namespace romfetch {

enum class TransportKind {
    CopyUrl,      // generic single-file copy
    HttpCopyTo,   // HTTP-remote addressing: root + relative path
    Native        // OS-native HTTP client
};

const char* transportKindLabel(TransportKind kind);

struct CommandSpec {
    TransportKind kind{TransportKind::CopyUrl};
    std::string url;
    std::string destPath;
    bool troubleshoot{false};
};

// Builds argument vectors; argv[0] is the executable path supplied by the caller.
class CommandBuilder {
public:
    explicit CommandBuilder(const Config& cfg);

    // Provider URLs need root + relative addressing; everything else uses copyurl.
    TransportKind primaryKindFor(const std::string& url) const;

    bool build(const std::string& executable,
               const CommandSpec& spec,
               std::vector<std::string>& outArgs,
               std::string& err) const;

    // Split url into (root, relative) for HTTP-remote addressing.
    static bool splitHttpRemote(const std::string& url, std::string& outRoot, std::string& outRel, std::string& err);

private:
    void appendCommonFlags(std::vector<std::string>& args, bool troubleshoot) const;
    bool buildNative(const std::string& executable, const CommandSpec& spec,
                     std::vector<std::string>& outArgs, std::string& err) const;

    Config cfg_;
    ProviderTopology topology_;
};

} // namespace romfetch
