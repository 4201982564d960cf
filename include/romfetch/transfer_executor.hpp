#pragma once

#include "romfetch/command_builder.hpp"
#include "romfetch/config.hpp"
#include "romfetch/engine_state.hpp"
#include "romfetch/metadata_probe.hpp"
#include "romfetch/models.hpp"
#include "romfetch/progress.hpp"
#include "romfetch/transport_resolver.hpp"

namespace romfetch {

// Runs exactly one attempt of a job: spawn the transfer tool, watch the
// destination file grow, report progress, and stop on halt. Progress is
// inferred from bytes on disk; the tool's stdout is kept only for diagnostics.
//
// An ERROR result is returned without emitting; the caller decides whether
// to retry and owns the terminal ERROR emission.
class TransferExecutor {
public:
    TransferExecutor(const Config& cfg,
                     EngineState& state,
                     ProgressEmitter& emitter,
                     TransportResolver& resolver,
                     ProbeFn probe);

    TransferResult run(TransferJob& job, const ProgressCallback& cb);

private:
    bool resolveExecutable(TransferJob& job, std::string& outExe, std::string& err);
    TransferResult halted(TransferJob& job, TransferResult result, const ProgressCallback& cb);
    TransferResult failed(TransferJob& job, TransferResult result, const std::string& error);

    Config cfg_;
    EngineState& state_;
    ProgressEmitter& emitter_;
    TransportResolver& resolver_;
    ProbeFn probe_;
    CommandBuilder builder_;
};

} // namespace romfetch
