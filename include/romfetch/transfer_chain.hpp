#pragma once

#include "romfetch/failover_policy.hpp"
#include "romfetch/progress.hpp"
#include "romfetch/transfer_executor.hpp"

namespace romfetch {

// Drive one logical job through its retry chain: run an attempt, ask the
// failover policy for the next step, apply it, repeat. Bounded by
// maxInvocations transfer attempts. Never throws.
TransferResult runTransferChain(TransferExecutor& executor,
                                const FailoverPolicy& policy,
                                ProgressEmitter& emitter,
                                TransferJob job,
                                const ProgressCallback& cb,
                                int maxInvocations);

// Hard cap on attempts for one chain: profile retry, mirror, hops, fallback.
inline int chainInvocationCap(const Config& cfg) { return cfg.maxAttempts + 3; }

} // namespace romfetch
