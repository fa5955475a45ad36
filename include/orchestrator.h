#pragma once

#include <stddef.h>
#include <stdint.h>

#include "batchsync.h"
#include "transfer.h"

namespace batchsync {

enum class RunStatus {
    Success,
    TransferFailed,
    RetriesExhausted,
    ListingFailed,
    LaunchFailed,
    WalkFailed,
};

const char* describe(RunStatus status);

// Process exit codes. 1 is left to gflags, which exits with it on a bad flag.
const int kExitTransferFailed = 5;
const int kExitRetriesExhausted = 2;
const int kExitListingFailed = 3;
const int kExitWalkFailed = 4;
const int kExitUsage = 64;

int exitCodeFor(RunStatus status);

struct RunOutcome {
    RunStatus status = RunStatus::Success;
    int exitStatus = 0;     // last transfer tool status, if any
    size_t nBatches = 0;    // batches transferred successfully
    size_t nFiles = 0;
    uint64_t nBytes = 0;
};

/**
 * Drives one run: pulls entries from the source, fills the current Batch,
 * flushes it through the TransferExecutor whenever the run size is reached
 * and once more for the trailing partial batch. The first failure ends the
 * run; later batches are never attempted.
 */
class Orchestrator {

public:
    RunParam params;

    Orchestrator(const RunParam& params, TransferExecutor& executor);

    RunOutcome run(EntrySource& source);

private:
    bool flush(Batch& batch, RunOutcome& outcome);

    TransferExecutor& executor;
    BatchBuilder builder;
};

}
