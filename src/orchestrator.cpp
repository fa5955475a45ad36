#include <glog/logging.h>
#include "orchestrator.h"

namespace batchsync {

const char* describe(RunStatus status) {
    switch (status) {
        case RunStatus::Success:
            return "success";
        case RunStatus::TransferFailed:
            return "transfer failed";
        case RunStatus::RetriesExhausted:
            return "exhausted retries";
        case RunStatus::ListingFailed:
            return "listing file error";
        case RunStatus::LaunchFailed:
            return "could not start transfer command";
        case RunStatus::WalkFailed:
            return "source walk failed";
    }
    return "unknown";
}

int exitCodeFor(RunStatus status) {
    switch (status) {
        case RunStatus::Success:
            return 0;
        case RunStatus::TransferFailed:
            return kExitTransferFailed;
        case RunStatus::RetriesExhausted:
            return kExitRetriesExhausted;
        case RunStatus::ListingFailed:
        case RunStatus::LaunchFailed:
            return kExitListingFailed;
        case RunStatus::WalkFailed:
            return kExitWalkFailed;
    }
    return kExitTransferFailed;
}

Orchestrator::Orchestrator(const RunParam& params, TransferExecutor& executor)
    : params(params), executor(executor), builder(params.runSizeBytes) {}

RunOutcome Orchestrator::run(EntrySource& source) {
    RunOutcome outcome;
    std::unique_ptr<Batch> batch = Batch::create(this->params.listingDir);
    if (!batch) {
        outcome.status = RunStatus::ListingFailed;
        return outcome;
    }

    SourceEntry entry;
    while (source.next(entry)) {
        AppendResult res = this->builder.append(*batch, entry);
        if (!res.ok) {
            outcome.status = RunStatus::ListingFailed;
            return outcome;
        }
        if (!res.flushNeeded) {
            continue;
        }
        if (!flush(*batch, outcome)) {
            return outcome;
        }
        batch.reset();
        batch = Batch::create(this->params.listingDir);
        if (!batch) {
            outcome.status = RunStatus::ListingFailed;
            return outcome;
        }
    }

    if (source.failed()) {
        outcome.status = RunStatus::WalkFailed;
        return outcome;
    }
    if (!batch->empty()) {
        flush(*batch, outcome);
    }
    return outcome;
}

bool Orchestrator::flush(Batch& batch, RunOutcome& outcome) {
    LOG(INFO) << "[Orchestrator::flush] batch " << outcome.nBatches + 1 << ": "
              << batch.entries.size() << " files, " << batch.accumulatedBytes << " bytes";
    TransferResult res = this->executor.run(batch);
    outcome.exitStatus = res.exitStatus;
    switch (res.status) {
        case TransferStatus::Success:
            outcome.nBatches += 1;
            outcome.nFiles += batch.entries.size();
            outcome.nBytes += batch.accumulatedBytes;
            return true;
        case TransferStatus::Fatal:
            outcome.status = RunStatus::TransferFailed;
            break;
        case TransferStatus::RetriesExhausted:
            outcome.status = RunStatus::RetriesExhausted;
            break;
        case TransferStatus::ListingFailed:
            outcome.status = RunStatus::ListingFailed;
            break;
        case TransferStatus::LaunchFailed:
            outcome.status = RunStatus::LaunchFailed;
            break;
    }
    return false;
}

}
