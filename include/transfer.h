#pragma once

#include <functional>
#include <string>
#include <vector>

#include "batchsync.h"

namespace batchsync {

struct TransferParam {
    string rsyncBinary = "rsync";
    string srcDir;
    string destHost;
    vector<string> extraOptions;   // operator supplied, appended verbatim
    unsigned maxAttempts = 5;
    unsigned backoffSeconds = 90;
    int transientStatus = 12;      // rsync: error in rsync protocol data stream
    bool isVerbose = false;
};

enum class TransferStatus {
    Success,
    Fatal,
    RetriesExhausted,
    ListingFailed,
    LaunchFailed,
};

struct TransferResult {
    TransferStatus status;
    int exitStatus;
    unsigned nAttempts;
};

// Runs argv[0] with the given argument vector and returns its exit status,
// or a negative value if the child could not be started or waited for.
class CommandRunner {

public:
    virtual ~CommandRunner() {}
    virtual int run(const vector<string>& argv) = 0;
};

class ForkExecRunner : public CommandRunner {

public:
    bool isVerbose = false;

    int run(const vector<string>& argv) override;
};

// -lptgoD --no-implied-dirs --no-r
const vector<string>& baselineOptions();

// Splits an operator option string on whitespace. No quote handling.
vector<string> splitOptions(const string& text);

/**
 * Hands a finished Batch to rsync and retries the whole batch while rsync
 * keeps exiting with the transient status. Any other non-zero status ends
 * the run.
 */
class TransferExecutor {

public:
    TransferParam params;
    std::function<void(unsigned)> sleeper;

    TransferExecutor(const TransferParam& params, CommandRunner& runner);

    TransferResult run(Batch& batch);

    vector<string> buildCommand(const Batch& batch) const;

private:
    CommandRunner& runner;
};

}
