#include <glog/logging.h>
#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <thread>
#include <boost/algorithm/string.hpp>
#include "transfer.h"

namespace batchsync {

const vector<string>& baselineOptions() {
    static const vector<string> options = {"-lptgoD", "--no-implied-dirs", "--no-r"};
    return options;
}

vector<string> splitOptions(const string& text) {
    vector<string> tokens;
    string trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty()) {
        return tokens;
    }
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(),
                            boost::algorithm::token_compress_on);
    return tokens;
}

int ForkExecRunner::run(const vector<string>& argv) {
    if (argv.empty()) {
        LOG(ERROR) << "[ForkExecRunner::run] empty command";
        return -1;
    }
    if (isVerbose) {
        LOG(INFO) << "[ForkExecRunner::run] " << boost::algorithm::join(argv, " ");
    }
    vector<char*> args;
    for (const string& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    cout.flush();
    pid_t pid = fork();
    if (pid < 0) {
        LOG(ERROR) << "[ForkExecRunner::run] fork failed: " << strerror(errno);
        return -1;
    }
    if (pid == 0) {
        execvp(args[0], args.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOG(ERROR) << "[ForkExecRunner::run] waitpid failed: " << strerror(errno);
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        LOG(ERROR) << "[ForkExecRunner::run] " << argv[0] << " killed by signal "
                   << WTERMSIG(status);
        return 128 + WTERMSIG(status);
    }
    return -1;
}

TransferExecutor::TransferExecutor(const TransferParam& params, CommandRunner& runner)
    : params(params), runner(runner) {
    this->sleeper = [](unsigned seconds) {
        std::this_thread::sleep_for(std::chrono::seconds(seconds));
    };
}

vector<string> TransferExecutor::buildCommand(const Batch& batch) const {
    vector<string> argv;
    argv.push_back(this->params.rsyncBinary);
    for (const string& option : baselineOptions()) {
        argv.push_back(option);
    }
    argv.push_back("--from0");
    argv.push_back("--files-from=" + batch.listingPath);
    for (const string& option : this->params.extraOptions) {
        argv.push_back(option);
    }
    string srcDir = this->params.srcDir;
    if (srcDir.empty() || srcDir.back() != '/') {
        srcDir += '/';
    }
    argv.push_back(srcDir);
    argv.push_back(this->params.destHost);
    return argv;
}

TransferResult TransferExecutor::run(Batch& batch) {
    if (!batch.finalize()) {
        return TransferResult{TransferStatus::ListingFailed, 0, 0};
    }
    const vector<string> argv = buildCommand(batch);
    int status = 0;
    for (unsigned attempt = 1; attempt <= this->params.maxAttempts; ++attempt) {
        status = this->runner.run(argv);
        if (status == 0) {
            return TransferResult{TransferStatus::Success, 0, attempt};
        }
        if (status < 0) {
            LOG(ERROR) << "[TransferExecutor::run] could not run " << this->params.rsyncBinary;
            return TransferResult{TransferStatus::LaunchFailed, status, attempt};
        }
        if (status != this->params.transientStatus) {
            LOG(ERROR) << "[TransferExecutor::run] " << this->params.rsyncBinary
                       << " failed with status " << status << " on attempt " << attempt;
            return TransferResult{TransferStatus::Fatal, status, attempt};
        }
        if (this->params.isVerbose) {
            LOG(WARNING) << "[TransferExecutor::run] recoverable failure (status " << status
                         << ") on attempt " << attempt << " of " << this->params.maxAttempts;
        }
        if (attempt < this->params.maxAttempts) {
            this->sleeper(this->params.backoffSeconds);
        }
    }
    LOG(ERROR) << "[TransferExecutor::run] giving up after " << this->params.maxAttempts
               << " attempts, last status " << status;
    return TransferResult{TransferStatus::RetriesExhausted, status, this->params.maxAttempts};
}

}
