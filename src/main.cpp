#include <gflags/gflags.h>
#include <glog/logging.h>
#include <stdlib.h>
#include <string.h>

#include "orchestrator.h"

DEFINE_uint64(run_size, 128, "\nbatch size in megabytes; a batch is transferred once it reaches this size\n");
DEFINE_string(exclude_pattern, "", "\nregex; files whose path relative to SRCDIR matches are skipped\n");
DEFINE_bool(verbose, false, "\nlog recoverable transfer failures\n");
DEFINE_bool(man, false, "\nprint the full manual and exit\n");
DEFINE_bool(progress, false, "\necho every enumerated path to stdout\n");
DEFINE_string(rsync_binary, "rsync", "\ntransfer command\n");
DEFINE_string(listing_dir, "", "\ndirectory for batch listing files (default $TMPDIR or /tmp)\n");

DECLARE_bool(help);

using namespace batchsync;

static const char* kOptionsEnv = "BATCHSYNC_RSYNC_OPTS";

static const char* kUsage =
    "batchsync [options] SRCDIR DESTHOST\n"
    "\n"
    "  --run-size MB            batch size in megabytes (default 128)\n"
    "  --exclude_pattern REGEX  skip files whose relative path matches\n"
    "  --verbose                log recoverable transfer failures\n"
    "  --progress               echo every enumerated path\n"
    "  --help, -h               this text\n"
    "  --man                    full manual\n";

static const char* kManual =
    "NAME\n"
    "    batchsync - mirror a large directory tree with rsync in size-bounded batches\n"
    "\n"
    "SYNOPSIS\n"
    "    batchsync [--run-size MB] [--exclude_pattern REGEX] [--verbose] SRCDIR DESTHOST\n"
    "\n"
    "DESCRIPTION\n"
    "    SRCDIR is walked once. Regular files are collected into batches until a\n"
    "    batch holds at least --run-size megabytes, then rsync is run on that batch\n"
    "    alone with a generated --files-from listing. The file that crosses the\n"
    "    threshold stays in the batch. Whatever is left at the end of the walk is\n"
    "    sent as a last, smaller batch. The hierarchy below SRCDIR is reproduced\n"
    "    under DESTHOST, which is passed to rsync unchanged.\n"
    "\n"
    "    rsync always gets -lptgoD --no-implied-dirs --no-r. The contents of\n"
    "    $BATCHSYNC_RSYNC_OPTS are split on whitespace and appended; they are not\n"
    "    checked, so do not put -r or -a there.\n"
    "\n"
    "    rsync exit status 12 is retried on the same batch after 90 seconds, up to\n"
    "    5 attempts. Any other failure stops the run at once.\n"
    "\n"
    "EXCLUSIONS\n"
    "    --exclude_pattern is an ECMAScript regular expression searched (not\n"
    "    anchored) in each path relative to SRCDIR, case-sensitively. Excluded\n"
    "    files are never stat()ed.\n"
    "\n"
    "EXIT STATUS\n"
    "    0 success, 1 unknown flag, 2 retries exhausted, 3 listing file error,\n"
    "    4 source walk failed, 5 rsync failed, 64 usage error.\n";

// gflags spells flags with underscores; accept the dashed forms too.
static vector<string> normalizeArgs(int argc, char** argv) {
    vector<string> args;
    for (int i = 0; i < argc; ++i) {
        string arg = argv[i];
        if (arg == "-h") {
            arg = "--help";
        } else if (arg.compare(0, 10, "--run-size") == 0) {
            arg = "--run_size" + arg.substr(10);
        } else if (arg.compare(0, 17, "--exclude-pattern") == 0) {
            arg = "--exclude_pattern" + arg.substr(17);
        }
        args.push_back(arg);
    }
    return args;
}

static string defaultListingDir() {
    const char* tmpdir = getenv("TMPDIR");
    if (tmpdir != NULL && strlen(tmpdir) > 0) {
        return tmpdir;
    }
    return "/tmp";
}

int main(int argc, char **argv) {
    google::InitGoogleLogging(argv[0]);
    google::SetUsageMessage(kUsage);

    vector<string> argStore = normalizeArgs(argc, argv);
    vector<char*> argPtrs;
    for (string& arg : argStore) {
        argPtrs.push_back(&arg[0]);
    }
    argPtrs.push_back(nullptr);
    int nArgs = argc;
    char** args = argPtrs.data();
    google::ParseCommandLineNonHelpFlags(&nArgs, &args, true);

    if (FLAGS_help) {
        cout << kUsage;
        return 0;
    }
    if (FLAGS_man) {
        cout << kManual;
        return 0;
    }
    google::HandleCommandLineHelpFlags();

    if (nArgs != 3) {
        std::cerr << "expected SRCDIR and DESTHOST\n\n" << kUsage;
        return kExitUsage;
    }
    uint64_t runSizeBytes = 0;
    if (!megabytesToBytes(FLAGS_run_size, runSizeBytes)) {
        std::cerr << "--run-size must be between 1 and " << UINT64_MAX / MB << "\n";
        return kExitUsage;
    }
    string srcDir = args[1];
    string destHost = args[2];

    boost::system::error_code ec;
    if (!fs::is_directory(srcDir, ec)) {
        std::cerr << "not a directory: " << srcDir << "\n";
        return kExitUsage;
    }

    ExclusionFilter filter;
    string patternError;
    if (!ExclusionFilter::compile(FLAGS_exclude_pattern, filter, patternError)) {
        std::cerr << "bad --exclude_pattern '" << FLAGS_exclude_pattern << "': "
                  << patternError << "\n";
        return kExitUsage;
    }

    RunParam runParams;
    runParams.runSizeBytes = runSizeBytes;
    runParams.listingDir = FLAGS_listing_dir.empty() ? defaultListingDir() : FLAGS_listing_dir;

    TransferParam transferParams;
    transferParams.rsyncBinary = FLAGS_rsync_binary;
    transferParams.srcDir = srcDir;
    transferParams.destHost = destHost;
    transferParams.isVerbose = FLAGS_verbose;
    const char* envOptions = getenv(kOptionsEnv);
    if (envOptions != NULL) {
        transferParams.extraOptions = splitOptions(envOptions);
    }

    LOG(INFO) << "mirroring " << srcDir << " to " << destHost << " in batches of "
              << FLAGS_run_size << " MB";

    ForkExecRunner runner;
    runner.isVerbose = FLAGS_verbose;
    TransferExecutor executor(transferParams, runner);
    Orchestrator orchestrator(runParams, executor);

    TreeEnumerator enumerator(srcDir, filter);
    enumerator.isProgress = FLAGS_progress;
    RunOutcome outcome = orchestrator.run(enumerator);

    if (outcome.status != RunStatus::Success) {
        LOG(ERROR) << "run aborted: " << describe(outcome.status)
                   << " (transfer status " << outcome.exitStatus << ")";
        return exitCodeFor(outcome.status);
    }
    LOG(INFO) << "done: " << outcome.nBatches << " batches, " << outcome.nFiles
              << " files, " << outcome.nBytes << " bytes";
    return 0;
}
