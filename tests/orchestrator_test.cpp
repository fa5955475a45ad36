#include <algorithm>
#include <set>

#include "orchestrator.h"
#include "test_util.h"

namespace batchsync {
namespace {

using test::FakeRunner;
using test::ScratchDir;
using test::VectorSource;

class OrchestratorTest : public ::testing::Test {

protected:
    void SetUp() override {
        transferParams.srcDir = "/src";
        transferParams.destHost = "host:/dst";
        runParams.listingDir = listingDir.str();
        runParams.runSizeBytes = 80 * MB;
    }

    RunOutcome runWith(FakeRunner& runner, EntrySource& source) {
        TransferExecutor executor(transferParams, runner);
        executor.sleeper = [this](unsigned) { nSleeps++; };
        Orchestrator orchestrator(runParams, executor);
        return orchestrator.run(source);
    }

    ScratchDir listingDir;
    RunParam runParams;
    TransferParam transferParams;
    size_t nSleeps = 0;
};

TEST_F(OrchestratorTest, ThresholdPartitionExample) {
    VectorSource source(vector<SourceEntry>{{"a", 50 * MB}, {"b", 40 * MB}, {"c", 50 * MB}});
    FakeRunner runner;
    RunOutcome outcome = runWith(runner, source);

    EXPECT_EQ(RunStatus::Success, outcome.status);
    ASSERT_EQ(2u, runner.listings.size());
    EXPECT_EQ((vector<string>{"a", "b"}), runner.listings[0]);
    EXPECT_EQ(vector<string>{"c"}, runner.listings[1]);
    EXPECT_EQ(2u, outcome.nBatches);
    EXPECT_EQ(3u, outcome.nFiles);
    EXPECT_EQ(140 * MB, outcome.nBytes);
}

TEST_F(OrchestratorTest, NoEntriesMeansNoTransfer) {
    VectorSource source(vector<SourceEntry>{});
    FakeRunner runner;
    RunOutcome outcome = runWith(runner, source);
    EXPECT_EQ(RunStatus::Success, outcome.status);
    EXPECT_EQ(0u, runner.nCalls());
    EXPECT_EQ(0u, outcome.nBatches);
    EXPECT_EQ(0u, listingDir.countEntries());
}

TEST_F(OrchestratorTest, ExactMultipleLeavesNoTrailingBatch) {
    VectorSource source(vector<SourceEntry>{{"a", 80 * MB}, {"b", 80 * MB}});
    FakeRunner runner;
    RunOutcome outcome = runWith(runner, source);
    EXPECT_EQ(RunStatus::Success, outcome.status);
    EXPECT_EQ(2u, runner.nCalls());
}

TEST_F(OrchestratorTest, FatalStatusStopsBeforeNextBatch) {
    runParams.runSizeBytes = 10;
    VectorSource source(vector<SourceEntry>{{"one", 10}, {"two", 10}, {"three", 10}, {"four", 10}});
    FakeRunner runner(vector<int>{0, 23});
    RunOutcome outcome = runWith(runner, source);

    EXPECT_EQ(RunStatus::TransferFailed, outcome.status);
    EXPECT_EQ(23, outcome.exitStatus);
    EXPECT_EQ(2u, runner.nCalls());
    EXPECT_EQ(1u, outcome.nBatches);
    EXPECT_EQ(vector<string>{"two"}, runner.listings[1]);
    EXPECT_EQ(2u, source.nPulled);
    EXPECT_EQ(0u, listingDir.countEntries());
}

TEST_F(OrchestratorTest, ExhaustedRetriesEndRun) {
    runParams.runSizeBytes = 10;
    VectorSource source(vector<SourceEntry>{{"one", 10}, {"two", 10}});
    FakeRunner runner(vector<int>{12, 12, 12, 12, 12, 12});
    RunOutcome outcome = runWith(runner, source);

    EXPECT_EQ(RunStatus::RetriesExhausted, outcome.status);
    EXPECT_EQ(5u, runner.nCalls());
    EXPECT_EQ(4u, nSleeps);
    EXPECT_EQ(0u, outcome.nBatches);
    EXPECT_EQ(0u, listingDir.countEntries());
}

TEST_F(OrchestratorTest, TransientFailureRecoversAndContinues) {
    runParams.runSizeBytes = 10;
    VectorSource source(vector<SourceEntry>{{"one", 10}, {"two", 10}});
    FakeRunner runner(vector<int>{12, 12, 0, 0});
    RunOutcome outcome = runWith(runner, source);

    EXPECT_EQ(RunStatus::Success, outcome.status);
    EXPECT_EQ(4u, runner.nCalls());
    EXPECT_EQ(2u, nSleeps);
    EXPECT_EQ(2u, outcome.nBatches);
}

TEST_F(OrchestratorTest, ListingDirMissingIsFatal) {
    runParams.listingDir = (listingDir.path / "missing").string();
    VectorSource source(vector<SourceEntry>{{"a", 1}});
    FakeRunner runner;
    RunOutcome outcome = runWith(runner, source);
    EXPECT_EQ(RunStatus::ListingFailed, outcome.status);
    EXPECT_EQ(0u, runner.nCalls());
}

TEST_F(OrchestratorTest, SamePartitionOnRerun) {
    runParams.runSizeBytes = 100;
    vector<SourceEntry> entries;
    for (int i = 0; i < 50; ++i) {
        entries.push_back(SourceEntry{"f" + std::to_string(i), (uint64_t)(i * 7 % 33)});
    }
    VectorSource first(entries);
    VectorSource second(entries);
    FakeRunner firstRunner;
    FakeRunner secondRunner;
    runWith(firstRunner, first);
    runWith(secondRunner, second);
    EXPECT_EQ(firstRunner.listings, secondRunner.listings);
}

TEST_F(OrchestratorTest, RealTreeCoveredExactlyOnce) {
    ScratchDir data;
    TreeMaker maker(data.str());
    string root = maker.createRoot("src");
    std::map<string, uint64_t> files;
    for (int dirIdx = 0; dirIdx < 5; ++dirIdx) {
        for (int fileIdx = 0; fileIdx < 12; ++fileIdx) {
            string rel = std::to_string(dirIdx) + "/" + std::to_string(fileIdx) + ".dat";
            files[rel] = (uint64_t)((dirIdx * 12 + fileIdx) * 37 % 100) * 1024;
        }
        maker.createDirectory(root + std::to_string(dirIdx));
    }
    files["skip.tmp"] = 4096;
    files["3/skip.tmp"] = 4096;
    maker.createFilesAndDirs(root, files, {});

    ExclusionFilter filter;
    string error;
    ASSERT_TRUE(ExclusionFilter::compile("\\.tmp$", filter, error));
    TreeEnumerator enumerator(root, filter);

    runParams.runSizeBytes = 200 * 1024;
    FakeRunner runner;
    RunOutcome outcome = runWith(runner, enumerator);
    ASSERT_EQ(RunStatus::Success, outcome.status);

    std::multiset<string> seen;
    for (size_t batchIdx = 0; batchIdx < runner.listings.size(); ++batchIdx) {
        uint64_t batchBytes = 0;
        for (const string& rel : runner.listings[batchIdx]) {
            seen.insert(rel);
            batchBytes += files[rel];
        }
        if (batchIdx + 1 < runner.listings.size()) {
            EXPECT_GE(batchBytes, runParams.runSizeBytes) << "batch " << batchIdx;
        }
    }
    std::multiset<string> expected;
    for (const auto& kv : files) {
        if (kv.first.find(".tmp") == string::npos) {
            expected.insert(kv.first);
        }
    }
    EXPECT_EQ(expected, seen);
    EXPECT_EQ(0u, listingDir.countEntries());
}

// Yields its entries, then reports the walk as broken.
class BrokenWalkSource : public VectorSource {

public:
    explicit BrokenWalkSource(const vector<SourceEntry>& entries) : VectorSource(entries) {}

    bool failed() const override { return true; }
};

TEST_F(OrchestratorTest, WalkFailureSkipsTrailingBatch) {
    runParams.runSizeBytes = 10;
    BrokenWalkSource source(vector<SourceEntry>{{"one", 10}, {"two", 5}});
    FakeRunner runner;
    RunOutcome outcome = runWith(runner, source);

    EXPECT_EQ(RunStatus::WalkFailed, outcome.status);
    ASSERT_EQ(1u, runner.nCalls());
    EXPECT_EQ(vector<string>{"one"}, runner.listings[0]);
    EXPECT_EQ(0u, listingDir.countEntries());
    EXPECT_EQ(kExitWalkFailed, exitCodeFor(outcome.status));
}

TEST(RunStatusTest, ExitCodesAreDistinct) {
    EXPECT_EQ(0, exitCodeFor(RunStatus::Success));
    std::set<int> codes = {exitCodeFor(RunStatus::TransferFailed),
                           exitCodeFor(RunStatus::RetriesExhausted),
                           exitCodeFor(RunStatus::ListingFailed),
                           exitCodeFor(RunStatus::WalkFailed), kExitUsage};
    EXPECT_EQ(5u, codes.size());
    // gflags exits with 1 on an unknown flag
    EXPECT_EQ(0u, codes.count(1));
    EXPECT_EQ(0u, codes.count(0));
}

TEST(RunStatusTest, Descriptions) {
    EXPECT_STREQ("exhausted retries", describe(RunStatus::RetriesExhausted));
    EXPECT_STREQ("transfer failed", describe(RunStatus::TransferFailed));
}

}
}
