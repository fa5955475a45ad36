#pragma once

#include <glog/logging.h>
#include <stdint.h>
#include <stdio.h>
#include <iostream>
#include <memory>
#include <regex>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

using std::string;
using std::vector;
using std::cout;
using std::endl;
namespace fs = boost::filesystem;

namespace batchsync {

const uint64_t MB = (1 << 20); // 1 MB

// Fails on zero and on values whose byte count does not fit in 64 bits.
inline bool megabytesToBytes(uint64_t megabytes, uint64_t& bytes) {
    if (megabytes == 0 || megabytes > UINT64_MAX / MB) {
        return false;
    }
    bytes = megabytes * MB;
    return true;
}

struct RunParam {
    uint64_t runSizeBytes;
    string listingDir;
};

// One regular file found under the source root.
struct SourceEntry {
    string relativePath;
    uint64_t sizeBytes;
};

/**
 * A group of source-relative paths handed to one transfer invocation.
 * The paths are written to a temporary listing file as they are appended;
 * the listing is unlinked when the Batch is destroyed.
 */
class Batch {

public:
    vector<string> entries;
    uint64_t accumulatedBytes = 0;
    string listingPath;

    // Returns nullptr (and logs) if the listing file cannot be created.
    static std::unique_ptr<Batch> create(const string& listingDir);

    ~Batch();

    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;

    bool append(const SourceEntry& entry);
    bool finalize();

    bool empty() const { return entries.empty(); }

private:
    Batch(FILE* listing, const string& listingPath);

    FILE* listing;
};

/**
 * Optional regex tested against paths relative to the source root.
 * Search semantics (unanchored), case-sensitive, ECMAScript grammar.
 */
class ExclusionFilter {

public:
    ExclusionFilter() {}

    // Fills `error` and returns false when the pattern does not compile.
    static bool compile(const string& pattern, ExclusionFilter& filter, string& error);

    bool matches(const string& relativePath) const {
        return this->isActive && std::regex_search(relativePath, this->regex);
    }

    string pattern;
    bool isActive = false;

private:
    std::regex regex;
};

// Pull-style sequence of entries. next() returns false once exhausted.
class EntrySource {

public:
    virtual ~EntrySource() {}
    virtual bool next(SourceEntry& entry) = 0;
    virtual bool failed() const { return false; }
};

/**
 * Streams the regular files below `root`, one entry per next() call.
 * The walk happens lazily and can be consumed only once.
 */
class TreeEnumerator : public EntrySource {

public:
    string rootDir;
    bool isProgress = false;
    uint64_t nStatted = 0;   // entries whose metadata was read

    TreeEnumerator(const string& rootDir, const ExclusionFilter& filter);
    ~TreeEnumerator() {}

    bool next(SourceEntry& entry) override;
    bool failed() const override { return this->isFailed; }

private:
    bool start();
    void skipUnreadableDir(const fs::path& dirPath);

    fs::path root;
    ExclusionFilter filter;
    fs::recursive_directory_iterator it;
    bool isStarted = false;
    bool isFailed = false;
    bool isDone = false;
};

struct AppendResult {
    bool ok;
    bool flushNeeded;
};

class BatchBuilder {

public:
    uint64_t runSizeBytes;

    explicit BatchBuilder(uint64_t runSizeBytes) : runSizeBytes(runSizeBytes) {}

    // The entry always lands in `batch`; the threshold is checked afterwards.
    AppendResult append(Batch& batch, const SourceEntry& entry) {
        if (!batch.append(entry)) {
            return AppendResult{false, false};
        }
        return AppendResult{true, batch.accumulatedBytes >= this->runSizeBytes};
    }
};

}
