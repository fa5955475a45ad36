#pragma once

#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

#include "batchsync.h"
#include "transfer.h"
#include "tree_maker.h"

namespace batchsync {
namespace test {

// Fresh directory under the system temp dir, removed with the object.
class ScratchDir {

public:
    fs::path path;

    ScratchDir() {
        path = fs::temp_directory_path() / fs::unique_path("batchsync-test-%%%%-%%%%-%%%%");
        fs::create_directories(path);
    }

    ~ScratchDir() {
        boost::system::error_code ec;
        fs::remove_all(path, ec);
    }

    string str() const { return path.string(); }

    size_t countEntries() const {
        return std::distance(fs::directory_iterator(path), fs::directory_iterator());
    }
};

inline vector<string> readListing(const string& listingPath) {
    std::ifstream in(listingPath, std::ios::binary);
    string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    vector<string> entries;
    string curr;
    for (char c : contents) {
        if (c == '\0') {
            entries.push_back(curr);
            curr.clear();
        } else {
            curr += c;
        }
    }
    return entries;
}

/**
 * Returns scripted exit statuses in order (0 once the script runs out) and
 * captures the listing each invocation was given.
 */
class FakeRunner : public CommandRunner {

public:
    vector<int> script;
    vector<vector<string>> commands;
    vector<vector<string>> listings;

    FakeRunner() {}
    explicit FakeRunner(const vector<int>& script) : script(script) {}

    int run(const vector<string>& argv) override {
        commands.push_back(argv);
        const string prefix = "--files-from=";
        for (const string& arg : argv) {
            if (arg.compare(0, prefix.size(), prefix) == 0) {
                listings.push_back(readListing(arg.substr(prefix.size())));
            }
        }
        size_t idx = commands.size() - 1;
        return idx < script.size() ? script[idx] : 0;
    }

    size_t nCalls() const { return commands.size(); }
};

// Deterministic entry order for partition tests.
class VectorSource : public EntrySource {

public:
    vector<SourceEntry> entries;
    size_t nPulled = 0;

    explicit VectorSource(const vector<SourceEntry>& entries) : entries(entries) {}

    bool next(SourceEntry& entry) override {
        if (nPulled >= entries.size()) {
            return false;
        }
        entry = entries[nPulled++];
        return true;
    }
};

}
}
