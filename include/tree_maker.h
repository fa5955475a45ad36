#pragma once

#include <glog/logging.h>
#include <stdint.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <map>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>

#include "batchsync.h"

using std::map;

namespace batchsync {

/**
 * Builds source trees of sparse files for rehearsal runs and tests.
 * Every layout is created below `dataDir/<layout name>/`.
 */
class TreeMaker {

public:
    uint64_t KB = (1 << 10); // 1 KB
    uint64_t GB = (1 << 30); // 1 GB
    string dataDir;
    bool isVerbose = false;

    TreeMaker() {}
    explicit TreeMaker(const string& dataDir) : dataDir(dataDir) {}
    ~TreeMaker() {}

    string CreateWideSmallFiles();
    string CreateWideLargeFiles();
    string CreateDeepTree();
    string CreateHybrid();

    // Returns the root of `layout`, created empty.
    string createRoot(const string& layout);

    void createFilesAndDirs(const string& pathStr, const map<string, uint64_t>& fileStrToSizeList,
                            const vector<string>& dirStrList) {
        for (const string& dirStr : dirStrList) {
            createDirectory(pathStr + dirStr);
        }
        for (const auto& fileStrToSize : fileStrToSizeList) {
            createFileBySize(pathStr + fileStrToSize.first, fileStrToSize.second);
        }
    }

    void createFileBySize(const string& pathStr, const uint64_t filesize) {
        struct stat pathStat;
        if (stat(pathStr.c_str(), &pathStat) == 0 && !S_ISREG(pathStat.st_mode)) {
            LOG(FATAL) << "[TreeMaker::createFileBySize] not a regular file: " << pathStr;
        }
        FILE *fp = fopen(pathStr.c_str(), "w");
        if (fp == NULL) {
            LOG(FATAL) << "[TreeMaker::createFileBySize] Failed to open file: " << pathStr;
        }
        fclose(fp);
        // sparse, so large layouts cost no disk
        boost::system::error_code ec;
        fs::resize_file(fs::path(pathStr), filesize, ec);
        if (ec) {
            LOG(FATAL) << "[TreeMaker::createFileBySize] Failed to resize " << pathStr
                       << ": " << ec.message();
        }
    }

    void createDirectory(const string& pathStr) {
        struct stat pathStat;
        if (stat(pathStr.c_str(), &pathStat) == 0) {
            if (!S_ISDIR(pathStat.st_mode)) {
                LOG(FATAL) << "[TreeMaker::createDirectory] You cannot override a file by a directory!";
            }
            return;
        }
        boost::system::error_code ec;
        fs::create_directories(fs::path(pathStr), ec);
        if (ec) {
            LOG(FATAL) << "[TreeMaker::createDirectory] Failed to create directory: " << pathStr;
        }
    }

private:
    void createLayer(const string& rootStr, size_t nDirs, size_t nFiles, uint64_t filesize);
};

}
