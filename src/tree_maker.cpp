#include "tree_maker.h"

namespace batchsync {

string TreeMaker::createRoot(const string& layout) {
    string rootStr = (fs::path(this->dataDir) / layout).string() + "/";
    boost::system::error_code ec;
    fs::remove_all(fs::path(rootStr), ec);
    if (ec) {
        LOG(FATAL) << "[TreeMaker::createRoot] Failed to clear " << rootStr << ": " << ec.message();
    }
    createDirectory(rootStr);
    if (this->isVerbose) {
        cout << "[TreeMaker::createRoot] " << rootStr << endl;
    }
    return rootStr;
}

// nDirs subdirectories below rootStr, each holding nFiles files of filesize
void TreeMaker::createLayer(const string& rootStr, size_t nDirs, size_t nFiles, uint64_t filesize) {
    for (size_t dirIdx = 0; dirIdx < nDirs; ++dirIdx) {
        string currRelDir = std::to_string(dirIdx) + "/";
        map<string, uint64_t> fileStrToSizeList;
        for (size_t fileIdx = 0; fileIdx < nFiles; ++fileIdx) {
            fileStrToSizeList[currRelDir + std::to_string(fileIdx) + ".dat"] = filesize;
        }
        createFilesAndDirs(rootStr, fileStrToSizeList, {currRelDir});
    }
}

string TreeMaker::CreateWideSmallFiles() {
    string root = createRoot("WideSmallFiles");
    map<string, uint64_t> fileStrToSizeList;
    for (size_t fileIdx = 0; fileIdx < 10; ++fileIdx) {
        fileStrToSizeList[std::to_string(fileIdx) + ".dat"] = 8 * KB;
    }
    createFilesAndDirs(root, fileStrToSizeList, {});
    createLayer(root, 100, 50, 4 * KB);
    return root;
}

string TreeMaker::CreateWideLargeFiles() {
    string root = createRoot("WideLargeFiles");
    map<string, uint64_t> fileStrToSizeList;
    for (size_t fileIdx = 0; fileIdx < 5; ++fileIdx) {
        fileStrToSizeList[std::to_string(fileIdx) + ".dat"] = GB;
    }
    createFilesAndDirs(root, fileStrToSizeList, {});
    createLayer(root, 10, 10, 10 * MB);
    return root;
}

string TreeMaker::CreateDeepTree() {
    string root = createRoot("DeepTree");
    string currDir = root;
    for (size_t depth = 0; depth < 32; ++depth) {
        currDir += std::to_string(depth) + "/";
        map<string, uint64_t> fileStrToSizeList;
        fileStrToSizeList["a.dat"] = 2 * MB;
        fileStrToSizeList["b.dat"] = 64 * KB;
        createFilesAndDirs(currDir, fileStrToSizeList, {""});
    }
    return root;
}

string TreeMaker::CreateHybrid() {
    string root = createRoot("Hybrid");
    map<string, uint64_t> fileStrToSizeList;
    for (size_t fileIdx = 0; fileIdx < 10; ++fileIdx) {
        fileStrToSizeList[std::to_string(fileIdx) + ".dat"] = 8 * KB;
    }
    for (size_t fileIdx = 10; fileIdx < 15; ++fileIdx) {
        fileStrToSizeList[std::to_string(fileIdx) + ".dat"] = 200 * MB;
    }
    createFilesAndDirs(root, fileStrToSizeList, {});
    createLayer(root, 10, 10, KB);
    return root;
}

}
