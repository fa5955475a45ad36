#include <glog/logging.h>
#include <dirent.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include "batchsync.h"

namespace batchsync {

std::unique_ptr<Batch> Batch::create(const string& listingDir) {
    string pattern = (fs::path(listingDir) / "batchsync-listing.XXXXXX").string();
    vector<char> nameBuf(pattern.begin(), pattern.end());
    nameBuf.push_back('\0');
    int fd = mkstemp(nameBuf.data());
    if (fd < 0) {
        LOG(ERROR) << "[Batch::create] failed to create listing file in " << listingDir
                   << ": " << strerror(errno);
        return nullptr;
    }
    FILE* fp = fdopen(fd, "w");
    if (fp == NULL) {
        LOG(ERROR) << "[Batch::create] fdopen failed for " << nameBuf.data()
                   << ": " << strerror(errno);
        close(fd);
        unlink(nameBuf.data());
        return nullptr;
    }
    return std::unique_ptr<Batch>(new Batch(fp, string(nameBuf.data())));
}

Batch::Batch(FILE* listing, const string& listingPath)
    : listingPath(listingPath), listing(listing) {}

Batch::~Batch() {
    if (this->listing != NULL) {
        fclose(this->listing);
        this->listing = NULL;
    }
    if (unlink(this->listingPath.c_str()) != 0 && errno != ENOENT) {
        LOG(WARNING) << "[Batch::~Batch] failed to remove listing " << this->listingPath
                     << ": " << strerror(errno);
    }
}

// Entries are NUL terminated, to be read back with rsync --from0.
bool Batch::append(const SourceEntry& entry) {
    const string& path = entry.relativePath;
    if (fwrite(path.c_str(), 1, path.size() + 1, this->listing) != path.size() + 1) {
        LOG(ERROR) << "[Batch::append] failed writing to listing " << this->listingPath
                   << ": " << strerror(errno);
        return false;
    }
    this->entries.push_back(path);
    this->accumulatedBytes += entry.sizeBytes;
    return true;
}

bool Batch::finalize() {
    if (fflush(this->listing) != 0) {
        LOG(ERROR) << "[Batch::finalize] fflush failed on " << this->listingPath
                   << ": " << strerror(errno);
        return false;
    }
    if (fsync(fileno(this->listing)) != 0) {
        LOG(ERROR) << "[Batch::finalize] fsync failed on " << this->listingPath
                   << ": " << strerror(errno);
        return false;
    }
    return true;
}

bool ExclusionFilter::compile(const string& pattern, ExclusionFilter& filter, string& error) {
    filter = ExclusionFilter();
    if (pattern.empty()) {
        return true;
    }
    try {
        filter.regex = std::regex(pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        error = e.what();
        return false;
    }
    filter.pattern = pattern;
    filter.isActive = true;
    return true;
}

TreeEnumerator::TreeEnumerator(const string& rootDir, const ExclusionFilter& filter)
    : rootDir(rootDir), root(rootDir), filter(filter) {
    // "src/" would otherwise relativize its children to "../x"
    if (this->root.string().size() > 1) {
        this->root.remove_trailing_separator();
    }
}

bool TreeEnumerator::start() {
    this->isStarted = true;
    boost::system::error_code ec;
    this->it = fs::recursive_directory_iterator(this->root,
                                                fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LOG(ERROR) << "[TreeEnumerator::start] cannot open src dir: " << this->rootDir
                   << ": " << ec.message();
        this->isFailed = true;
        return false;
    }
    return true;
}

// The iterator turns into an end iterator when it fails to descend, so a
// directory that vanished or cannot be read is dropped before it gets there.
void TreeEnumerator::skipUnreadableDir(const fs::path& dirPath) {
    if (!this->it.recursion_pending()) {
        return;
    }
    boost::system::error_code ec;
    fs::file_status st = this->it->symlink_status(ec);
    if (ec || st.type() == fs::file_not_found) {
        this->it.disable_recursion_pending();
        return;
    }
    if (!fs::is_directory(st)) {
        return;
    }
    DIR* dir = opendir(dirPath.c_str());
    if (dir != NULL) {
        closedir(dir);
        return;
    }
    if (errno == EACCES) {
        LOG(WARNING) << "[TreeEnumerator::next] skipping unreadable directory " << dirPath;
        this->it.disable_recursion_pending();
    } else if (errno == ENOENT || errno == ENOTDIR) {
        this->it.disable_recursion_pending();
    }
}

bool TreeEnumerator::next(SourceEntry& entry) {
    if (!this->isStarted && !this->start()) {
        return false;
    }
    boost::system::error_code ec;
    const fs::recursive_directory_iterator end;
    while (!this->isFailed && this->it != end) {
        const fs::path currPath = this->it->path();
        skipUnreadableDir(currPath);
        this->it.increment(ec);
        if (ec) {
            LOG(ERROR) << "[TreeEnumerator::next] failed to walk past " << currPath
                       << ": " << ec.message();
            this->isFailed = true;
        }

        string relPath = currPath.lexically_relative(this->root).generic_string();
        if (this->filter.matches(relPath)) {
            continue;
        }
        // vanished or unreadable entries are skipped quietly
        this->nStatted += 1;
        fs::file_status st = fs::status(currPath, ec);
        if (ec || !fs::is_regular_file(st)) {
            continue;
        }
        uint64_t size = fs::file_size(currPath, ec);
        if (ec) {
            continue;
        }

        if (this->isProgress) {
            cout << relPath << endl;
        }
        entry.relativePath = relPath;
        entry.sizeBytes = size;
        return true;
    }
    if (!this->isFailed && !this->isDone) {
        this->isDone = true;
        LOG(INFO) << "[TreeEnumerator::next] walked " << this->rootDir << ", "
                  << this->nStatted << " entries statted";
    }
    return false;
}

}
