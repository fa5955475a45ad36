#include <gflags/gflags.h>
#include <glog/logging.h>

#include "tree_maker.h"

DEFINE_string(data_dir, "/tmp/batchsync-data", "\ndirectory the layouts are created in\n");
DEFINE_string(layout, "hybrid", "\nwide_small | wide_large | deep | hybrid\n");

using namespace batchsync;

int main(int argc, char **argv) {
    google::InitGoogleLogging(argv[0]);
    google::ParseCommandLineFlags(&argc, &argv, true);

    TreeMaker maker(FLAGS_data_dir);
    maker.isVerbose = true;
    maker.createDirectory(FLAGS_data_dir);

    string root;
    if (FLAGS_layout == "wide_small") {
        root = maker.CreateWideSmallFiles();
    } else if (FLAGS_layout == "wide_large") {
        root = maker.CreateWideLargeFiles();
    } else if (FLAGS_layout == "deep") {
        root = maker.CreateDeepTree();
    } else if (FLAGS_layout == "hybrid") {
        root = maker.CreateHybrid();
    } else {
        LOG(ERROR) << "unknown layout: " << FLAGS_layout;
        return 64;
    }
    cout << root << endl;
    return 0;
}
