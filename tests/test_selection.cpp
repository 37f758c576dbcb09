#include <gtest/gtest.h>
#include <sync/selection.hpp>
#include "local_store.hpp"
#include <algorithm>
#include <sstream>

class SelectionTest : public ::testing::Test {
protected:
    fs::path scratch;
    fs::path remote_root;   // backing dir of the fake server
    LocalStoreCalls calls;
    std::unique_ptr<LocalDirStore> store;
    std::ostringstream log_out;
    RunLog log{log_out};
    SyncSettings settings;

    void SetUp() override {
        scratch = make_scratch_dir(std::string("selection_") +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        remote_root = scratch / "remote";
        fs::create_directories(remote_root);
        store = std::make_unique<LocalDirStore>(remote_root, calls);
        settings.target_dir = "/out";
    }

    void TearDown() override {
        fs::remove_all(scratch);
    }

    void remote_file(const std::string& path, const std::string& content = "x") {
        write_file(remote_root / path.substr(1), content);
    }

    std::vector<std::string> remote_paths(const std::vector<Transfer>& transfers) {
        std::vector<std::string> out;
        for (const auto& t : transfers) out.push_back(t.remote_path);
        return out;
    }
};

TEST_F(SelectionTest, PatternFilteredMatchesNamesAtEveryDepth) {
    remote_file("/a/foo.csv");
    remote_file("/a/bar.csv");
    remote_file("/a/sub/foo2.csv");
    settings.mode = SelectionMode::PATTERN_FILTERED;
    settings.path_prefix = "/a";
    settings.tables = {"foo"};

    Selector selector(settings, *store, log);
    auto paths = remote_paths(selector.collect());

    EXPECT_EQ(paths, (std::vector<std::string>{"/a/foo.csv", "/a/sub/foo2.csv"}));
}

TEST_F(SelectionTest, PatternFilteredMatchingDirectoryCollectsOnce) {
    remote_file("/a/foo_dir/foo1.csv");
    remote_file("/a/foo_dir/other.csv");
    remote_file("/a/foo_dir/deeper/x.csv");
    remote_file("/a/zzz.csv");
    settings.mode = SelectionMode::PATTERN_FILTERED;
    settings.path_prefix = "/a";
    settings.tables = {"foo", "x"};

    Selector selector(settings, *store, log);
    auto paths = remote_paths(selector.collect());

    // foo1.csv matches by its own name and by its directory; x.csv likewise
    EXPECT_EQ(paths, (std::vector<std::string>{
        "/a/foo_dir/deeper/x.csv", "/a/foo_dir/foo1.csv", "/a/foo_dir/other.csv"}));
}

TEST_F(SelectionTest, PatternFilteredPreservesRelativeLayout) {
    remote_file("/a/sub/foo2.csv");
    settings.mode = SelectionMode::PATTERN_FILTERED;
    settings.path_prefix = "/a";
    settings.tables = {"foo"};

    Selector selector(settings, *store, log);
    auto transfers = selector.collect();
    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_EQ(transfers[0].local_path, fs::path("/out/sub/foo2.csv"));
}

TEST_F(SelectionTest, FlatFlattensAndCollides) {
    settings.mode = SelectionMode::FLAT;
    settings.files = {"/x/1.csv", "/y/1.csv"};

    Selector selector(settings, *store, log);
    auto transfers = selector.collect();

    ASSERT_EQ(transfers.size(), 2u);
    EXPECT_EQ(transfers[0].local_path, fs::path("/out/1.csv"));
    EXPECT_EQ(transfers[1].local_path, fs::path("/out/1.csv"));
    EXPECT_EQ(transfers[1].remote_path, "/y/1.csv");
    EXPECT_TRUE(calls.gets.empty());  // selection alone never fetches
}

TEST_F(SelectionTest, RecursiveCloneIsRelativeToRoot) {
    remote_file("/data/exports/a.csv");
    remote_file("/data/exports/2024/b.csv");
    settings.mode = SelectionMode::RECURSIVE_CLONE;
    settings.path_prefix = "/data/exports";

    Selector selector(settings, *store, log);
    auto transfers = selector.collect();

    ASSERT_EQ(transfers.size(), 2u);
    EXPECT_EQ(transfers[0].remote_path, "/data/exports/2024/b.csv");
    EXPECT_EQ(transfers[0].local_path, fs::path("/out/2024/b.csv"));
    EXPECT_EQ(transfers[1].local_path, fs::path("/out/a.csv"));
    EXPECT_EQ(selector.local_root(), fs::path("/out"));
}

TEST_F(SelectionTest, MirrorRecreatesRemotePath) {
    remote_file("/data/exports/2024/b.csv");
    settings.mode = SelectionMode::MIRROR;
    settings.path_prefix = "/data/exports";

    Selector selector(settings, *store, log);
    auto transfers = selector.collect();

    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_EQ(transfers[0].local_path, fs::path("/out/data/exports/2024/b.csv"));
    EXPECT_EQ(selector.local_root(), fs::path("/out/data/exports"));
}

TEST_F(SelectionTest, ExactDirectorySkipsSubdirectories) {
    remote_file("/d/top.csv");
    remote_file("/d/nested/inner.csv");
    settings.mode = SelectionMode::EXACT_DIRECTORY;
    settings.path_prefix = "/d";

    Selector selector(settings, *store, log);
    auto paths = remote_paths(selector.collect());

    EXPECT_EQ(paths, (std::vector<std::string>{"/d/top.csv"}));
}

TEST_F(SelectionTest, MissingRootIsFatal) {
    settings.mode = SelectionMode::RECURSIVE_CLONE;
    settings.path_prefix = "/nowhere";

    Selector selector(settings, *store, log);
    EXPECT_THROW(selector.collect(), TransportError);
}

TEST_F(SelectionTest, VisitorRunsAsEntriesAreFound) {
    remote_file("/r/a.csv");
    remote_file("/r/b.csv");
    settings.mode = SelectionMode::EXACT_DIRECTORY;
    settings.path_prefix = "/r";

    Selector selector(settings, *store, log);
    int seen = 0;
    EXPECT_THROW(selector.select([&](const Transfer&) {
        if (++seen == 1) throw TransportError("download failed");
    }), TransportError);
    EXPECT_EQ(seen, 1);
}
