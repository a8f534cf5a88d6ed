#include <gtest/gtest.h>

#include "TreeScanner.hpp"
#include "TestUtils.hpp"

class TreeScannerTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        fs::create_directories(path("src"));
        fs::create_directories(path("dst"));
    }

    ScanPlan scan(const std::vector<std::string>& patterns = {}, bool matchAbsolute = false) {
        MirrorError error;
        EXPECT_TRUE(filter_.compile(patterns, error));
        TreeScanner scanner(digest_, filter_, metadataCopier_, matchAbsolute);
        return scanner.scan(fs::canonical(path("src")), fs::canonical(path("dst")));
    }

    DigestProvider digest_{HashAlgorithm::Sha256};
    ExclusionFilter filter_;
    MetadataCopier metadataCopier_;
};

TEST_F(TreeScannerTest, VisitsFilesBeforeSubdirectoriesInNameOrder) {
    writeFile(path("src/b.txt"), "b");
    writeFile(path("src/a.txt"), "a");
    writeFile(path("src/z/1.txt"), "1");
    writeFile(path("src/m/2.txt"), "2");
    writeFile(path("src/m/k/3.txt"), "3");

    ScanPlan plan = scan();
    ASSERT_EQ(5u, plan.files.size());
    fs::path src = fs::canonical(path("src"));
    EXPECT_EQ((src / "a.txt").string(), plan.files[0].source.string());
    EXPECT_EQ((src / "b.txt").string(), plan.files[1].source.string());
    EXPECT_EQ((src / "m/2.txt").string(), plan.files[2].source.string());
    EXPECT_EQ((src / "m/k/3.txt").string(), plan.files[3].source.string());
    EXPECT_EQ((src / "z/1.txt").string(), plan.files[4].source.string());
}

TEST_F(TreeScannerTest, CreatesDestinationDirectoriesIncludingEmptyOnes) {
    writeFile(path("src/a/b/c.txt"), "c");
    fs::create_directories(path("src/empty/inner"));

    ScanPlan plan = scan();
    EXPECT_TRUE(fs::is_directory(path("dst/a/b")));
    EXPECT_TRUE(fs::is_directory(path("dst/empty/inner")));
    EXPECT_EQ(4u, plan.createdDirectories.size());
    // files are only planned, not copied
    EXPECT_FALSE(fs::exists(path("dst/a/b/c.txt")));
}

TEST_F(TreeScannerTest, DecidesCopyUnchangedAndExcluded) {
    writeFile(path("src/new.txt"), "new");
    writeFile(path("src/same.txt"), "same");
    writeFile(path("dst/same.txt"), "same");
    writeFile(path("src/changed.txt"), "v2");
    writeFile(path("dst/changed.txt"), "v1");
    writeFile(path("src/skip.tmp"), "tmp");

    ScanPlan plan = scan({"\\.tmp$"});
    ASSERT_EQ(4u, plan.files.size());
    EXPECT_EQ(FileAction::Copy, plan.files[0].action);       // changed.txt
    EXPECT_EQ("content differs", plan.files[0].reason);
    EXPECT_EQ(FileAction::Copy, plan.files[1].action);       // new.txt
    EXPECT_EQ("new", plan.files[1].reason);
    EXPECT_EQ(FileAction::Unchanged, plan.files[2].action);  // same.txt
    EXPECT_EQ(FileAction::Excluded, plan.files[3].action);   // skip.tmp
}

TEST_F(TreeScannerTest, MatchesRelativePathByDefault) {
    writeFile(path("src/keep/file.txt"), "k");
    writeFile(path("src/logs/file.txt"), "l");

    ScanPlan plan = scan({"^logs/"});
    ASSERT_EQ(2u, plan.files.size());
    EXPECT_EQ(FileAction::Copy, plan.files[0].action);
    EXPECT_EQ(FileAction::Excluded, plan.files[1].action);
}

TEST_F(TreeScannerTest, AbsoluteMatchingSeesTheRootPrefix) {
    writeFile(path("src/logs/file.txt"), "l");

    ScanPlan relativePlan = scan({"^/"});
    ASSERT_EQ(1u, relativePlan.files.size());
    EXPECT_EQ(FileAction::Copy, relativePlan.files[0].action);

    ScanPlan absolutePlan = scan({"^/"}, true);
    ASSERT_EQ(1u, absolutePlan.files.size());
    EXPECT_EQ(FileAction::Excluded, absolutePlan.files[0].action);
}

TEST_F(TreeScannerTest, DestinationFilePathMirrorsSource) {
    writeFile(path("src/x/y/z.bin"), "z");

    ScanPlan plan = scan();
    ASSERT_EQ(1u, plan.files.size());
    EXPECT_EQ((fs::canonical(path("dst")) / "x/y/z.bin").string(), plan.files[0].dest.string());
}

TEST_F(TreeScannerTest, SpecialFileIsReportedAsFailed) {
    writeFile(path("src/regular"), "r");
    ASSERT_EQ(0, ::mkfifo(path("src/pipe").c_str(), 0600));

    ScanPlan plan = scan();
    ASSERT_EQ(2u, plan.files.size());
    EXPECT_EQ(FileAction::Failed, plan.files[0].action);  // pipe
    EXPECT_EQ(FileAction::Copy, plan.files[1].action);    // regular
}

TEST_F(TreeScannerTest, DirectoryLinksAreNotFollowed) {
    writeFile(path("outside/secret.txt"), "s");
    writeFile(path("src/inside.txt"), "i");
    fs::create_directory_symlink(path("outside"), path("src/link"));

    ScanPlan plan = scan();
    ASSERT_EQ(1u, plan.files.size());
    EXPECT_EQ((fs::canonical(path("src")) / "inside.txt").string(), plan.files[0].source.string());
    EXPECT_FALSE(fs::exists(path("dst/link")));
}

TEST_F(TreeScannerTest, UnreadableDestinationIsPlannedForCopy) {
    if (0 == ::geteuid()) {
        GTEST_SKIP() << "root reads files regardless of permissions";
    }
    writeFile(path("src/f.txt"), "same");
    writeFile(path("dst/f.txt"), "same");
    fs::permissions(path("dst/f.txt"), fs::perms::owner_write, fs::perm_options::replace);

    ScanPlan plan = scan();
    fs::permissions(path("dst/f.txt"), fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    ASSERT_EQ(1u, plan.files.size());
    EXPECT_EQ(FileAction::Copy, plan.files[0].action);
    EXPECT_EQ("destination unreadable", plan.files[0].reason);
}
