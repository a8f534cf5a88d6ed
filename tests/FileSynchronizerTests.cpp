#include <gtest/gtest.h>

#include "FileSynchronizer.hpp"
#include "TestUtils.hpp"

class FileSynchronizerTest : public TempDirTest {
protected:
    MetadataCopier metadataCopier_;
};

TEST_F(FileSynchronizerTest, CopiesContentInSmallBlocks) {
    std::string content;
    for (int i = 0; i < 1000; ++i) {
        content += std::to_string(i) + ",";
    }
    writeFile(path("src/data.csv"), content);
    fs::create_directories(path("dst"));

    FileSynchronizer synchronizer(metadataCopier_, 7);
    MirrorError error;
    ASSERT_TRUE(synchronizer.copyFile(path("src/data.csv"), path("dst/data.csv"), error)) << error.describe();
    EXPECT_EQ(content, readFile(path("dst/data.csv")));
    EXPECT_EQ(7u, synchronizer.blockSize());
}

TEST_F(FileSynchronizerTest, BlockLargerThanFile) {
    writeFile(path("src/tiny"), "xy");
    fs::create_directories(path("dst"));

    FileSynchronizer synchronizer(metadataCopier_, 1 << 20);
    MirrorError error;
    ASSERT_TRUE(synchronizer.copyFile(path("src/tiny"), path("dst/tiny"), error));
    EXPECT_EQ("xy", readFile(path("dst/tiny")));
}

TEST_F(FileSynchronizerTest, TruncatesLongerDestination) {
    writeFile(path("src/f"), "short");
    writeFile(path("dst/f"), "a much longer stale destination content");

    FileSynchronizer synchronizer(metadataCopier_);
    MirrorError error;
    ASSERT_TRUE(synchronizer.copyFile(path("src/f"), path("dst/f"), error));
    EXPECT_EQ("short", readFile(path("dst/f")));
}

TEST_F(FileSynchronizerTest, CopiesEmptyFile) {
    writeFile(path("src/empty"), "");
    writeFile(path("dst/empty"), "old");

    FileSynchronizer synchronizer(metadataCopier_);
    MirrorError error;
    ASSERT_TRUE(synchronizer.copyFile(path("src/empty"), path("dst/empty"), error));
    EXPECT_TRUE(readFile(path("dst/empty")).empty());
}

TEST_F(FileSynchronizerTest, CopiesModificationTime) {
    writeFile(path("src/f"), "content");
    setTimes(path("src/f"), 1500000000, 1400000000);
    fs::create_directories(path("dst"));

    FileSynchronizer synchronizer(metadataCopier_);
    MirrorError error;
    ASSERT_TRUE(synchronizer.copyFile(path("src/f"), path("dst/f"), error));

    struct stat src = statOf(path("src/f"));
    struct stat dst = statOf(path("dst/f"));
    EXPECT_EQ(1400000000, dst.st_mtim.tv_sec);
    EXPECT_EQ(src.st_mtim.tv_sec, dst.st_mtim.tv_sec);
    EXPECT_EQ(src.st_mtim.tv_nsec, dst.st_mtim.tv_nsec);
    EXPECT_EQ(src.st_atim.tv_sec, dst.st_atim.tv_sec);
}

TEST_F(FileSynchronizerTest, MissingSourceIsIoError) {
    fs::create_directories(path("dst"));

    FileSynchronizer synchronizer(metadataCopier_);
    MirrorError error;
    EXPECT_FALSE(synchronizer.copyFile(path("src/missing"), path("dst/missing"), error));
    EXPECT_EQ(ErrorKind::Io, error.kind);
    EXPECT_FALSE(fs::exists(path("dst/missing")));
}

TEST_F(FileSynchronizerTest, MissingDestinationDirectoryIsIoError) {
    writeFile(path("src/f"), "content");

    FileSynchronizer synchronizer(metadataCopier_);
    MirrorError error;
    EXPECT_FALSE(synchronizer.copyFile(path("src/f"), path("nowhere/f"), error));
    EXPECT_EQ(ErrorKind::Io, error.kind);
}
