#include <gtest/gtest.h>

#include "MetadataCopier.hpp"
#include "TestUtils.hpp"

class MetadataCopierTest : public TempDirTest {};

TEST_F(MetadataCopierTest, CopiesFileTimes) {
    writeFile(path("src"), "a");
    writeFile(path("dst"), "b");
    setTimes(path("src"), 1600000000, 1300000000);

    MetadataCopier copier;
    MirrorError error;
    MetadataCopier::CreationTime creation = MetadataCopier::CreationTime::Applied;
    ASSERT_TRUE(copier.copyMetadata(path("src"), path("dst"), error, &creation)) << error.describe();

    struct stat dst = statOf(path("dst"));
    EXPECT_EQ(1600000000, dst.st_atim.tv_sec);
    EXPECT_EQ(1300000000, dst.st_mtim.tv_sec);
    // Linux cannot set birth time; not an error
    EXPECT_EQ(MetadataCopier::CreationTime::Unsupported, creation);
}

TEST_F(MetadataCopierTest, CopiesDirectoryTimes) {
    fs::create_directories(path("srcdir"));
    fs::create_directories(path("dstdir"));
    setTimes(path("srcdir"), 1200000000, 1100000000);

    MetadataCopier copier;
    MirrorError error;
    ASSERT_TRUE(copier.copyMetadata(path("srcdir"), path("dstdir"), error));

    struct stat dst = statOf(path("dstdir"));
    EXPECT_EQ(1200000000, dst.st_atim.tv_sec);
    EXPECT_EQ(1100000000, dst.st_mtim.tv_sec);
}

TEST_F(MetadataCopierTest, KeepsNanoseconds) {
    writeFile(path("src"), "a");
    writeFile(path("dst"), "b");
    struct timespec times[2];
    times[0].tv_sec = 1500000000;
    times[0].tv_nsec = 123456789;
    times[1].tv_sec = 1500000001;
    times[1].tv_nsec = 987654321;
    ASSERT_EQ(0, ::utimensat(AT_FDCWD, path("src").c_str(), times, 0));

    MetadataCopier copier;
    MirrorError error;
    ASSERT_TRUE(copier.copyMetadata(path("src"), path("dst"), error));

    struct stat src = statOf(path("src"));
    struct stat dst = statOf(path("dst"));
    EXPECT_EQ(src.st_mtim.tv_sec, dst.st_mtim.tv_sec);
    EXPECT_EQ(src.st_mtim.tv_nsec, dst.st_mtim.tv_nsec);
}

TEST_F(MetadataCopierTest, MissingSourceIsIoError) {
    writeFile(path("dst"), "b");

    MetadataCopier copier;
    MirrorError error;
    EXPECT_FALSE(copier.copyMetadata(path("missing"), path("dst"), error));
    EXPECT_EQ(ErrorKind::Io, error.kind);
}

TEST_F(MetadataCopierTest, MissingDestinationIsIoError) {
    writeFile(path("src"), "a");

    MetadataCopier copier;
    MirrorError error;
    EXPECT_FALSE(copier.copyMetadata(path("src"), path("missing"), error));
    EXPECT_EQ(ErrorKind::Io, error.kind);
}
