#include "core/UploadTarget.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "core/UploadError.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

using chunkdrop::core::ErrorKind;
using chunkdrop::core::UploadError;
using chunkdrop::core::UploadTarget;

TEST(UploadTarget, ResolvesPlainFilenameInsideRoot)
{
    chunkdrop::testing::TempDir root;
    UploadTarget target = UploadTarget::resolve(root.path(), root.path(), "report.pdf");
    EXPECT_EQ(root.path() / "report.pdf", target.path());
    EXPECT_EQ("report.pdf", target.filename());
}

TEST(UploadTarget, RejectsTraversalAndSeparators)
{
    chunkdrop::testing::TempDir root;
    const std::string names[] = {"../escape.txt", "..", ".", "", "a/b", "a\\b", std::string("a\0b", 3)};
    for (const std::string& name : names) {
        try {
            UploadTarget::resolve(root.path(), root.path(), name);
            ADD_FAILURE() << "accepted '" << name << "'";
        } catch (const UploadError& e) {
            EXPECT_EQ(ErrorKind::Validation, e.kind()) << name;
        }
    }
}

TEST(UploadTarget, RejectsOverlongFilename)
{
    chunkdrop::testing::TempDir root;
    EXPECT_THROW(UploadTarget::resolve(root.path(), root.path(), std::string(241, 'a')), UploadError);
    EXPECT_NO_THROW(UploadTarget::resolve(root.path(), root.path(), std::string(240, 'a')));
}

TEST(UploadTarget, DirectoryOutsideRootIsRejected)
{
    chunkdrop::testing::TempDir root;
    fs::create_directories(root.path() / "inner");
    EXPECT_NO_THROW(UploadTarget::resolve(root.path() / "inner", root.path() / "inner", "a.txt"));
    EXPECT_THROW(UploadTarget::resolve(root.path() / "inner", root.path(), "a.txt"), UploadError);
}

TEST(UploadTarget, SymlinkEscapeIsRejected)
{
    chunkdrop::testing::TempDir root;
    chunkdrop::testing::TempDir outside;
    fs::create_directory_symlink(outside.path(), root.path() / "link");

    EXPECT_THROW(UploadTarget::resolve(root.path(), root.path() / "link", "a.txt"), UploadError);
}

TEST(UploadTarget, BaseNameOfBrowserPaths)
{
    EXPECT_EQ("a.txt", UploadTarget::baseName("a.txt"));
    EXPECT_EQ("a.txt", UploadTarget::baseName("C:\\Users\\me\\a.txt"));
    EXPECT_EQ("a.txt", UploadTarget::baseName("/home/me/a.txt"));
    EXPECT_EQ("", UploadTarget::baseName("dir/"));
}

TEST(UploadTarget, TranslatePathStaysUnderRoot)
{
    const fs::path root = "/srv/files";
    EXPECT_EQ(root, UploadTarget::translatePath(root, "/"));
    EXPECT_EQ(root / "docs" / "2024", UploadTarget::translatePath(root, "/docs/2024/"));
    EXPECT_EQ(root / "b", UploadTarget::translatePath(root, "/a/../b"));
    EXPECT_EQ(root / "etc", UploadTarget::translatePath(root, "/../../etc"));
    EXPECT_EQ(root / "x" / "y", UploadTarget::translatePath(root, "//x/./y\\"));
}

TEST(UploadTarget, IsWithin)
{
    chunkdrop::testing::TempDir root;
    EXPECT_TRUE(UploadTarget::isWithin(root.path() / "a" / "b", root.path()));
    EXPECT_TRUE(UploadTarget::isWithin(root.path(), root.path()));
    EXPECT_FALSE(UploadTarget::isWithin(root.path().parent_path(), root.path()));
    EXPECT_FALSE(UploadTarget::isWithin(root.path() / ".." / "other", root.path()));
}
