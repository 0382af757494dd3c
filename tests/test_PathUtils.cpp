#include <gtest/gtest.h>
#include "PathUtils.hpp"

TEST(PathUtilsTest, ParseLocation_HostAndPath) {
    auto Location = PathUtils::ParseLocation("backup@nas:/srv/data");
    ASSERT_TRUE(Location.has_value());
    EXPECT_EQ(Location->Host, "backup@nas");
    EXPECT_EQ(Location->Path, "/srv/data");
}

TEST(PathUtilsTest, ParseLocation_LocalPaths) {
    EXPECT_FALSE(PathUtils::ParseLocation("/home/user/docs").has_value());
    EXPECT_FALSE(PathUtils::ParseLocation("./dir/with:colon").has_value());
    EXPECT_FALSE(PathUtils::ParseLocation(":/path").has_value());
    EXPECT_FALSE(PathUtils::ParseLocation("host:").has_value());
}

// A relative local path containing a colon is read as remote; no escape exists
TEST(PathUtilsTest, ParseLocation_ColonAmbiguity) {
    auto Location = PathUtils::ParseLocation("notes:2024");
    ASSERT_TRUE(Location.has_value());
    EXPECT_EQ(Location->Host, "notes");
}

TEST(PathUtilsTest, ShellQuote_EscapesSingleQuotes) {
    EXPECT_EQ(PathUtils::ShellQuote("plain"), "'plain'");
    EXPECT_EQ(PathUtils::ShellQuote("it's here"), "'it'\\''s here'");
    EXPECT_EQ(PathUtils::ShellQuote("$HOME `x`"), "'$HOME `x`'");
}

TEST(PathUtilsTest, RemotePathHelpers) {
    EXPECT_EQ(PathUtils::JoinRemote("/srv/", "a/b.txt"), "/srv/a/b.txt");
    EXPECT_EQ(PathUtils::JoinRemote("/", "a.txt"), "/a.txt");
    EXPECT_EQ(PathUtils::RemoteParent("/srv/a/b.txt"), "/srv/a");
    EXPECT_EQ(PathUtils::RemoteParent("/b.txt"), "/");
    EXPECT_EQ(PathUtils::RemoteFileName("/srv/photos/"), "photos");
    EXPECT_EQ(PathUtils::TrimTrailingSlashes("/srv///"), "/srv");
    EXPECT_EQ(PathUtils::TrimTrailingSlashes("/"), "/");
}

TEST(PathUtilsTest, RemoveSpacesFromComponents) {
    EXPECT_EQ(PathUtils::RemoveSpacesFromComponents("my docs/a file.txt"), "mydocs/afile.txt");
    EXPECT_EQ(PathUtils::RemoveSpacesFromComponents("plain.txt"), "plain.txt");
}

TEST(PathUtilsTest, NumberedName) {
    EXPECT_EQ(PathUtils::NumberedName("hello.txt", 1), "hello (1).txt");
    EXPECT_EQ(PathUtils::NumberedName("Makefile", 1), "Makefile (1)");
    EXPECT_EQ(PathUtils::NumberedName("archive.tar.gz", 3), "archive.tar (3).gz");
}

TEST(PathUtilsTest, ShortenFileNameKeepsExtension) {
    EXPECT_EQ(PathUtils::ShortenFileName("short.txt", 255), "short.txt");

    std::string Long = std::string(300, 'a') + ".txt";
    std::string Shortened = PathUtils::ShortenFileName(Long, 100);
    EXPECT_EQ(Shortened.size(), 100u);
    EXPECT_EQ(Shortened.substr(96), ".txt");
}

TEST(PathUtilsTest, PartialNamesStayHiddenAndBounded) {
    EXPECT_EQ(PathUtils::PartialFileName("a.txt"), ".a.txt.shuttlecopy-part");
    EXPECT_LE(PathUtils::PartialFileName(std::string(255, 'x')).size(), PathUtils::MAX_FILE_NAME_BYTES);
    EXPECT_EQ(PathUtils::RemotePartialPath("/srv/a.txt"), "/srv/.a.txt.shuttlecopy-part");
    EXPECT_EQ(PathUtils::RemotePartialPath("/a.txt"), "/.a.txt.shuttlecopy-part");
}

TEST(PathUtilsTest, SameRemotePath) {
    EXPECT_TRUE(PathUtils::SameRemotePath("/srv/data/a.txt", "/srv//data/./a.txt"));
    EXPECT_TRUE(PathUtils::SameRemotePath("/srv/data/", "/srv/data"));
    EXPECT_FALSE(PathUtils::SameRemotePath("/srv/data/a.txt", "/srv/data/b.txt"));
}
