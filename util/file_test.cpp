#include "util/file.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <iterator>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::StartsWith;

bool IsDirectory(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

class FileTest : public ::testing::Test {
 protected:
  FileTest() : tmp_("/tmp", "runbox-file-test-") {}

  std::string Path(const std::string& name) const {
    return util::File::JoinPath(tmp_.Path(), name);
  }

  void Put(const std::string& name, const std::string& content) {
    std::ofstream out(Path(name), std::ios::binary);
    out << content;
  }

  std::string Get(const std::string& name) {
    std::ifstream in(Path(name), std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  }

  util::TempDir tmp_;
};

TEST_F(FileTest, ListFilesIsRecursiveAndSorted) {
  Put("Main.class", "a");
  Put("Helper.class", "b");
  mkdir(Path("pkg").c_str(), S_IRWXU);
  Put("pkg/Inner.class", "c");
  mkdir(Path("empty").c_str(), S_IRWXU);
  EXPECT_THAT(util::File::ListFiles(tmp_.Path()),
              ElementsAre(Path("Helper.class"), Path("Main.class"),
                          Path("pkg/Inner.class")));
}

TEST_F(FileTest, ListFilesOnlyDirectories) {
  mkdir(Path("a").c_str(), S_IRWXU);
  mkdir(Path("a/b").c_str(), S_IRWXU);
  EXPECT_THAT(util::File::ListFiles(tmp_.Path()), IsEmpty());
}

TEST_F(FileTest, ListFilesMissingDirectory) {
  EXPECT_THROW(util::File::ListFiles(Path("missing/dir")),  // NOLINT
               std::system_error);
}

TEST_F(FileTest, ReadWholeFile) {
  std::string content(util::kChunkSize * 2 + 17, 'j');
  Put("Big.java", content);
  EXPECT_EQ(util::File::Read(Path("Big.java")), content);
}

TEST_F(FileTest, ReadWithLimit) {
  Put("out", std::string(util::kChunkSize + 5, 'o'));
  bool truncated = false;
  EXPECT_EQ(util::File::Read(Path("out"), 10, &truncated), "oooooooooo");
  EXPECT_TRUE(truncated);

  Put("exact", "12345");
  EXPECT_EQ(util::File::Read(Path("exact"), 5, &truncated), "12345");
  EXPECT_FALSE(truncated);
}

TEST_F(FileTest, ReadMissingFile) {
  EXPECT_THROW(util::File::Read(Path("nope")), std::system_error);  // NOLINT
}

TEST_F(FileTest, WriteBinaryIntoNewDirectories) {
  std::string bytes("\xca\xfe\xba\xbe\0\0\0\x34", 8);
  util::File::Write(Path("box/pkg/A.class"), bytes);
  EXPECT_EQ(Get("box/pkg/A.class"), bytes);
}

TEST_F(FileTest, WriteOverwriteModes) {
  Put("file", "original");
  util::File::Write(Path("file"), "ignored");
  EXPECT_EQ(Get("file"), "original");
  util::File::Write(Path("file"), "replaced", /*overwrite=*/true);
  EXPECT_EQ(Get("file"), "replaced");
  EXPECT_THROW(util::File::Write(Path("file"), "x", false, false),  // NOLINT
               std::system_error);
  EXPECT_EQ(Get("file"), "replaced");
}

TEST_F(FileTest, MakeDirs) {
  util::File::MakeDirs(Path("a/b/c"));
  EXPECT_TRUE(IsDirectory(Path("a/b/c")));
}

TEST_F(FileTest, MakeDirsWithoutPermission) {
  if (geteuid() == 0) GTEST_SKIP() << "permissions are not enforced for root";
  mkdir(Path("locked").c_str(), 0);
  EXPECT_THROW(util::File::MakeDirs(Path("locked/a/b")),  // NOLINT
               std::system_error);
  chmod(Path("locked").c_str(), S_IRWXU);
}

TEST_F(FileTest, Remove) {
  Put("file", "bye");
  util::File::Remove(Path("file"));
  EXPECT_FALSE(util::File::Exists(Path("file")));
  EXPECT_THROW(util::File::Remove(Path("file")), std::system_error);  // NOLINT
}

TEST_F(FileTest, RemoveTree) {
  util::File::MakeDirs(Path("tree/a/b"));
  Put("tree/a/b/file", "x");
  Put("tree/file", "y");
  util::File::RemoveTree(Path("tree"));
  EXPECT_FALSE(IsDirectory(Path("tree")));
  EXPECT_TRUE(IsDirectory(tmp_.Path()));
}

TEST_F(FileTest, Size) {
  Put("file", "12345");
  EXPECT_EQ(util::File::Size(Path("file")), 5);
  EXPECT_LT(util::File::Size(Path("nope")), 0);
  EXPECT_TRUE(util::File::Exists(Path("file")));
}

TEST(FilePath, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("/ws/box", "Main.class"),
            "/ws/box/Main.class");
  EXPECT_EQ(util::File::JoinPath("/ws/box", "/abs"), "/abs");
}

TEST(FilePath, BaseDirAndName) {
  EXPECT_EQ(util::File::BaseDir("/ws/box/Main.class"), "/ws/box");
  EXPECT_EQ(util::File::BaseName("/ws/box/Main.class"), "Main.class");
  EXPECT_EQ(util::File::BaseDir("Main.class"), "");
  EXPECT_EQ(util::File::BaseName("Main.class"), "Main.class");
}

TEST_F(FileTest, TempDirRemovedOnDestruction) {
  std::string path;
  {
    util::TempDir dir(tmp_.Path(), "ws-");
    path = dir.Path();
    EXPECT_THAT(util::File::BaseName(path), StartsWith("ws-"));
    util::File::Write(util::File::JoinPath(path, "box/Main.class"), "data");
  }
  EXPECT_FALSE(IsDirectory(path));
}

TEST_F(FileTest, TempDirKeep) {
  std::string path;
  {
    util::TempDir dir(tmp_.Path());
    dir.Keep();
    path = dir.Path();
  }
  EXPECT_TRUE(IsDirectory(path));
}

TEST_F(FileTest, TempDirMovedOwnershipRemovesOnce) {
  std::string path;
  {
    util::TempDir outer(tmp_.Path());
    path = outer.Path();
    {
      util::TempDir inner(std::move(outer));
      EXPECT_EQ(inner.Path(), path);
    }
    EXPECT_FALSE(IsDirectory(path));
  }
}

}  // namespace
