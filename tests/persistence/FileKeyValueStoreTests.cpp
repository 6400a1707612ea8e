// Repository: Intermission
// Component: File key-value store unit tests

#include <gtest/gtest.h>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

#include "intermission/persistence/FileKeyValueStore.hpp"

namespace intermission::persistence {
namespace {

std::string MakeTempRoot() {
  std::string root = "/tmp/intermission_kv_store_test_" + std::to_string(getpid());
  if (mkdir(root.c_str(), 0755) != 0 && errno != EEXIST) {
    root = "/tmp";  // fallback
  }
  return root;
}

std::string FreshPath(const std::string& name) {
  const std::string path = MakeTempRoot() + "/" + name;
  std::remove(path.c_str());
  return path;
}

std::string ReadAll(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// -----------------------------------------------------------------------------
// Missing file is an empty store; first write creates it
// -----------------------------------------------------------------------------
TEST(FileKeyValueStoreTest, MissingFileIsEmpty) {
  const std::string path = FreshPath("missing.kv");
  FileKeyValueStore store(path);
  EXPECT_EQ(store.size(), 0u);
  EXPECT_FALSE(store.GetInt("manualTriggerCounter").has_value());

  EXPECT_TRUE(store.SetInt("manualTriggerCounter", 3));
  EXPECT_EQ(ReadAll(path), "manualTriggerCounter=3\n");
}

// -----------------------------------------------------------------------------
// Values survive reopening; no temporary file is left behind
// -----------------------------------------------------------------------------
TEST(FileKeyValueStoreTest, ValuesSurviveReopen) {
  const std::string path = FreshPath("reopen.kv");
  {
    FileKeyValueStore store(path);
    ASSERT_TRUE(store.SetInt("b", 2));
    ASSERT_TRUE(store.SetInt("a", -1));
    ASSERT_TRUE(store.SetInt("b", 9));
  }
  FileKeyValueStore reopened(path);
  EXPECT_EQ(reopened.size(), 2u);
  EXPECT_EQ(reopened.GetInt("a").value(), -1);
  EXPECT_EQ(reopened.GetInt("b").value(), 9);

  const std::string tmp = path + ".tmp." + std::to_string(getpid());
  struct stat st;
  EXPECT_NE(stat(tmp.c_str(), &st), 0);
}

TEST(FileKeyValueStoreTest, MalformedLinesAreSkipped) {
  const std::string path = FreshPath("malformed.kv");
  {
    std::ofstream out(path);
    out << "# comment\n"
        << "\n"
        << "good = 12\n"
        << "no_equals_sign\n"
        << "=5\n"
        << "bad=12abc\n"
        << "huge=99999999999999999999999\n";
  }
  FileKeyValueStore store(path);
  EXPECT_EQ(store.GetInt("good").value(), 12);
  EXPECT_FALSE(store.GetInt("bad").has_value());
  EXPECT_FALSE(store.GetInt("huge").has_value());
  EXPECT_EQ(store.skipped_line_count(), 4u);
}

TEST(FileKeyValueStoreTest, UnwritableDirectoryReportsFailure) {
  FileKeyValueStore store("/nonexistent_intermission_dir/store.kv");
  EXPECT_FALSE(store.SetInt("k", 1));
  // The in-memory value is kept.
  EXPECT_EQ(store.GetInt("k").value(), 1);
}

}  // namespace
}  // namespace intermission::persistence
