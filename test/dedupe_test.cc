#include "dedupe.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "tmp_tree.hh"

namespace dupsweep::test {

namespace fs = std::filesystem;

class dedupe_test : public tmp_tree_t {
 protected:
  options_t _opts;
  std::ostringstream _log_stream;

  void SetUp() override {
    tmp_tree_t::SetUp();
    _opts.search_dir = {_root};
    _opts.order = walk_order_t::name;
  }
};

TEST_F(dedupe_test, TwoIdenticalFiles) {
  auto a = write("a.txt", "hello");
  auto b = write("b.txt", "hello");

  auto report = dedupe(_opts, _log_stream);

  ASSERT_EQ(report.dupe_list.size(), 1U);
  EXPECT_EQ(report.dupe_list[0].survivor, a);
  EXPECT_EQ(report.dupe_list[0].removed, (path_vec{b}));
  EXPECT_EQ(report.freed, (stats_t{1, 5}));
  // dry run
  EXPECT_TRUE(fs::exists(b));

  _opts.rm_meth = rm_t::remove;
  report = dedupe(_opts, _log_stream);

  ASSERT_EQ(report.dupe_list.size(), 1U);
  EXPECT_EQ(report.freed, (stats_t{1, 5}));
  EXPECT_TRUE(fs::exists(a));
  EXPECT_FALSE(fs::exists(b));
}

TEST_F(dedupe_test, SameSizeDifferentContent) {
  auto a = write("a.txt", "hello");
  auto b = write("b.txt", "world");
  _opts.rm_meth = rm_t::remove;

  auto report = dedupe(_opts, _log_stream);

  EXPECT_EQ(report.by_size, (stats_t{2, 10}));
  EXPECT_EQ(report.by_first, (stats_t{2, 10}));
  EXPECT_TRUE(report.dupe_list.empty());
  EXPECT_EQ(report.freed, (stats_t{0, 0}));
  EXPECT_TRUE(fs::exists(a));
  EXPECT_TRUE(fs::exists(b));
  EXPECT_TRUE(_log_stream.str().empty());
}

TEST_F(dedupe_test, ThreeCopiesWithThresholdThree) {
  write("a.txt", "abcdef");
  write("b.txt", "abcdef");
  write("c.txt", "abcdef");
  _opts.min_cnt = 3;
  _opts.rm_meth = rm_t::remove;

  auto report = dedupe(_opts, _log_stream);

  ASSERT_EQ(report.dupe_list.size(), 1U);
  EXPECT_EQ(report.dupe_list[0].removed.size(), 2U);
  EXPECT_EQ(report.freed, (stats_t{2, 12}));
  EXPECT_TRUE(fs::exists(_root / "a.txt"));
  EXPECT_FALSE(fs::exists(_root / "b.txt"));
  EXPECT_FALSE(fs::exists(_root / "c.txt"));
}

TEST_F(dedupe_test, GroupBelowThresholdIsKept) {
  write("a.txt", "abcdef");
  write("b.txt", "abcdef");
  write("c.txt", "uvwxyz");
  _opts.min_cnt = 3;
  _opts.rm_meth = rm_t::remove;

  auto report = dedupe(_opts, _log_stream);

  EXPECT_TRUE(report.dupe_list.empty());
  EXPECT_TRUE(fs::exists(_root / "b.txt"));
}

TEST_F(dedupe_test, EmptyFilesNeverReported) {
  write("empty1", "");
  write("empty2", "");
  write("a.txt", "hello");
  write("b.txt", "hello");

  auto report = dedupe(_opts, _log_stream);

  ASSERT_EQ(report.dupe_list.size(), 1U);
  const auto &group = report.dupe_list[0];
  EXPECT_EQ(group.survivor, _root / "a.txt");
  for (const auto &file : group.removed) {
    EXPECT_NE(file.filename(), "empty1");
    EXPECT_NE(file.filename(), "empty2");
  }
}

TEST_F(dedupe_test, HardLinksAreNotDuplicates) {
  auto a = write("a.txt", "hello");
  fs::create_hard_link(a, _root / "b.txt");
  _opts.rm_meth = rm_t::remove;

  auto report = dedupe(_opts, _log_stream);

  EXPECT_TRUE(report.dupe_list.empty());
  EXPECT_TRUE(fs::exists(_root / "b.txt"));
}

TEST_F(dedupe_test, PartialPassesNarrowLargeFiles) {
  const std::string body(64, 'x');
  write("a.bin", "A" + body + "Z");
  write("b.bin", "A" + body + "Z");
  write("c.bin", "A" + body + "Y");
  write("d.bin", "B" + body + "Z");
  _opts.scan_sz = 8;

  auto report = dedupe(_opts, _log_stream);

  EXPECT_EQ(report.by_size.file_cnt, 4U);
  EXPECT_EQ(report.by_last.file_cnt, 3U);
  EXPECT_EQ(report.by_first.file_cnt, 2U);
  ASSERT_EQ(report.dupe_list.size(), 1U);
  EXPECT_EQ(report.dupe_list[0].survivor, _root / "a.bin");
  EXPECT_EQ(report.dupe_list[0].removed, (path_vec{_root / "b.bin"}));
}

TEST_F(dedupe_test, SizesNeverMix) {
  write("a", "hello");
  write("b", "hello");
  write("c", "hello!");
  write("d", "hello!");

  auto report = dedupe(_opts, _log_stream);

  ASSERT_EQ(report.dupe_list.size(), 2U);
  for (const auto &group : report.dupe_list) {
    const auto size = fs::file_size(group.survivor);
    EXPECT_EQ(size, group.size);
    for (const auto &file : group.removed) {
      EXPECT_EQ(fs::file_size(file), size);
    }
  }
  EXPECT_EQ(report.freed, (stats_t{2, 11}));
}

TEST_F(dedupe_test, DryRunIsRepeatable) {
  write("x/1.bin", "payload");
  write("y/2.bin", "payload");
  write("3.bin", "payload");
  write("z/4.bin", "other!!");
  write("z/5.bin", "other!!");

  for (auto order : {walk_order_t::inode, walk_order_t::name,
                     walk_order_t::depth}) {
    _opts.order = order;
    auto first = dedupe(_opts, _log_stream);
    auto second = dedupe(_opts, _log_stream);
    ASSERT_EQ(first.dupe_list.size(), 2U);
    ASSERT_EQ(first.dupe_list.size(), second.dupe_list.size());
    for (auto i = 0UL; i < first.dupe_list.size(); ++i) {
      EXPECT_EQ(first.dupe_list[i].digest, second.dupe_list[i].digest);
      EXPECT_EQ(first.dupe_list[i].survivor, second.dupe_list[i].survivor);
      EXPECT_EQ(first.dupe_list[i].removed, second.dupe_list[i].removed);
    }
  }
}

TEST_F(dedupe_test, DepthOrderKeepsShallowestFile) {
  write("a/b/deep.txt", "payload");
  write("a/mid.txt", "payload");
  write("z.txt", "payload");
  _opts.order = walk_order_t::depth;

  auto report = dedupe(_opts, _log_stream);

  ASSERT_EQ(report.dupe_list.size(), 1U);
  EXPECT_EQ(report.dupe_list[0].survivor, _root / "z.txt");
}

TEST_F(dedupe_test, DuplicateRootsCollapse) {
  write("a.txt", "hello");
  write("b.txt", "hello");
  _opts.search_dir = {_root, _root / ".", _root};

  auto report = dedupe(_opts, _log_stream);

  EXPECT_EQ(report.by_size, (stats_t{2, 10}));
  ASSERT_EQ(report.dupe_list.size(), 1U);
}

TEST_F(dedupe_test, SizeLimits) {
  write("a", "hello");
  write("b", "hello");
  write("c", "hello world");
  write("d", "hello world");

  _opts.min_sz = 6;
  auto report = dedupe(_opts, _log_stream);
  ASSERT_EQ(report.dupe_list.size(), 1U);
  EXPECT_EQ(report.dupe_list[0].size, 11U);

  _opts.min_sz = 1;
  _opts.max_sz = 10;
  report = dedupe(_opts, _log_stream);
  ASSERT_EQ(report.dupe_list.size(), 1U);
  EXPECT_EQ(report.dupe_list[0].size, 5U);
}

TEST_F(dedupe_test, BadOptionsTouchNothing) {
  write("a.txt", "hello");
  write("b.txt", "hello");
  _opts.rm_meth = rm_t::remove;

  auto opts = _opts;
  opts.min_sz = 10;
  opts.max_sz = 5;
  EXPECT_THROW(dedupe(opts, _log_stream), std::invalid_argument);

  opts = _opts;
  opts.min_cnt = 1;
  EXPECT_THROW(dedupe(opts, _log_stream), std::invalid_argument);

  opts = _opts;
  opts.scan_sz = 0;
  EXPECT_THROW(dedupe(opts, _log_stream), std::invalid_argument);

  opts = _opts;
  opts.min_sz = 0;
  EXPECT_THROW(dedupe(opts, _log_stream), std::invalid_argument);

  opts = _opts;
  opts.hash_algo = "no-such-digest";
  EXPECT_THROW(dedupe(opts, _log_stream), std::invalid_argument);

  opts = _opts;
  opts.search_dir.clear();
  EXPECT_THROW(dedupe(opts, _log_stream), std::invalid_argument);

  EXPECT_TRUE(fs::exists(_root / "b.txt"));
}

TEST_F(dedupe_test, BadRootsFail) {
  auto file = write("a.txt", "hello");

  _opts.search_dir = {_root / "missing"};
  EXPECT_THROW(dedupe(_opts, _log_stream), fs::filesystem_error);

  _opts.search_dir = {file};
  EXPECT_THROW(dedupe(_opts, _log_stream), std::invalid_argument);
}

}  // namespace dupsweep::test
