#include "ls_dir_rec.hh"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <set>
#include <stdexcept>
#include <system_error>
#include <tuple>
#include <utility>

namespace dupsweep {

inline namespace detail_v1 {

namespace {

struct dir_item_t {
  std::filesystem::path path;
  struct stat st;
};

// stat_fn is ::stat for search roots and ::lstat for everything below
template <typename Fn>
struct stat stat_or_throw(Fn &&stat_fn, const std::filesystem::path &path) {
  struct stat st {};
  if (stat_fn(path.c_str(), &st) != 0) {
    throw std::filesystem::filesystem_error(
        "cannot read metadata", path,
        std::error_code(errno, std::generic_category()));
  }
  return st;
}

void walk(const std::filesystem::path &dir, const dev_t root_dev,
          const uint32_t depth, const walk_order_t order,
          std::vector<file_entry_t> &file_list) {
  std::vector<dir_item_t> items;
  for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
    items.push_back({dir_entry.path(), stat_or_throw(::lstat, dir_entry.path())});
  }

  if (order == walk_order_t::inode) {
    std::sort(items.begin(), items.end(), [](const auto &lhs, const auto &rhs) {
      return std::tie(lhs.st.st_ino, lhs.path) <
             std::tie(rhs.st.st_ino, rhs.path);
    });
  } else {
    std::sort(items.begin(), items.end(), [](const auto &lhs, const auto &rhs) {
      return lhs.path.filename() < rhs.path.filename();
    });
  }

  for (auto &item : items) {
    const auto mode = item.st.st_mode;
    if (S_ISLNK(mode)) {
      // symlink, skip
      std::cerr << "[log] skip symlink: " << item.path << '\n';

    } else if (item.st.st_dev != root_dev) {
      // mount point, skip
      std::cerr << "[log] skip other filesystem: " << item.path << '\n';

    } else if (S_ISDIR(mode)) {
      walk(item.path, root_dev, depth + 1, order, file_list);

    } else if (S_ISREG(mode)) {
      file_list.emplace_back(std::move(item.path), (uint64_t)item.st.st_size,
                             file_id_t{item.st.st_dev, item.st.st_ino}, depth);

    } else {
      // other file type, skip
      std::cerr << "[warn] skip unsupport file: " << item.path << '\n';
    }
  }
}

}  // namespace

std::vector<file_entry_t> ls_dir_rec(const std::filesystem::path &dir,
                                     const walk_order_t order) {
  const auto root_st = stat_or_throw(::stat, dir);
  if (!S_ISDIR(root_st.st_mode)) {
    throw std::filesystem::filesystem_error(
        "not a directory", dir,
        std::make_error_code(std::errc::not_a_directory));
  }

  std::vector<file_entry_t> file_list;
  // depth order is name order regrouped by level
  walk(dir, root_st.st_dev, 0,
       order == walk_order_t::depth ? walk_order_t::name : order, file_list);
  if (order == walk_order_t::depth) {
    std::stable_sort(
        file_list.begin(), file_list.end(),
        [](const auto &lhs, const auto &rhs) { return lhs.depth() < rhs.depth(); });
  }
  return file_list;
}

size_map_t find_candidates(const std::vector<std::filesystem::path> &search_dir,
                           const uint64_t min_sz, const uint64_t max_sz,
                           const uint64_t min_cnt, const walk_order_t order) {
  if (min_cnt < 2) {
    throw std::invalid_argument("duplicate count must be at least 2");
  }

  std::set<file_id_t> found_ids;
  size_map_t size_map;
  for (const auto &dir : search_dir) {
    for (auto &file : ls_dir_rec(dir, order)) {
      const auto size = file.size();
      if (size == 0 || size < min_sz || (max_sz != 0 && size > max_sz)) {
        continue;
      }
      if (!found_ids.insert(file.id()).second) {
        // hard link or overlapping root, already listed
        continue;
      }
      size_map[size].emplace_back(std::move(file.path()));
    }
  }

  std::erase_if(size_map, [min_cnt](const auto &bucket) {
    return bucket.second.size() < min_cnt;
  });
  return size_map;
}

}  // namespace detail_v1

}  // namespace dupsweep
