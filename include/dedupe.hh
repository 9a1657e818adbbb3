#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "accounting.hh"
#include "config.hh"
#include "ls_dir_rec.hh"
#include "rm_t.hh"

namespace dupsweep {

inline namespace detail_v1 {

struct options_t {
  std::vector<std::filesystem::path> search_dir;
  uint64_t min_sz = default_min_sz;
  // 0 for no limit
  uint64_t max_sz = 0;
  uint64_t min_cnt = default_min_cnt;
  uint64_t scan_sz = default_scan_sz;
  rm_t rm_meth = rm_t::log;
  walk_order_t order = walk_order_t::inode;
  std::string hash_algo = default_hash_algo;
};

struct report_t {
  // candidates after grouping by size, last bytes and first bytes
  stats_t by_size;
  stats_t by_last;
  stats_t by_first;
  std::vector<dupe_group_t> dupe_list;
  stats_t freed;
};

/**
 * @brief canonicalize search directories, duplicates are collapsed
 *
 * @throws std::filesystem::filesystem_error if a directory doesn't exist
 * @throws std::invalid_argument if a path is not a directory
 */
std::vector<std::filesystem::path> canonical_dirs(
    const std::vector<std::filesystem::path> &search_dir);

/**
 * @brief check option ranges, no filesystem access
 *
 * @throws std::invalid_argument on the first bad option
 */
void validate(const options_t &opts);

/**
 * @brief detect duplicate files by size, last bytes, first bytes and full
 * content digest, keep the first file of each group and remove the others
 * unless rm_meth is rm_t::log.
 *
 * @param opts search options
 * @param log_stream removal records
 * @return stage statistics, duplicate groups and freed totals
 * @throws std::invalid_argument on bad options, before touching any file
 * @throws std::filesystem::filesystem_error on any traversal, read or removal
 * failure, the run stops there
 */
DUPSWEEP_EXPORT report_t dedupe(const options_t &opts, std::ostream &log_stream);

}  // namespace detail_v1

}  // namespace dupsweep
