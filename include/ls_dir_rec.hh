#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "candidate_map.hh"
#include "file_entry.hh"

namespace dupsweep {

inline namespace detail_v1 {

enum class walk_order_t {
  inode,  // depth first, siblings by inode number
  name,   // depth first, siblings by file name
  depth   // shallower files first, then by name
};

/**
 * @brief list regular files under a directory recursively,
 * symlinks are neither followed nor listed, other filesystems are not entered.
 *
 * @param dir search root
 * @param order deterministic traversal order
 * @return regular files in traversal order
 * @throws std::filesystem::filesystem_error on any unreadable directory or entry
 */
std::vector<file_entry_t> ls_dir_rec(const std::filesystem::path &dir,
                                     const walk_order_t order);

/**
 * @brief group files of all search roots by size, each physical file is
 * counted once, sizes with fewer than min_cnt files are dropped.
 *
 * @param search_dir directories to search
 * @param min_sz minimum file size (empty files are always skipped)
 * @param max_sz maximum file size, 0 for no limit
 * @param min_cnt minimum files of one size to be considered (>= 2)
 * @param order traversal order, decides which file of a group survives
 */
size_map_t find_candidates(const std::vector<std::filesystem::path> &search_dir,
                           const uint64_t min_sz, const uint64_t max_sz,
                           const uint64_t min_cnt, const walk_order_t order);

}  // namespace detail_v1

}  // namespace dupsweep
