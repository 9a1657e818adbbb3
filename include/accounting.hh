#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

#include "candidate_map.hh"
#include "rm_t.hh"

namespace dupsweep {

inline namespace detail_v1 {

struct stats_t {
  uint64_t file_cnt = 0;
  uint64_t total_sz = 0;

  bool operator==(const stats_t &rhs) const = default;
};

// one confirmed group of identical files
struct dupe_group_t {
  std::string digest;
  uint64_t size = 0;
  std::filesystem::path survivor;
  path_vec removed;
};

// file count and bytes of all candidates
stats_t generate_stats(const size_map_t &size_map) noexcept;

/**
 * @brief keep the first file of a confirmed group and hand the others to
 * rm_file, freed is updated after every handled file.
 *
 * @param digest full content digest shared by files
 * @param files group members in traversal order (at least 2)
 * @param size size of each member
 * @param rm_meth rm_t::log for a dry run
 * @param[out] freed running count of removed files and bytes
 * @param log_stream removal records
 * @throws std::filesystem::filesystem_error if a removal fails, files
 * handled before it stay removed
 */
dupe_group_t resolve_group(std::string digest, path_vec files,
                           const uint64_t size, const rm_t rm_meth,
                           stats_t &freed, std::ostream &log_stream);

}  // namespace detail_v1

}  // namespace dupsweep
