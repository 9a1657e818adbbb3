#include "accounting.hh"

#include <iterator>
#include <stdexcept>
#include <utility>

#include "rm_file.hh"

namespace dupsweep {

inline namespace detail_v1 {

stats_t generate_stats(const size_map_t &size_map) noexcept {
  stats_t stats;
  for (const auto &[file_sz, files] : size_map) {
    stats.file_cnt += files.size();
    stats.total_sz += file_sz * files.size();
  }
  return stats;
}

dupe_group_t resolve_group(std::string digest, path_vec files,
                           const uint64_t size, const rm_t rm_meth,
                           stats_t &freed, std::ostream &log_stream) {
  if (files.size() < 2) {
    throw std::invalid_argument("duplicate group needs at least 2 files");
  }

  dupe_group_t group;
  group.digest = std::move(digest);
  group.size = size;
  group.survivor = std::move(files.front());
  group.removed.reserve(files.size() - 1);
  for (auto itr = std::next(files.begin()); itr != files.end(); ++itr) {
    rm_file(*itr, group.survivor, rm_meth, log_stream);
    ++freed.file_cnt;
    freed.total_sz += size;
    group.removed.emplace_back(std::move(*itr));
  }
  return group;
}

}  // namespace detail_v1

}  // namespace dupsweep
