#include "partial_hash.hh"

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "hasher.hh"

namespace dupsweep {

inline namespace detail_v1 {

size_map_t eliminate_partial(size_map_t size_map, const scan_t scan,
                             const uint64_t scan_sz, const uint64_t min_cnt,
                             const EVP_MD *hash_type) {
  if (scan_sz == 0) {
    throw std::invalid_argument("scan size must be greater than 0");
  }
  if (min_cnt < 2) {
    throw std::invalid_argument("duplicate count must be at least 2");
  }

  size_map_t new_map;
  for (auto &[file_sz, files] : size_map) {
    if (file_sz <= scan_sz) {
      // whole file fits in the window, left for full hashing
      new_map.emplace(file_sz, std::move(files));
      continue;
    }

    const auto offset = scan == scan_t::first ? 0UL : file_sz - scan_sz;
    std::vector<std::string> digests;
    digests.reserve(files.size());
    std::unordered_map<std::string, uint64_t> digest_cnt;
    for (const auto &file : files) {
      auto &digest =
          digests.emplace_back(hash_range(file, offset, scan_sz, hash_type));
      ++digest_cnt[digest];
    }

    path_vec kept;
    for (auto i = 0UL; i < files.size(); ++i) {
      if (digest_cnt[digests[i]] >= min_cnt) {
        kept.emplace_back(std::move(files[i]));
      }
    }
    if (kept.size() >= min_cnt) {
      new_map.emplace(file_sz, std::move(kept));
    }
  }
  return new_map;
}

}  // namespace detail_v1

}  // namespace dupsweep
