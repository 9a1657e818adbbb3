#include "dedupe_same_sz.hh"

#include <map>

#include "hasher.hh"

namespace dupsweep {

inline namespace detail_v1 {

hash_map_t dedupe_same_sz(const path_vec &file_list, const EVP_MD *hash_type) {
  hash_map_t hash_map;
  for (const auto &file : file_list) {
    hash_map[hash_file(file, hash_type)].emplace_back(file);
  }

  // a duplicate takes two
  std::erase_if(hash_map,
                [](const auto &group) { return group.second.size() < 2; });
  return hash_map;
}

}  // namespace detail_v1

}  // namespace dupsweep
