#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace dupsweep {

inline namespace detail_v1 {

using path_vec = std::vector<std::filesystem::path>;

// file size -> candidates of that size, in traversal order
using size_map_t = std::map<uint64_t, path_vec>;

// hex digest -> files sharing it, in traversal order
using hash_map_t = std::map<std::string, path_vec>;

}  // namespace detail_v1

}  // namespace dupsweep
