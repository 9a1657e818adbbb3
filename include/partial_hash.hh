#pragma once

#include <openssl/evp.h>

#include <cstdint>

#include "candidate_map.hh"

namespace dupsweep {

inline namespace detail_v1 {

enum class scan_t {
  first,  // hash first scan_sz bytes
  last    // hash last scan_sz bytes
};

/**
 * @brief narrow candidates by hashing a window at the start or end of each
 * file, files of sizes up to scan_sz pass through untouched.
 *
 * @param size_map candidates grouped by size
 * @param scan which end of the file to hash
 * @param scan_sz window size in bytes (> 0)
 * @param min_cnt minimum files sharing a digest to stay candidates (>= 2)
 * @param hash_type libcrypto digest
 * @return candidates whose window digest is shared by at least min_cnt files
 * of the same size, relative order kept
 * @throws std::filesystem::filesystem_error on any open or read failure
 */
size_map_t eliminate_partial(size_map_t size_map, const scan_t scan,
                             const uint64_t scan_sz, const uint64_t min_cnt,
                             const EVP_MD *hash_type);

}  // namespace detail_v1

}  // namespace dupsweep
