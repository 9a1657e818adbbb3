#pragma once

#include <openssl/evp.h>

#include "candidate_map.hh"

namespace dupsweep {

inline namespace detail_v1 {

/**
 * @brief hash full content of files of the same size and group them by
 * digest, groups of a single file are dropped.
 *
 * @param file_list files of one size bucket
 * @param hash_type libcrypto digest
 * @return digest -> files, each group has at least 2 files in input order
 * @throws std::filesystem::filesystem_error on any open or read failure
 */
hash_map_t dedupe_same_sz(const path_vec &file_list, const EVP_MD *hash_type);

}  // namespace detail_v1

}  // namespace dupsweep
