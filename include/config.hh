#pragma once

#define DUPSWEEP_EXPORT __attribute__((visibility("default")))

namespace dupsweep {

// 1MiB
constexpr auto default_scan_sz = 1024UL * 1024UL;
// 1MiB
constexpr auto buf_sz = 1024UL * 1024UL;

constexpr auto default_min_sz = 1UL;
constexpr auto default_min_cnt = 2UL;

// any digest name known to libcrypto
constexpr auto default_hash_algo = "sha512";

}  // namespace dupsweep
