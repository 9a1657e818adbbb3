#pragma once

#include <cstdint>
#include <string>

namespace dupsweep::utils {

/**
 * @brief Parse a size string ex. 4096, 512K, 16MiB, 4GB, 8Mb into bytes.
 * @throws std::invalid_argument if not a valid size string or out of range.
 */
uint64_t parse_size(const std::string &size_str);

/**
 * @brief Parse a plain decimal count ex. a duplicate threshold.
 * @throws std::invalid_argument on sign, trailing characters or overflow.
 */
uint64_t parse_count(const std::string &count_str);

/**
 * @brief Human readable size, "999 B" or "1500 B (1.5 kB, 1.46 KiB)".
 */
std::string format_size(const uint64_t bytes);

}  // namespace dupsweep::utils
