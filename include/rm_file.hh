#pragma once

#include <filesystem>
#include <ostream>

#include "rm_t.hh"

namespace dupsweep {

inline namespace detail_v1 {

/**
 * @brief handle one duplicate, the record "<- dup_path" / "-> ori_path" is
 * written to log_stream once the file is gone (or right away for rm_t::log)
 *
 * @throws std::filesystem::filesystem_error if removal fails
 */
void rm_file(const std::filesystem::path &dup_path,
             const std::filesystem::path &ori_path, const rm_t rm_meth,
             std::ostream &log_stream);

}  // namespace detail_v1

}  // namespace dupsweep
