#include "rm_file.hh"

#include <system_error>

namespace dupsweep {

inline namespace detail_v1 {

void rm_file(const std::filesystem::path &dup_path,
             const std::filesystem::path &ori_path, const rm_t rm_meth,
             std::ostream &log_stream) {
  if (rm_meth == rm_t::remove) {
    std::error_code ec;
    if (!std::filesystem::remove(dup_path, ec) || ec) {
      if (!ec) {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
      }
      log_stream << std::flush;
      throw std::filesystem::filesystem_error("failed to remove", dup_path,
                                              ec);
    }
  }
  log_stream << "<- " << dup_path << "\n-> " << ori_path << '\n';
}

}  // namespace detail_v1

}  // namespace dupsweep
