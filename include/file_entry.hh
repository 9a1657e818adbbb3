#pragma once

#include <sys/types.h>

#include <compare>
#include <cstdint>
#include <filesystem>
#include <utility>

namespace dupsweep {

inline namespace detail_v1 {

// identity of the underlying file, independent of the path reaching it
struct file_id_t {
  dev_t dev = 0;
  ino_t ino = 0;

  auto operator<=>(const file_id_t &rhs) const = default;
};

class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  file_id_t _id;
  uint32_t _depth = 0;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size, const file_id_t id,
                      const uint32_t depth = 0)
      : _path(std::forward<Tp>(path)), _size(size), _id(id), _depth(depth) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline std::filesystem::path &path() noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline file_id_t id() const noexcept { return _id; }
  // directory levels below the search root
  inline uint32_t depth() const noexcept { return _depth; }
};

}  // namespace detail_v1

}  // namespace dupsweep
