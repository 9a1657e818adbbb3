#include "size_str.hh"

#include <array>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dupsweep::utils {

namespace {

constexpr std::array<char, 6> unit_dict{'K', 'M', 'G', 'T', 'P', 'E'};
constexpr std::array<const char *, 7> si_units{"B",  "kB", "MB", "GB",
                                               "TB", "PB", "EB"};
constexpr std::array<const char *, 7> iec_units{"B",   "KiB", "MiB", "GiB",
                                                "TiB", "PiB", "EiB"};

bool is_num(char c) { return c >= '0' && c <= '9'; }

// checked multiply of unsigned long
uint64_t mul_ul(const uint64_t lhs, const uint64_t rhs,
                const std::string &size_str) {
  if (rhs != 0 && lhs > std::numeric_limits<uint64_t>::max() / rhs) {
    throw std::invalid_argument("size out of range: " + size_str);
  }
  return lhs * rhs;
}

// 2 decimals, trailing zeros trimmed
std::string scaled(const uint64_t bytes, const double base,
                   const std::array<const char *, 7> &units) {
  auto num = (double)bytes;
  auto idx = 0UL;
  while (num >= base && idx + 1 < units.size()) {
    num /= base;
    ++idx;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << num;
  auto str = oss.str();
  str.erase(str.find_last_not_of('0') + 1);
  if (str.back() == '.') {
    str.pop_back();
  }
  return str + ' ' + units[idx];
}

}  // namespace

uint64_t parse_size(const std::string &size_str) {
  const auto size_len = size_str.size();
  uint64_t size_num = 0;
  std::size_t i = 0;
  for (; i < size_len && is_num(size_str[i]); ++i) {
    size_num = mul_ul(size_num, 10, size_str);
    const auto digit = (uint64_t)(size_str[i] - '0');
    if (size_num > std::numeric_limits<uint64_t>::max() - digit) {
      throw std::invalid_argument("size out of range: " + size_str);
    }
    size_num += digit;
  }
  if (i == 0) {
    throw std::invalid_argument("invalid size string: " + size_str);
  }

  std::size_t scale = 0;
  bool as_bibyte = false;
  bool as_bit = false;
  if (i < size_len) {
    for (std::size_t j = 0; j < unit_dict.size(); ++j) {
      if (size_str[i] == unit_dict[j] || size_str[i] == unit_dict[j] + 32) {
        scale = j + 1;
        ++i;
        break;
      }
    }
  }
  if (scale != 0 && i < size_len && size_str[i] == 'i') {
    as_bibyte = true;
    ++i;
  }
  if (i < size_len) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      throw std::invalid_argument("invalid size string: " + size_str);
    }
    ++i;
  }
  if (i != size_len) {
    throw std::invalid_argument("invalid size string: " + size_str);
  }

  for (std::size_t j = 0; j < scale; ++j) {
    size_num = mul_ul(size_num, as_bibyte ? 1024 : 1000, size_str);
  }
  return as_bit ? size_num / 8 : size_num;
}

uint64_t parse_count(const std::string &count_str) {
  // stoull would take a sign or leading spaces
  if (count_str.empty() || !is_num(count_str.front())) {
    throw std::invalid_argument("invalid count: " + count_str);
  }
  std::size_t pos = 0;
  uint64_t count = 0;
  try {
    count = std::stoull(count_str, &pos);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("invalid count: " + count_str);
  }
  if (pos != count_str.size()) {
    throw std::invalid_argument("invalid count: " + count_str);
  }
  return count;
}

std::string format_size(const uint64_t bytes) {
  std::ostringstream oss;
  oss << bytes << " B";
  if (bytes >= 1000) {
    oss << " (" << scaled(bytes, 1000.0, si_units) << ", "
        << scaled(bytes, 1024.0, iec_units) << ')';
  }
  return oss.str();
}

}  // namespace dupsweep::utils
