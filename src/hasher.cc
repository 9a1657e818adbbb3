#include "hasher.hh"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "config.hh"

namespace dupsweep {

inline namespace detail_v1 {

namespace {

[[noreturn]] void throw_io_error(const char *what,
                                 const std::filesystem::path &path) {
  const auto ec = errno != 0 ? std::error_code(errno, std::generic_category())
                             : std::make_error_code(std::errc::io_error);
  throw std::filesystem::filesystem_error(what, path, ec);
}

// feed up to len bytes of ifs to hasher, returns bytes consumed
uint64_t hash_stream(std::ifstream &ifs, const uint64_t len,
                     const std::filesystem::path &path, hasher_t &hasher) {
  std::vector<char> buf(std::min<uint64_t>(buf_sz, len));
  uint64_t total = 0;
  while (total < len) {
    const auto read_sz = std::min<uint64_t>(buf.size(), len - total);
    const auto read_len =
        (uint64_t)ifs.read(buf.data(), (std::streamsize)read_sz).gcount();
    if (ifs.bad()) {
      throw_io_error("read error", path);
    }
    hasher.update(buf.data(), read_len);
    total += read_len;
    if (read_len < read_sz) {
      // end of file
      break;
    }
  }
  return total;
}

}  // namespace

hasher_t::hasher_t(const EVP_MD *hash_type) : _hash_type(hash_type) {
  _ctx = EVP_MD_CTX_new();
  if (_ctx == nullptr) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  try {
    reset();
  } catch (...) {
    EVP_MD_CTX_free(_ctx);
    throw;
  }
}

hasher_t::~hasher_t() noexcept {
  if (_ctx != nullptr) {
    EVP_MD_CTX_free(_ctx);
  }
}

void hasher_t::reset() {
  if (EVP_DigestInit_ex(_ctx, _hash_type, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

void hasher_t::update(const char *data, const uint64_t size) {
  if (EVP_DigestUpdate(_ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string hasher_t::hex_digest() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;
  if (EVP_DigestFinal_ex(_ctx, md, &md_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  constexpr char hex_chars[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(md_len * 2U);
  for (auto i = 0U; i < md_len; ++i) {
    hex += hex_chars[md[i] >> 4U];
    hex += hex_chars[md[i] & 0xfU];
  }
  return hex;
}

const EVP_MD *get_hash_type(const std::string &hash_algo) {
  const EVP_MD *hash_type = EVP_get_digestbyname(hash_algo.c_str());
  if (hash_type == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + hash_algo);
  }
  return hash_type;
}

std::string hash_range(const std::filesystem::path &path, const uint64_t offset,
                       const uint64_t len, const EVP_MD *hash_type) {
  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw_io_error("cannot open file", path);
  }
  if (!ifs.seekg((std::streamoff)offset)) {
    throw_io_error("cannot seek", path);
  }
  hasher_t hasher(hash_type);
  if (hash_stream(ifs, len, path, hasher) == 0) {
    // file shrank below offset since it was listed
    throw_io_error("nothing to read", path);
  }
  return hasher.hex_digest();
}

std::string hash_file(const std::filesystem::path &path,
                      const EVP_MD *hash_type) {
  errno = 0;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw_io_error("cannot open file", path);
  }
  hasher_t hasher(hash_type);
  hash_stream(ifs, std::numeric_limits<uint64_t>::max(), path, hasher);
  return hasher.hex_digest();
}

}  // namespace detail_v1

}  // namespace dupsweep
