#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace dupsweep {

inline namespace detail_v1 {

// RAII wrapper for libcrypto message digest.
class hasher_t {
  EVP_MD_CTX *_ctx;
  const EVP_MD *_hash_type;

 public:
  explicit hasher_t(const EVP_MD *hash_type);
  ~hasher_t() noexcept;

  hasher_t(const hasher_t &rhs) = delete;
  hasher_t(hasher_t &&rhs) = delete;
  hasher_t &operator=(const hasher_t &rhs) = delete;
  hasher_t &operator=(hasher_t &&rhs) = delete;

  void reset();
  void update(const char *data, const uint64_t size);
  // lowercase hex, resets nothing
  std::string hex_digest();
};

/**
 * @brief look up a digest by name
 *
 * @throws std::invalid_argument if libcrypto does not know hash_algo
 */
const EVP_MD *get_hash_type(const std::string &hash_algo);

/**
 * @brief hash len bytes of a file starting at offset,
 * stops early at end of file.
 *
 * @throws std::filesystem::filesystem_error if the file cannot be opened,
 * positioned or no byte can be read
 */
std::string hash_range(const std::filesystem::path &path, const uint64_t offset,
                       const uint64_t len, const EVP_MD *hash_type);

/**
 * @brief hash whole file content
 *
 * @throws std::filesystem::filesystem_error on open or read error
 */
std::string hash_file(const std::filesystem::path &path,
                      const EVP_MD *hash_type);

}  // namespace detail_v1

}  // namespace dupsweep
