#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "breeze/write-buffer.hpp"

struct evp_md_ctx_st;

namespace breeze {

// Incremental MD5 hasher backed by OpenSSL EVP. Call update() one or more times, then hexFinal().
// MD5 is used as a content fingerprint for cache validation only: its 128-bit output makes accidental
// collisions negligible while keeping the ETag 32 characters long.
class Md5Digest {
 public:
  // Throws std::runtime_error if OpenSSL cannot provide the MD5 algorithm.
  Md5Digest();

  Md5Digest(const Md5Digest&) = delete;
  Md5Digest(Md5Digest&&) noexcept = default;
  Md5Digest& operator=(const Md5Digest&) = delete;
  Md5Digest& operator=(Md5Digest&&) noexcept = default;

  ~Md5Digest();

  // Feed data into the hasher (can be called multiple times).
  void update(std::string_view data);

  // Finalize and return the 32-char lower case hexadecimal digest. Resets internal state for reuse.
  [[nodiscard]] std::string hexFinal();

 private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };

  void reset();

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> _ctx;
};

// Computes the ETag of the buffered body, feeding chunks in their current buffer order.
// The result only depends on the concatenated bytes, not on chunk boundaries.
[[nodiscard]] std::string ComputeEtag(const WriteBuffer& buffer);

}  // namespace breeze
