#include "breeze/etag.hpp"

#include <openssl/evp.h>

#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "breeze/hex.hpp"
#include "breeze/write-buffer.hpp"

namespace breeze {

void Md5Digest::CtxDeleter::operator()(EVP_MD_CTX* ctx) const noexcept { ::EVP_MD_CTX_free(ctx); }

Md5Digest::Md5Digest() : _ctx(::EVP_MD_CTX_new()) {
  if (!_ctx) {
    throw std::runtime_error("Failed to allocate EVP_MD_CTX");
  }
  reset();
}

Md5Digest::~Md5Digest() = default;

void Md5Digest::reset() {
  if (::EVP_DigestInit_ex(_ctx.get(), ::EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize MD5 digest");
  }
}

void Md5Digest::update(std::string_view data) {
  if (data.empty()) {
    return;
  }
  if (::EVP_DigestUpdate(_ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("Failed to update MD5 digest");
  }
}

std::string Md5Digest::hexFinal() {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
  unsigned int digestLen = 0;
  if (::EVP_DigestFinal_ex(_ctx.get(), digest.data(), &digestLen) != 1) {
    throw std::runtime_error("Failed to finalize MD5 digest");
  }
  reset();
  return ToLowerHex(std::span<const unsigned char>(digest.data(), digestLen));
}

std::string ComputeEtag(const WriteBuffer& buffer) {
  Md5Digest md5;
  for (const std::string& chunk : buffer) {
    md5.update(chunk);
  }
  return md5.hexFinal();
}

}  // namespace breeze
