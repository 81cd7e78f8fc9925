#include "bitcache/hash.hpp"

#include "bitcache/consts.hpp"
#include "bitcache/errors.hpp"

#include <array>
#include <cstdint>
#include <fstream>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bitcache {

namespace {

struct CtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using CtxPtr = std::unique_ptr<EVP_MD_CTX, CtxDeleter>;

CtxPtr md5_init() {
  CtxPtr ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(EVP_md5) failed");
  }
  return ctx;
}

void md5_update(EVP_MD_CTX *ctx, const void *data, std::size_t size) {
  if (size != 0 && EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

digest md5_final(EVP_MD_CTX *ctx) {
  digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("MD5 produced unexpected length");
  }
  return out;
}

} // namespace

digest md5(std::span<const std::uint8_t> data) {
  auto ctx = md5_init();
  md5_update(ctx.get(), data.data(), data.size());
  return md5_final(ctx.get());
}

digest md5_file(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw Error(ErrorKind::IoError, "open for read failed: " + path.string());
  }
  auto ctx = md5_init();
  std::vector<char> buf(consts::kIoChunk);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    md5_update(ctx.get(), buf.data(), static_cast<std::size_t>(ifs.gcount()));
  }
  if (ifs.bad()) {
    throw Error(ErrorKind::IoError, "read failed: " + path.string());
  }
  return md5_final(ctx.get());
}

std::string to_hex(const digest &d) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(consts::kDigestHexLen);
  for (std::size_t i = 0; i < consts::kDigestRawLen; ++i) {
    unsigned b = d[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

} // namespace bitcache
