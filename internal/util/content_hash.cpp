#include "content_hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace transcription::util {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext NewSha256() {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256: digest init failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const char* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("sha256: digest update failed");
  }
}

std::string Finish(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                                length = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
    throw std::runtime_error("sha256: digest final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string Sha256Hex(std::string_view bytes) {
  auto ctx = NewSha256();
  Update(ctx.get(), bytes.data(), bytes.size());
  return Finish(ctx.get());
}

std::string Sha256HexFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("sha256: cannot open " + path.string());
  }

  auto                  ctx = NewSha256();
  std::array<char, 4096> chunk{};
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (in.gcount() > 0) {
      Update(ctx.get(), chunk.data(), static_cast<std::size_t>(in.gcount()));
    }
  }
  return Finish(ctx.get());
}

} // namespace transcription::util
