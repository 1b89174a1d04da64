#include "Hasher.hpp"
#include "core/Errors.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fam {

static constexpr std::size_t kChunkSize = 64 * 1024;
// Backoff stops doubling after this many retries.
static constexpr int kMaxBackoffShift = 16;

static std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string sha256File(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("open failed: " + path.string());

  struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  std::vector<char> buf(kChunkSize);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  if (in.bad()) throw std::runtime_error("read failed: " + path.string());

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int outLen = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  return to_hex(out, outLen);
}

std::string Hasher::hash(const std::filesystem::path& path) const {
  const int attempts = policy_.max_attempts < 1 ? 1 : policy_.max_attempts;
  std::string lastCause;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      return sha256File(path);
    } catch (const std::exception& e) {
      lastCause = e.what();
    }
    if (attempt == attempts) break;

    const int shift = std::min(attempt - 1, kMaxBackoffShift);
    const auto delay = policy_.base_delay * (1LL << shift);
    spdlog::warn("retrying read of {} (attempt {}/{}) in {} ms: {}",
                 path.string(), attempt + 1, attempts, delay.count(), lastCause);
    if (onRetry_) onRetry_(path, attempt);
    std::this_thread::sleep_for(delay);
  }
  throw ReadError(path, attempts, lastCause);
}

} // namespace fam
