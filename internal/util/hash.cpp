#include "hash.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace activity::util {

namespace {

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

// "<len>:<bytes>;" so that field boundaries cannot shift between inputs.
void AppendField(std::string& buf, std::string_view field) {
  buf += std::to_string(field.size());
  buf.push_back(':');
  buf.append(field.data(), field.size());
  buf.push_back(';');
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("sha256: EVP_MD_CTX_new failed");

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("sha256: digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

std::string ContentHash(const Content& content) {
  return Sha256Hex(CanonicalJson(content));
}

std::string CommitHash(const Content& content, std::string_view message, std::int64_t author, uint64_t timestamp_ms,
                       const std::optional<std::string>& parent_hash) {
  std::string buf;
  AppendField(buf, CanonicalJson(content));
  AppendField(buf, message);
  AppendField(buf, std::to_string(author));
  AppendField(buf, std::to_string(timestamp_ms));
  AppendField(buf, parent_hash.value_or(""));
  return Sha256Hex(buf);
}

} // namespace activity::util
