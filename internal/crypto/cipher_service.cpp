#include "cipher_service.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace relay::crypto {

namespace {

struct CtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using CtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter>;

CtxPtr NewContext() {
  CtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
  return ctx;
}

unsigned char* Bytes(std::string& s) {
  return reinterpret_cast<unsigned char*>(s.data());
}

const unsigned char* Bytes(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

} // namespace

// ------------------------------------------------------------------
// Encrypt
// ------------------------------------------------------------------

EncryptedPayload CipherService::Encrypt(std::string_view plaintext, const Key& key) const {
  EncryptedPayload out;
  out.nonce = RandomBytes(kNonceSize);
  out.tag.resize(kTagSize);
  out.ciphertext.resize(plaintext.size());

  auto ctx = NewContext();

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), Bytes(std::string_view(out.nonce))) != 1) {
    throw std::runtime_error("AES-256-GCM encrypt init failed");
  }

  int len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), Bytes(out.ciphertext), &len, Bytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
    throw std::runtime_error("AES-256-GCM encrypt failed");
  }

  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), Bytes(out.ciphertext) + len, &final_len) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), Bytes(out.tag)) != 1) {
    throw std::runtime_error("AES-256-GCM finalize failed");
  }

  out.ciphertext.resize(static_cast<std::size_t>(len + final_len));
  return out;
}

// ------------------------------------------------------------------
// Decrypt
// ------------------------------------------------------------------

std::string CipherService::Decrypt(const EncryptedPayload& payload, const Key& key) const {
  if (payload.nonce.size() != kNonceSize) {
    throw util::DecryptionError("invalid nonce length");
  }
  if (payload.tag.size() != kTagSize) {
    throw util::DecryptionError("invalid auth tag length");
  }

  auto ctx = NewContext();

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), Bytes(std::string_view(payload.nonce))) != 1) {
    throw std::runtime_error("AES-256-GCM decrypt init failed");
  }

  std::string plaintext(payload.ciphertext.size(), '\0');
  int         len = 0;
  if (!payload.ciphertext.empty() &&
      EVP_DecryptUpdate(ctx.get(), Bytes(plaintext), &len, Bytes(std::string_view(payload.ciphertext)),
                        static_cast<int>(payload.ciphertext.size())) != 1) {
    throw util::DecryptionError("decryption failed");
  }

  std::string tag = payload.tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), Bytes(tag)) != 1) {
    throw util::DecryptionError("unable to set auth tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), Bytes(plaintext) + len, &final_len) != 1) {
    throw util::DecryptionError("authentication failed");
  }

  plaintext.resize(static_cast<std::size_t>(len + final_len));
  return plaintext;
}

std::string CipherService::DecryptHex(std::string_view ciphertext_hex, std::string_view nonce_hex, std::string_view tag_hex,
                                      const Key& key) const {
  EncryptedPayload payload;
  try {
    payload.ciphertext = util::FromHex(ciphertext_hex);
    payload.nonce      = util::FromHex(nonce_hex);
    payload.tag        = util::FromHex(tag_hex);
  } catch (const util::InvalidArgument& e) {
    throw util::DecryptionError(e.what());
  }
  return Decrypt(payload, key);
}

// ------------------------------------------------------------------
// Keys and digests
// ------------------------------------------------------------------

Key GenerateKey() {
  Key key{};
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return key;
}

std::string KeyToHex(const Key& key) {
  return util::ToHex(std::string_view(reinterpret_cast<const char*>(key.data()), key.size()));
}

Key KeyFromHex(std::string_view hex) {
  if (hex.size() != 64) {
    throw util::InvalidArgument("encryption key must be 64 hex characters");
  }
  const auto raw = util::FromHex(hex);
  Key        key{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<uint8_t>(raw[i]);
  }
  return key;
}

std::string Sha256Hex(std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(Bytes(data), data.size(), digest);
  return util::ToHex(std::string_view(reinterpret_cast<const char*>(digest), sizeof(digest)));
}

std::string RandomBytes(std::size_t n) {
  std::string out(n, '\0');
  if (n > 0 && RAND_bytes(Bytes(out), static_cast<int>(n)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

} // namespace relay::crypto
