#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace relay::crypto {

using Key = std::array<uint8_t, 32>;

// Raw bytes. Hex only at the wire boundary.
struct EncryptedPayload {
  std::string ciphertext;
  std::string nonce;
  std::string tag;
};

/*
  AES-256-GCM authenticated encryption.

  - Fresh 16-byte nonce from the OpenSSL CSPRNG on every Encrypt().
  - 16-byte tag.
  - Decrypt() verifies the tag before any plaintext is returned and
    throws util::DecryptionError on any mismatch.

  Stateless; safe to share across threads.
*/
class CipherService {
 public:
  static constexpr const char* kAlgorithm = "aes-256-gcm";
  static constexpr std::size_t kNonceSize = 16;
  static constexpr std::size_t kTagSize   = 16;

  EncryptedPayload Encrypt(std::string_view plaintext, const Key& key) const;

  std::string Decrypt(const EncryptedPayload& payload, const Key& key) const;

  // Hex-encoded convenience used by the executor.
  std::string DecryptHex(std::string_view ciphertext_hex, std::string_view nonce_hex, std::string_view tag_hex, const Key& key) const;
};

Key GenerateKey();

std::string KeyToHex(const Key& key);

// Throws util::InvalidArgument unless exactly 64 hex characters.
Key KeyFromHex(std::string_view hex);

// Lowercase hex SHA-256, used for stored credential digests.
std::string Sha256Hex(std::string_view data);

// Random bytes from the CSPRNG.
std::string RandomBytes(std::size_t n);

} // namespace relay::crypto
