#include <assert.h>

#include <iostream>
#include <set>
#include <string>

#include "internal/crypto/cipher_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace {

using relay::crypto::CipherService;
using relay::crypto::EncryptedPayload;

template <typename Fn>
bool ThrowsDecryptionError(Fn&& fn) {
  try {
    fn();
  } catch (const relay::util::DecryptionError&) {
    return true;
  }
  return false;
}

void TestRoundTrip() {
  CipherService cipher;
  const auto    key = relay::crypto::GenerateKey();

  const std::string script = "import sys\nprint('hello')\n";
  const auto        sealed = cipher.Encrypt(script, key);

  assert(sealed.nonce.size() == CipherService::kNonceSize);
  assert(sealed.tag.size() == CipherService::kTagSize);
  assert(sealed.ciphertext.size() == script.size());
  assert(sealed.ciphertext != script);

  assert(cipher.Decrypt(sealed, key) == script);
}

void TestEmptyPlaintext() {
  CipherService cipher;
  const auto    key    = relay::crypto::GenerateKey();
  const auto    sealed = cipher.Encrypt("", key);
  assert(sealed.ciphertext.empty());
  assert(cipher.Decrypt(sealed, key).empty());
}

void TestFreshNonceEveryCall() {
  CipherService cipher;
  const auto    key = relay::crypto::GenerateKey();

  std::set<std::string> nonces;
  for (int i = 0; i < 32; ++i) {
    nonces.insert(cipher.Encrypt("same", key).nonce);
  }
  assert(nonces.size() == 32);
}

void TestTamperedCiphertextFails() {
  CipherService cipher;
  const auto    key    = relay::crypto::GenerateKey();
  auto          sealed = cipher.Encrypt("Get-Process | Select-Object -First 5", key);

  sealed.ciphertext[3] = static_cast<char>(sealed.ciphertext[3] ^ 0x01);
  assert(ThrowsDecryptionError([&] { (void)cipher.Decrypt(sealed, key); }));
}

void TestTamperedTagFails() {
  CipherService cipher;
  const auto    key    = relay::crypto::GenerateKey();
  auto          sealed = cipher.Encrypt("payload", key);

  sealed.tag[0] = static_cast<char>(sealed.tag[0] ^ 0x80);
  assert(ThrowsDecryptionError([&] { (void)cipher.Decrypt(sealed, key); }));
}

void TestWrongKeyFails() {
  CipherService cipher;
  const auto    sealed = cipher.Encrypt("payload", relay::crypto::GenerateKey());
  assert(ThrowsDecryptionError([&] { (void)cipher.Decrypt(sealed, relay::crypto::GenerateKey()); }));
}

void TestHexBoundary() {
  CipherService cipher;
  const auto    key    = relay::crypto::GenerateKey();
  const auto    sealed = cipher.Encrypt("hex me", key);

  const auto hex_key = relay::crypto::KeyToHex(key);
  assert(hex_key.size() == 64);
  assert(relay::crypto::KeyFromHex(hex_key) == key);

  const auto plain = cipher.DecryptHex(relay::util::ToHex(sealed.ciphertext), relay::util::ToHex(sealed.nonce),
                                       relay::util::ToHex(sealed.tag), key);
  assert(plain == "hex me");

  // Malformed hex is an authentication failure, not a crash.
  assert(ThrowsDecryptionError([&] { (void)cipher.DecryptHex("zz", relay::util::ToHex(sealed.nonce), relay::util::ToHex(sealed.tag), key); }));

  bool rejected = false;
  try {
    (void)relay::crypto::KeyFromHex("abcd");
  } catch (const relay::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

void TestSha256Digest() {
  assert(relay::crypto::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(relay::crypto::RandomBytes(32).size() == 32);
}

} // namespace

int main() {
  TestRoundTrip();
  TestEmptyPlaintext();
  TestFreshNonceEveryCall();
  TestTamperedCiphertextFails();
  TestTamperedTagFails();
  TestWrongKeyFails();
  TestHexBoundary();
  TestSha256Digest();

  std::cout << "relay_unit_cipher_service: pass\n";
  return 0;
}
