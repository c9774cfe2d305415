#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace chirp::util {
namespace {

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

}  // namespace

Result initialize_hashing() {
  if (sodium_init() < 0) {
    return Result::failure(ErrorKind::NotInitialized, "libsodium initialization failed.");
  }
  return Result::success("libsodium ready.");
}

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

ValueResult<Identity> identity_from_public_key(std::string_view public_key_hex) {
  const std::string hex = trim_copy(public_key_hex);
  std::array<unsigned char, crypto_sign_PUBLICKEYBYTES> key{};
  std::size_t key_len = 0;
  const char* hex_end = nullptr;
  if (sodium_hex2bin(key.data(), key.size(), hex.c_str(), hex.size(), nullptr, &key_len,
                     &hex_end) != 0 ||
      hex_end != hex.c_str() + hex.size() || key_len != key.size()) {
    return ValueResult<Identity>::failure(Result::failure(
        ErrorKind::InvalidArgument,
        "Public key must be " + std::to_string(key.size() * 2U) + " hex characters."));
  }
  const std::string digest =
      sha256_hex(std::string_view{reinterpret_cast<const char*>(key.data()), key.size()});
  return ValueResult<Identity>::success(std::string{kIdentityPrefix} + digest.substr(0, 40));
}

}  // namespace chirp::util
