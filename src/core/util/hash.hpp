#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace chirp::util {

// Must succeed once per process before any digest is taken.
Result initialize_hashing();

std::string sha256_hex(std::string_view payload);

// Stable identity for transports that authenticate callers by public key.
// The key is hex (either case, surrounding whitespace ignored) and must
// decode to crypto_sign_PUBLICKEYBYTES bytes.
ValueResult<Identity> identity_from_public_key(std::string_view public_key_hex);

}  // namespace chirp::util
