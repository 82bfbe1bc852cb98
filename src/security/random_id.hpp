#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docpipe {

// Cryptographically strong randomness from OpenSSL. Throws std::runtime_error
// when the generator is not seeded.
auto random_bytes(std::size_t count) -> std::vector<unsigned char>;

// Canonical lowercase RFC 4122 version 4 identifier.
auto generate_uuid_v4() -> std::string;

// `count` random bytes encoded as URL-safe base64 without padding.
auto generate_urlsafe_token(std::size_t count) -> std::string;

auto base64_encode(std::string_view bytes) -> std::string;
auto base64url_encode(std::string_view bytes) -> std::string;
// Throws ValidationException on malformed input. Whitespace is ignored.
auto base64_decode(std::string_view text) -> std::string;

}  // namespace docpipe
