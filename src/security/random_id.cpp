#include "random_id.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

#include "utils/exceptions.hpp"

namespace docpipe {

auto
random_bytes(std::size_t count) -> std::vector<unsigned char>
{
  std::vector<unsigned char> bytes(count);
  if (count == 0) {
    return bytes;
  }
  if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return bytes;
}

auto
generate_uuid_v4() -> std::string
{
  constexpr std::size_t kUuidBytes = 16;
  auto bytes = random_bytes(kUuidBytes);
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::string out;
  out.reserve(36);
  for (std::size_t idx = 0; idx < kUuidBytes; ++idx) {
    if (idx == 4 || idx == 6 || idx == 8 || idx == 10) {
      out.push_back('-');
    }
    out += std::format("{:02x}", bytes[idx]);
  }
  return out;
}

auto
base64_encode(std::string_view bytes) -> std::string
{
  if (bytes.empty()) {
    return {};
  }
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(bytes.data()),
      static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

auto
base64url_encode(std::string_view bytes) -> std::string
{
  std::string out = base64_encode(bytes);
  std::ranges::replace(out, '+', '-');
  std::ranges::replace(out, '/', '_');
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  return out;
}

auto
generate_urlsafe_token(std::size_t count) -> std::string
{
  const auto bytes = random_bytes(count);
  return base64url_encode(std::string_view(
      reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

auto
base64_decode(std::string_view text) -> std::string
{
  std::string clean;
  clean.reserve(text.size());
  for (const char chr : text) {
    if (std::isspace(static_cast<unsigned char>(chr)) == 0) {
      clean.push_back(chr);
    }
  }
  if (clean.empty()) {
    return {};
  }
  if (clean.size() % 4 != 0) {
    throw ValidationException("Invalid base64 length");
  }

  std::string out(3 * (clean.size() / 4), '\0');
  const int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(clean.data()),
      static_cast<int>(clean.size()));
  if (written < 0) {
    throw ValidationException("Invalid base64 payload");
  }
  std::size_t padding = 0;
  if (clean.ends_with("==")) {
    padding = 2;
  } else if (clean.ends_with('=')) {
    padding = 1;
  }
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

}  // namespace docpipe
