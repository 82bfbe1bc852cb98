#include "url_signer.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <chrono>
#include <format>
#include <stdexcept>
#include <utility>

#include "random_id.hpp"
#include "utils/exceptions.hpp"

namespace docpipe {

namespace {

auto
hmac_sha1(std::string_view key, std::string_view message) -> std::string
{
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  const unsigned char* result = HMAC(
      EVP_sha1(), key.data(), static_cast<int>(key.size()),
      reinterpret_cast<const unsigned char*>(message.data()), message.size(),
      digest.data(), &digest_len);
  if (result == nullptr) {
    throw std::runtime_error("HMAC-SHA1 computation failed");
  }
  return {reinterpret_cast<const char*>(digest.data()), digest_len};
}

auto
strip_slashes(std::string_view key) -> std::string_view
{
  while (!key.empty() && key.front() == '/') {
    key.remove_prefix(1);
  }
  return key;
}

auto
epoch_now() -> std::int64_t
{
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

auto
url_encode(std::string_view text, bool keep_slash) -> std::string
{
  std::string out;
  out.reserve(text.size() * 3);
  for (const char raw : text) {
    const auto chr = static_cast<unsigned char>(raw);
    const bool unreserved = (chr >= 'A' && chr <= 'Z') ||
                            (chr >= 'a' && chr <= 'z') ||
                            (chr >= '0' && chr <= '9') || chr == '-' ||
                            chr == '_' || chr == '.' || chr == '~';
    if (unreserved || (keep_slash && chr == '/')) {
      out.push_back(raw);
    } else {
      out += std::format("%{:02X}", chr);
    }
  }
  return out;
}

UrlSigner::UrlSigner(UrlSignerSettings settings)
    : settings_(std::move(settings))
{
  if (settings_.endpoint.empty() || settings_.bucket.empty() ||
      settings_.access_key_id.empty() || settings_.access_key_secret.empty()) {
    throw ValidationException(
        "Incomplete object store settings: endpoint, bucket, access_key_id "
        "and access_key_secret are required");
  }
  std::string_view endpoint = settings_.endpoint;
  scheme_ = "https";
  if (const auto pos = endpoint.find("://"); pos != std::string_view::npos) {
    scheme_ = std::string(endpoint.substr(0, pos));
    endpoint.remove_prefix(pos + 3);
  }
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.remove_suffix(1);
  }
  host_ = std::string(endpoint);
}

auto
UrlSigner::signature(std::string_view object_key, std::int64_t expires_epoch)
    const -> std::string
{
  return signature_for("GET", "", object_key, expires_epoch);
}

auto
UrlSigner::signature_for(
    std::string_view verb, std::string_view content_type,
    std::string_view object_key, std::int64_t expires_epoch) const
    -> std::string
{
  const auto string_to_sign = std::format(
      "{}\n\n{}\n{}\n/{}/{}", verb, content_type, expires_epoch,
      settings_.bucket, strip_slashes(object_key));
  return base64_encode(hmac_sha1(settings_.access_key_secret, string_to_sign));
}

auto
UrlSigner::object_url(std::string_view object_key) const -> std::string
{
  return std::format(
      "{}://{}.{}/{}", scheme_, settings_.bucket, host_,
      url_encode(strip_slashes(object_key), true));
}

auto
UrlSigner::sign_get_at(std::string_view object_key, std::int64_t expires_epoch)
    const -> std::string
{
  return std::format(
      "{}?OSSAccessKeyId={}&Expires={}&Signature={}", object_url(object_key),
      url_encode(settings_.access_key_id), expires_epoch,
      url_encode(signature(object_key, expires_epoch)));
}

auto
UrlSigner::sign_get(std::string_view object_key, int expire_seconds) const
    -> std::string
{
  return sign_get_at(object_key, epoch_now() + expire_seconds);
}

auto
UrlSigner::sign_put(
    std::string_view object_key, std::string_view content_type,
    int expire_seconds) const -> std::string
{
  const auto expires = epoch_now() + expire_seconds;
  return std::format(
      "{}?OSSAccessKeyId={}&Expires={}&Signature={}", object_url(object_key),
      url_encode(settings_.access_key_id), expires,
      url_encode(signature_for("PUT", content_type, object_key, expires)));
}

}  // namespace docpipe
