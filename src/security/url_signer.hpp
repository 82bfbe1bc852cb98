#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace docpipe {

struct UrlSignerSettings {
  std::string endpoint;  // "oss-cn-hangzhou.aliyuncs.com" or with a scheme
  std::string bucket;
  std::string access_key_id;
  std::string access_key_secret;
};

// =============================================================================
// UrlSigner: query-string signed GET URLs for an OSS-compatible object store
// -----------------------------------------------------------------------------
// StringToSign = "GET\n\n\n<expires>\n/<bucket>/<key>",
// Signature    = base64(HMAC-SHA1(secret, StringToSign)).
// =============================================================================
class UrlSigner {
 public:
  explicit UrlSigner(UrlSignerSettings settings);

  [[nodiscard]] auto sign_get(
      std::string_view object_key, int expire_seconds) const -> std::string;
  [[nodiscard]] auto sign_get_at(
      std::string_view object_key, std::int64_t expires_epoch) const
      -> std::string;

  [[nodiscard]] auto signature(
      std::string_view object_key, std::int64_t expires_epoch) const
      -> std::string;
  [[nodiscard]] auto object_url(std::string_view object_key) const
      -> std::string;

  // Signed URL accepting a single PUT of `content_type` until it expires.
  [[nodiscard]] auto sign_put(
      std::string_view object_key, std::string_view content_type,
      int expire_seconds) const -> std::string;

 private:
  [[nodiscard]] auto signature_for(
      std::string_view verb, std::string_view content_type,
      std::string_view object_key, std::int64_t expires_epoch) const
      -> std::string;

  UrlSignerSettings settings_;
  std::string scheme_;
  std::string host_;
};

// RFC 3986 percent-encoding. When keep_slash is true '/' is left as is.
auto url_encode(std::string_view text, bool keep_slash = false) -> std::string;

}  // namespace docpipe
