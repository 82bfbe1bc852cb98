#pragma once

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "security/url_signer.hpp"

namespace docpipe {

enum class TokenBackend : std::uint8_t { Local, Remote };
enum class TokenKind : std::uint8_t { Markdown, Json, Archive };

auto token_backend_name(TokenBackend backend) -> std::string_view;
auto parse_token_backend(std::string_view name) -> std::optional<TokenBackend>;
auto token_kind_name(TokenKind kind) -> std::string_view;
auto parse_token_kind(std::string_view name) -> std::optional<TokenKind>;

inline constexpr std::size_t kTokenRandomBytes = 32;

struct Token {
  std::string token;
  TokenBackend backend = TokenBackend::Local;
  std::string task_id;
  TokenKind kind = TokenKind::Markdown;
  std::optional<std::string> file_path;
  std::optional<std::string> object_key;
  int max_downloads = 1;
  int remain = 1;
  double expire_at = 0.0;  // epoch seconds
};

auto token_to_json(const Token& token) -> Json::Value;
auto token_from_json(const std::string& key, const Json::Value& value)
    -> std::optional<Token>;

// A successful consume(): the token after the decrement and where to send the
// client. For remote tokens `target` is a freshly signed URL, for local ones a
// file path inside the storage root.
struct ConsumedToken {
  Token token;
  std::string target;
};

// =============================================================================
// TokenStore: count and time limited download capabilities
// -----------------------------------------------------------------------------
// The whole table lives in memory and is rewritten to `store_path` (temp file
// + rename) after every change, before the call returns. A token is dead once
// `remain` reaches zero or `now >= expire_at`; dead tokens are purged when
// they are next looked up.
// =============================================================================
class TokenStore {
 public:
  using TimeSource = std::function<std::chrono::system_clock::time_point()>;

  struct Options {
    std::filesystem::path store_path;
    std::filesystem::path storage_root;
    TokenBackend backend = TokenBackend::Local;
    std::shared_ptr<const UrlSigner> signer;
    int sign_expire_seconds = 3600;
    TimeSource now;
  };

  explicit TokenStore(Options options);

  // `locator` is a file path (local) or an object key (remote). Throws
  // PathValidationException for local paths outside the storage root.
  auto create_token(
      std::string_view task_id, TokenKind kind, const std::string& locator,
      int max_uses, int ttl_seconds) -> Token;

  [[nodiscard]] auto consume(std::string_view token)
      -> std::optional<ConsumedToken>;

  auto purge_dead() -> std::size_t;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto backend() const noexcept -> TokenBackend
  {
    return options_.backend;
  }

 private:
  using TokenTable = std::map<std::string, Token, std::less<>>;

  void load();
  // Writes `table` to disk, then makes it the in-memory table. On a write
  // failure the in-memory table is left untouched.
  void commit(TokenTable table);
  [[nodiscard]] auto now_epoch() const -> double;
  [[nodiscard]] auto is_dead(const Token& token, double now) const -> bool;
  [[nodiscard]] auto delivery_target(const Token& token) const -> std::string;

  Options options_;
  mutable std::mutex mutex_;
  TokenTable tokens_;
};

}  // namespace docpipe
