#include "token_store.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

#include "security/random_id.hpp"
#include "storage/atomic_file.hpp"
#include "storage/job_storage.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/time_utils.hpp"

namespace docpipe {

auto
token_backend_name(TokenBackend backend) -> std::string_view
{
  switch (backend) {
    case TokenBackend::Local:
      return "local";
    case TokenBackend::Remote:
      return "remote";
  }
  return "local";
}

auto
parse_token_backend(std::string_view name) -> std::optional<TokenBackend>
{
  if (name == "local") {
    return TokenBackend::Local;
  }
  if (name == "remote") {
    return TokenBackend::Remote;
  }
  return std::nullopt;
}

auto
token_kind_name(TokenKind kind) -> std::string_view
{
  using enum TokenKind;
  switch (kind) {
    case Markdown:
      return "markdown";
    case Json:
      return "json";
    case Archive:
      return "archive";
  }
  return "markdown";
}

auto
parse_token_kind(std::string_view name) -> std::optional<TokenKind>
{
  using enum TokenKind;
  for (const auto kind : {Markdown, Json, Archive}) {
    if (token_kind_name(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

auto
token_to_json(const Token& token) -> Json::Value
{
  Json::Value value{Json::objectValue};
  value["token"] = token.token;
  value["backend"] = std::string(token_backend_name(token.backend));
  value["task_id"] = token.task_id;
  value["kind"] = std::string(token_kind_name(token.kind));
  value["file_path"] = token.file_path ? Json::Value{*token.file_path}
                                       : Json::Value{Json::nullValue};
  value["object_key"] = token.object_key ? Json::Value{*token.object_key}
                                         : Json::Value{Json::nullValue};
  value["max_downloads"] = token.max_downloads;
  value["remain"] = token.remain;
  value["expire_at"] = token.expire_at;
  return value;
}

auto
token_from_json(const std::string& key, const Json::Value& value)
    -> std::optional<Token>
{
  if (!value.isObject() || !value["task_id"].isString() ||
      !value["remain"].isIntegral() || !value["expire_at"].isNumeric()) {
    return std::nullopt;
  }
  const auto backend = parse_token_backend(value["backend"].asString());
  const auto kind = parse_token_kind(value["kind"].asString());
  if (!backend || !kind) {
    return std::nullopt;
  }
  Token token;
  token.token = key;
  token.backend = *backend;
  token.task_id = value["task_id"].asString();
  token.kind = *kind;
  if (value["file_path"].isString()) {
    token.file_path = value["file_path"].asString();
  }
  if (value["object_key"].isString()) {
    token.object_key = value["object_key"].asString();
  }
  token.max_downloads = value.get("max_downloads", 1).asInt();
  token.remain = std::max(0, value["remain"].asInt());
  token.expire_at = value["expire_at"].asDouble();
  return token;
}

// =============================================================================
// TokenStore
// =============================================================================

TokenStore::TokenStore(Options options) : options_(std::move(options))
{
  if (!options_.now) {
    options_.now = [] { return std::chrono::system_clock::now(); };
  }
  if (options_.backend == TokenBackend::Remote && !options_.signer) {
    throw ValidationException("Remote download tokens need a URL signer");
  }
  std::error_code ec;
  if (const auto parent = options_.store_path.parent_path(); !parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw StorageException(std::format(
          "Cannot create token store directory {}: {}", parent.string(),
          ec.message()));
    }
  }
  load();
}

void
TokenStore::load()
{
  std::optional<Json::Value> table;
  try {
    table = read_json_file(options_.store_path);
  }
  catch (const StorageException& e) {
    log_warning(std::format("Discarding token table: {}", e.what()));
    return;
  }
  if (!table) {
    return;
  }
  if (!table->isObject()) {
    log_warning(std::format(
        "Discarding token table {}: not a JSON object",
        options_.store_path.string()));
    return;
  }
  for (const auto& key : table->getMemberNames()) {
    if (auto token = token_from_json(key, (*table)[key])) {
      tokens_.emplace(key, std::move(*token));
    } else {
      log_warning(std::format("Skipping malformed token entry '{}'", key));
    }
  }
}

void
TokenStore::commit(TokenTable table)
{
  Json::Value root{Json::objectValue};
  for (const auto& [key, token] : table) {
    root[key] = token_to_json(token);
  }
  write_json_atomic(options_.store_path, root);
  tokens_ = std::move(table);
}

auto
TokenStore::now_epoch() const -> double
{
  return time_utils::to_epoch_seconds(options_.now());
}

auto
TokenStore::is_dead(const Token& token, double now) const -> bool
{
  return token.remain <= 0 || now >= token.expire_at;
}

auto
TokenStore::create_token(
    std::string_view task_id, TokenKind kind, const std::string& locator,
    int max_uses, int ttl_seconds) -> Token
{
  validate_task_id(task_id);
  if (locator.empty()) {
    throw ValidationException("Download token needs a file path or object key");
  }

  Token token;
  token.token = generate_urlsafe_token(kTokenRandomBytes);
  token.backend = options_.backend;
  token.task_id = std::string(task_id);
  token.kind = kind;
  if (options_.backend == TokenBackend::Local) {
    token.file_path =
        validate_path_in_storage(options_.storage_root, locator).string();
  } else {
    token.object_key = locator;
  }
  token.max_downloads = std::max(1, max_uses);
  token.remain = token.max_downloads;
  token.expire_at = now_epoch() + std::max(0, ttl_seconds);

  const std::scoped_lock lock(mutex_);
  auto next = tokens_;
  next.insert_or_assign(token.token, token);
  commit(std::move(next));
  return token;
}

auto
TokenStore::delivery_target(const Token& token) const -> std::string
{
  if (token.backend == TokenBackend::Remote) {
    if (!options_.signer || !token.object_key) {
      throw ValidationException("Remote token without an object key");
    }
    return options_.signer->sign_get(
        *token.object_key, options_.sign_expire_seconds);
  }
  if (!token.file_path) {
    throw ValidationException("Local token without a file path");
  }
  return validate_path_in_storage(options_.storage_root, *token.file_path)
      .string();
}

auto
TokenStore::consume(std::string_view token) -> std::optional<ConsumedToken>
{
  const std::scoped_lock lock(mutex_);
  const auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    return std::nullopt;
  }
  auto next = tokens_;
  const auto entry = next.find(token);
  if (is_dead(it->second, now_epoch())) {
    next.erase(entry);
    commit(std::move(next));
    return std::nullopt;
  }

  auto target = delivery_target(it->second);
  --entry->second.remain;
  ConsumedToken consumed{entry->second, std::move(target)};
  commit(std::move(next));
  return consumed;
}

auto
TokenStore::purge_dead() -> std::size_t
{
  const auto now = now_epoch();
  const std::scoped_lock lock(mutex_);
  auto next = tokens_;
  const auto removed = std::erase_if(next, [this, now](const auto& entry) {
    return is_dead(entry.second, now);
  });
  if (removed > 0) {
    commit(std::move(next));
  }
  return removed;
}

auto
TokenStore::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return tokens_.size();
}

}  // namespace docpipe
