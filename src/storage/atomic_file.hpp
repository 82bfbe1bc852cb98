#pragma once

#include <json/json.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace docpipe {

// =============================================================================
// Crash-safe file replacement
// -----------------------------------------------------------------------------
// Contents are written to a sibling temporary file which is then renamed over
// the target, so readers observe either the previous or the new file and never
// a truncated one. Failures raise StorageException and leave no temp file.
// =============================================================================

void write_file_atomic(
    const std::filesystem::path& target, std::string_view contents);

void write_json_atomic(
    const std::filesystem::path& target, const Json::Value& value);

auto read_text_file(const std::filesystem::path& path) -> std::string;

// Returns std::nullopt when the file does not exist. Malformed JSON raises
// StorageException.
auto read_json_file(const std::filesystem::path& path)
    -> std::optional<Json::Value>;

auto to_json_string(const Json::Value& value) -> std::string;

}  // namespace docpipe
