#include "atomic_file.hpp"

#include <unistd.h>

#include <atomic>
#include <format>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

#include "utils/exceptions.hpp"

namespace docpipe {

namespace {

auto
temp_sibling(const std::filesystem::path& target) -> std::filesystem::path
{
  static std::atomic<unsigned long long> counter{0};
  const auto serial = counter.fetch_add(1, std::memory_order_relaxed);
  auto name = std::format(
      ".{}.{}.{}.tmp", target.filename().string(), ::getpid(), serial);
  return target.parent_path() / name;
}

void
remove_quietly(const std::filesystem::path& path)
{
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

void
write_file_atomic(const std::filesystem::path& target, std::string_view contents)
{
  const auto tmp = temp_sibling(target);
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw StorageException(
          std::format("Cannot open temporary file for {}", target.string()));
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
      out.close();
      remove_quietly(tmp);
      throw StorageException(
          std::format("Failed to write {}", target.string()));
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    remove_quietly(tmp);
    throw StorageException(std::format(
        "Failed to replace {}: {}", target.string(), ec.message()));
  }
}

auto
to_json_string(const Json::Value& value) -> std::string
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

void
write_json_atomic(const std::filesystem::path& target, const Json::Value& value)
{
  write_file_atomic(target, to_json_string(value));
}

auto
read_text_file(const std::filesystem::path& path) -> std::string
{
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    throw StorageException(std::format("Cannot open {}", path.string()));
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  return buffer.str();
}

auto
read_json_file(const std::filesystem::path& path) -> std::optional<Json::Value>
{
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  const std::string text = read_text_file(path);

  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    throw StorageException(
        std::format("Malformed JSON in {}: {}", path.string(), errors));
  }
  return root;
}

}  // namespace docpipe
