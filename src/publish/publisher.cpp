#include "publisher.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <format>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include "utils/curl_session.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace docpipe {

namespace {

struct FileCloser {
  void operator()(std::FILE* file) const noexcept { std::fclose(file); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

auto
exists(const std::filesystem::path& path) -> bool
{
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

}  // namespace

auto
content_type_for(const std::filesystem::path& file) -> std::string_view
{
  std::string ext = file.extension().string();
  std::ranges::transform(ext, ext.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });
  if (ext == ".md") {
    return "text/markdown; charset=utf-8";
  }
  if (ext == ".json") {
    return "application/json";
  }
  if (ext == ".zip") {
    return "application/zip";
  }
  if (ext == ".png") {
    return "image/png";
  }
  if (ext == ".jpg" || ext == ".jpeg") {
    return "image/jpeg";
  }
  return "application/octet-stream";
}

// =============================================================================
// LocalPublisher
// =============================================================================

auto
LocalPublisher::publish(std::string_view task_id, const JobPaths& /*paths*/)
    -> Json::Value
{
  const auto base = std::format("/v1/tasks/{}", task_id);
  Json::Value info{Json::objectValue};
  info["backend"] = "local";
  info["md_url"] = base + "/result.md";
  info["json_url"] = base + "/result.json";
  info["zip_url"] = base + "/download.zip";
  info["images_url_prefix"] = base + "/result-images";
  return info;
}

// =============================================================================
// CurlObjectUploader
// =============================================================================

CurlObjectUploader::CurlObjectUploader(
    std::shared_ptr<const UrlSigner> signer, long timeout_seconds)
    : signer_(std::move(signer)), timeout_seconds_(timeout_seconds)
{
  if (!signer_) {
    throw PublishException("Object uploader requires a URL signer");
  }
}

void
CurlObjectUploader::upload(
    const std::filesystem::path& file, std::string_view object_key,
    std::string_view content_type)
{
  std::error_code ec;
  const auto size = std::filesystem::file_size(file, ec);
  if (ec) {
    throw PublishException(
        std::format("Cannot stat {}: {}", file.string(), ec.message()));
  }
  FilePtr input(std::fopen(file.c_str(), "rb"));
  if (!input) {
    throw PublishException(std::format("Cannot open {}", file.string()));
  }

  const auto url = signer_->sign_put(object_key, content_type, 300);
  std::array<char, CURL_ERROR_SIZE> error_buffer{};
  CurlEasyPtr curl;
  try {
    curl = make_curl_easy();
  }
  catch (const std::runtime_error& e) {
    throw PublishException(e.what());
  }
  CurlSlistPtr headers(curl_slist_append(
      nullptr, std::format("Content-Type: {}", content_type).c_str()));

  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(handle, CURLOPT_READDATA, input.get());
  curl_easy_setopt(
      handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer.data());

  const CURLcode code = curl_easy_perform(handle);
  if (code != CURLE_OK) {
    throw PublishException(std::format(
        "Upload of {} failed: {}", object_key,
        curl_error_text(code, error_buffer.data())));
  }
}

// =============================================================================
// RemotePublisher
// =============================================================================

RemotePublisher::RemotePublisher(
    RuntimeConfig::PublishSettings settings,
    std::shared_ptr<const UrlSigner> signer,
    std::shared_ptr<ObjectUploader> uploader)
    : settings_(std::move(settings)), signer_(std::move(signer)),
      uploader_(std::move(uploader))
{
  if (!signer_ || !uploader_) {
    throw PublishException("Remote publisher requires a signer and an uploader");
  }
}

auto
remote_object_prefix(std::string_view prefix, std::string_view task_id)
    -> std::string
{
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.remove_suffix(1);
  }
  if (prefix.empty()) {
    return std::string(task_id);
  }
  return std::format("{}/{}", prefix, task_id);
}

auto
RemotePublisher::object_prefix(std::string_view task_id) const -> std::string
{
  return remote_object_prefix(settings_.prefix, task_id);
}

auto
RemotePublisher::publish(std::string_view task_id, const JobPaths& paths)
    -> Json::Value
{
  const auto prefix = object_prefix(task_id);
  const auto md_key = prefix + "/full.md";
  const auto json_key = prefix + "/layout.json";
  const auto zip_key = prefix + "/result.zip";

  const auto put = [this](const std::filesystem::path& file,
                          const std::string& key) -> bool {
    if (!docpipe::exists(file)) {
      return false;
    }
    uploader_->upload(file, key, content_type_for(file));
    return true;
  };

  const bool has_md = put(paths.md_file, md_key);
  const bool has_json = put(paths.json_file, json_key);
  const bool has_zip = put(paths.zip_file, zip_key);

  std::error_code ec;
  if (std::filesystem::is_directory(paths.images_dir, ec)) {
    std::vector<std::filesystem::path> images;
    for (const auto& entry :
         std::filesystem::recursive_directory_iterator(paths.images_dir, ec)) {
      if (entry.is_regular_file()) {
        images.push_back(entry.path());
      }
    }
    std::ranges::sort(images);
    for (const auto& image : images) {
      const auto rel =
          std::filesystem::relative(image, paths.output_dir).generic_string();
      put(image, std::format("{}/{}", prefix, rel));
    }
  }

  const auto sign = [this](bool present, const std::string& key) {
    return present ? signer_->sign_get(key, settings_.sign_expire_seconds)
                   : std::string{};
  };

  Json::Value info{Json::objectValue};
  info["backend"] = "remote";
  info["md_url"] = sign(has_md, md_key);
  info["json_url"] = sign(has_json, json_key);
  info["zip_url"] = sign(has_zip, zip_key);
  info["images_url_prefix"] =
      std::format("oss://{}/{}/images/", settings_.bucket, prefix);
  return info;
}

auto
make_url_signer(const RuntimeConfig::PublishSettings& settings)
    -> std::shared_ptr<const UrlSigner>
{
  return std::make_shared<const UrlSigner>(UrlSignerSettings{
      .endpoint = settings.endpoint,
      .bucket = settings.bucket,
      .access_key_id = settings.access_key_id,
      .access_key_secret = settings.access_key_secret});
}

auto
make_publisher(const RuntimeConfig& cfg) -> std::unique_ptr<Publisher>
{
  if (cfg.publish.backend == "remote") {
    auto signer = make_url_signer(cfg.publish);
    auto uploader = std::make_shared<CurlObjectUploader>(
        signer, static_cast<long>(cfg.limits.download_timeout_seconds));
    log_info(
        cfg.verbosity,
        std::format(
            "Publishing results to bucket '{}' under '{}'", cfg.publish.bucket,
            cfg.publish.prefix));
    return std::make_unique<RemotePublisher>(
        cfg.publish, std::move(signer), std::move(uploader));
  }
  return std::make_unique<LocalPublisher>();
}

}  // namespace docpipe
