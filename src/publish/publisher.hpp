#pragma once

#include <json/json.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "security/url_signer.hpp"
#include "storage/job_storage.hpp"
#include "utils/runtime_config.hpp"

namespace docpipe {

// =============================================================================
// Publisher: makes the artifacts of a finished job reachable
// -----------------------------------------------------------------------------
// publish() returns the document stored under "published" in the job status:
// {backend, md_url, json_url, zip_url, images_url_prefix}. Failures are
// reported as PublishException.
// =============================================================================
class Publisher {
 public:
  Publisher() = default;
  Publisher(const Publisher&) = delete;
  auto operator=(const Publisher&) -> Publisher& = delete;
  Publisher(Publisher&&) = delete;
  auto operator=(Publisher&&) -> Publisher& = delete;
  virtual ~Publisher() = default;

  virtual auto publish(std::string_view task_id, const JobPaths& paths)
      -> Json::Value = 0;
  [[nodiscard]] virtual auto backend() const -> std::string_view = 0;
};

// Service-relative download URLs; nothing leaves the machine.
class LocalPublisher : public Publisher {
 public:
  auto publish(std::string_view task_id, const JobPaths& paths)
      -> Json::Value override;
  [[nodiscard]] auto backend() const -> std::string_view override
  {
    return "local";
  }
};

// Transfer of one file to the object store.
class ObjectUploader {
 public:
  ObjectUploader() = default;
  ObjectUploader(const ObjectUploader&) = delete;
  auto operator=(const ObjectUploader&) -> ObjectUploader& = delete;
  ObjectUploader(ObjectUploader&&) = delete;
  auto operator=(ObjectUploader&&) -> ObjectUploader& = delete;
  virtual ~ObjectUploader() = default;

  virtual void upload(
      const std::filesystem::path& file, std::string_view object_key,
      std::string_view content_type) = 0;
};

// PUT to a pre-signed URL with libcurl.
class CurlObjectUploader : public ObjectUploader {
 public:
  CurlObjectUploader(std::shared_ptr<const UrlSigner> signer, long timeout_seconds);

  void upload(
      const std::filesystem::path& file, std::string_view object_key,
      std::string_view content_type) override;

 private:
  std::shared_ptr<const UrlSigner> signer_;
  long timeout_seconds_;
};

// Uploads full.md, layout.json, result.zip and the images under
// "<prefix>/<task_id>/" and answers with signed GET URLs.
class RemotePublisher : public Publisher {
 public:
  RemotePublisher(
      RuntimeConfig::PublishSettings settings,
      std::shared_ptr<const UrlSigner> signer,
      std::shared_ptr<ObjectUploader> uploader);

  auto publish(std::string_view task_id, const JobPaths& paths)
      -> Json::Value override;
  [[nodiscard]] auto backend() const -> std::string_view override
  {
    return "remote";
  }

  [[nodiscard]] auto object_prefix(std::string_view task_id) const
      -> std::string;

 private:
  RuntimeConfig::PublishSettings settings_;
  std::shared_ptr<const UrlSigner> signer_;
  std::shared_ptr<ObjectUploader> uploader_;
};

// "<prefix>/<task_id>" with trailing slashes of the prefix removed.
auto remote_object_prefix(std::string_view prefix, std::string_view task_id)
    -> std::string;

auto content_type_for(const std::filesystem::path& file) -> std::string_view;

auto make_url_signer(const RuntimeConfig::PublishSettings& settings)
    -> std::shared_ptr<const UrlSigner>;

// Publisher for the configured backend; remote uses CurlObjectUploader.
auto make_publisher(const RuntimeConfig& cfg) -> std::unique_ptr<Publisher>;

}  // namespace docpipe
