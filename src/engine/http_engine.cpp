#include "http_engine.hpp"

#include <curl/curl.h>

#include <array>
#include <format>
#include <memory>
#include <stdexcept>
#include <utility>

#include "core/page_ranges.hpp"
#include "security/random_id.hpp"
#include "storage/atomic_file.hpp"
#include "utils/curl_session.hpp"
#include "utils/exceptions.hpp"

namespace docpipe {

namespace {

auto
append_body(char* data, std::size_t size, std::size_t nmemb, void* userp)
    -> std::size_t
{
  auto* body = static_cast<std::string*>(userp);
  body->append(data, size * nmemb);
  return size * nmemb;
}

auto
optional_string(const std::optional<std::string>& value) -> Json::Value
{
  return value ? Json::Value{*value} : Json::Value{Json::nullValue};
}

auto
parse_json(const std::string& body) -> Json::Value
{
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
    throw EngineExecutionException(
        std::format("Inference server sent invalid JSON: {}", errors));
  }
  return root;
}

}  // namespace

auto
build_predict_request(
    const std::string& document_bytes, const std::string& filename,
    const PredictOptions& options, ComputeDevice device) -> Json::Value
{
  Json::Value request{Json::objectValue};
  request["document"] = base64_encode(document_bytes);
  request["filename"] = filename;
  request["is_ocr"] = options.is_ocr;
  request["enable_formula"] = options.enable_formula;
  request["enable_table"] = options.enable_table;
  request["language"] = options.language;
  request["page_ranges"] = optional_string(options.page_ranges);
  request["model_version"] = optional_string(options.model_version);
  request["device"] = std::string(compute_device_name(device));
  return request;
}

auto
parse_predict_response(const std::string& body, const PredictOptions& options)
    -> std::vector<PageResult>
{
  const auto root = parse_json(body);
  if (!root.isObject() || !root["pages"].isArray()) {
    throw EngineExecutionException(
        "Inference server response has no \"pages\" array");
  }

  std::vector<int> requested;
  if (options.page_ranges) {
    try {
      requested = parse_page_ranges(*options.page_ranges);
    }
    catch (const ValidationException& e) {
      throw EngineExecutionException(e.what());
    }
  }

  std::vector<PageResult> pages;
  const auto& items = root["pages"];
  pages.reserve(items.size());
  for (Json::ArrayIndex i = 0; i < items.size(); ++i) {
    const auto& item = items[i];
    if (!item.isObject()) {
      throw EngineExecutionException(
          std::format("Page entry {} is not an object", i));
    }
    PageResult page;
    if (item["page_index"].isIntegral()) {
      page.page_index = item["page_index"].asInt();
    } else if (i < requested.size()) {
      page.page_index = requested[i];
    } else {
      page.page_index = static_cast<int>(i) + 1;
    }
    if (page.page_index < 1) {
      throw EngineExecutionException(
          std::format("Invalid page_index {}", page.page_index));
    }
    page.payload = item.get("res", Json::Value{Json::objectValue});
    page.markdown = item.get("markdown", "").asString();
    if (const auto& images = item["images"]; images.isObject()) {
      for (const auto& image_name : images.getMemberNames()) {
        try {
          page.images.emplace(
              image_name, base64_decode(images[image_name].asString()));
        }
        catch (const ValidationException& e) {
          throw EngineExecutionException(std::format(
              "Image '{}' on page {}: {}", image_name, page.page_index,
              e.what()));
        }
      }
    }
    pages.push_back(std::move(page));
  }
  return pages;
}

// =============================================================================
// HttpEngine
// =============================================================================

HttpEngine::HttpEngine(
    RuntimeConfig::EngineSettings settings, ComputeDevice device)
    : settings_(std::move(settings)), device_(device)
{
  std::string_view endpoint = settings_.endpoint;
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.remove_suffix(1);
  }
  if (endpoint.empty()) {
    throw EngineLoadException("engine.endpoint is not configured");
  }
  base_url_ = std::string(endpoint);
}

void
HttpEngine::probe() const
{
  std::array<char, CURL_ERROR_SIZE> error_buffer{};
  CurlEasyPtr curl;
  try {
    curl = make_curl_easy();
  }
  catch (const std::runtime_error& e) {
    throw EngineLoadException(e.what());
  }
  std::string body;
  const auto url = base_url_ + "/health";
  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT, 10L);
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer.data());
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);
  const CURLcode code = curl_easy_perform(handle);
  if (code != CURLE_OK) {
    throw EngineLoadException(std::format(
        "Inference server {} unavailable: {}", url,
        curl_error_text(code, error_buffer.data())));
  }
}

auto
HttpEngine::post_json(const std::string& url, const std::string& body) const
    -> std::string
{
  std::array<char, CURL_ERROR_SIZE> error_buffer{};
  CurlEasyPtr curl;
  try {
    curl = make_curl_easy();
  }
  catch (const std::runtime_error& e) {
    throw EngineExecutionException(e.what());
  }
  CurlSlistPtr headers(
      curl_slist_append(nullptr, "Content-Type: application/json"));

  std::string response;
  CURL* handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_POST, 1L);
  curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.data());
  curl_easy_setopt(
      handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(
      handle, CURLOPT_TIMEOUT,
      static_cast<long>(settings_.request_timeout_seconds));
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer.data());
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response);

  const CURLcode code = curl_easy_perform(handle);
  if (code != CURLE_OK) {
    throw EngineExecutionException(std::format(
        "Request to {} failed: {}", url,
        curl_error_text(code, error_buffer.data())));
  }
  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    constexpr std::size_t kMaxDetail = 512;
    throw EngineExecutionException(std::format(
        "Inference server answered HTTP {}: {}", status,
        response.substr(0, kMaxDetail)));
  }
  return response;
}

auto
HttpEngine::predict(
    const std::filesystem::path& input,
    const PredictOptions& options) -> std::vector<PageResult>
{
  std::string document;
  try {
    document = read_text_file(input);
  }
  catch (const StorageException& e) {
    throw EngineExecutionException(e.what());
  }
  const auto request = build_predict_request(
      document, input.filename().string(), options, device_);
  const auto response =
      post_json(base_url_ + "/predict", to_json_string(request));
  return parse_predict_response(response, options);
}

void
register_builtin_backends(EngineRegistry& registry)
{
  registry.register_backend(
      std::string(kHttpBackendName), [](const EngineBuildContext& context) {
        auto engine =
            std::make_unique<HttpEngine>(context.settings, context.device);
        engine->probe();
        return engine;
      });
}

}  // namespace docpipe
