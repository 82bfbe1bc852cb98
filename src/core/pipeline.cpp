#include "pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <fstream>
#include <system_error>
#include <utility>

#include "core/page_ranges.hpp"
#include "storage/atomic_file.hpp"
#include "storage/remote_fetch.hpp"
#include "storage/zip_archive.hpp"
#include "utils/exceptions.hpp"
#include "utils/pdf_inspector.hpp"

namespace docpipe {

namespace {

auto
has_pdf_suffix(const std::filesystem::path& path) -> bool
{
  std::string ext = path.extension().string();
  std::ranges::transform(ext, ext.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });
  return ext == ".pdf";
}

auto
is_blank(std::string_view text) -> bool
{
  return std::ranges::all_of(text, [](unsigned char chr) {
    return std::isspace(chr) != 0;
  });
}

auto
is_reference_boundary(char chr) -> bool
{
  return chr == '(' || chr == '"' || chr == '\'' || chr == ' ' ||
         chr == '=' || chr == '<' || chr == '\n' || chr == '\t' || chr == '[';
}

// Replaces `from` with `to` wherever `from` starts a path reference.
void
replace_reference(std::string& text, const std::string& from, const std::string& to)
{
  if (from.empty() || from == to) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    if (pos == 0 || is_reference_boundary(text[pos - 1])) {
      text.replace(pos, from.size(), to);
      pos += to.size();
    } else {
      pos += from.size();
    }
  }
}

}  // namespace

auto
to_predict_options(
    const JobOptions& options, const std::optional<std::string>& range)
    -> PredictOptions
{
  PredictOptions predict;
  predict.is_ocr = options.is_ocr;
  predict.enable_formula = options.enable_formula;
  predict.enable_table = options.enable_table;
  predict.language = options.language;
  predict.page_ranges = range;
  predict.model_version = options.model_version;
  return predict;
}

// =============================================================================
// ArtifactWriter
// =============================================================================

ArtifactWriter::ArtifactWriter(JobPaths paths) : paths_(std::move(paths))
{
  layout_["pages"] = Json::Value{Json::arrayValue};
  std::error_code ec;
  std::filesystem::create_directories(paths_.images_dir, ec);
  if (ec) {
    throw StorageException(std::format(
        "Cannot create {}: {}", paths_.images_dir.string(), ec.message()));
  }
  write_json_atomic(paths_.json_file, layout_);
}

auto
ArtifactWriter::sanitize_image_name(const std::string& key)
    -> std::optional<std::string>
{
  std::string normalized = key;
  std::ranges::replace(normalized, '\\', '/');
  const auto base = std::filesystem::path(normalized).filename().string();
  if (base.empty() || base == "." || base == "..") {
    return std::nullopt;
  }
  return base;
}

auto
ArtifactWriter::namespaced_image_name(int page_index, const std::string& base)
    -> std::string
{
  return std::format("page_{:04d}_{}", page_index, base);
}

void
ArtifactWriter::append(const PageResult& page)
{
  std::string markdown = page.markdown;
  for (const auto& [key, bytes] : page.images) {
    const auto base = sanitize_image_name(key);
    if (!base) {
      log_warning(std::format(
          "Skipping image with unusable name '{}' on page {}", key,
          page.page_index));
      continue;
    }
    const auto name = namespaced_image_name(page.page_index, *base);
    write_file_atomic(paths_.images_dir / name, bytes);

    const std::string target = "images/" + name;
    replace_reference(markdown, key, target);
    replace_reference(markdown, "images/" + *base, target);
  }

  Json::Value entry{Json::objectValue};
  entry["page_index"] = page.page_index;
  entry["res"] = page.payload;
  layout_["pages"].append(entry);
  write_json_atomic(paths_.json_file, layout_);

  markdown_parts_.push_back(std::move(markdown));
}

void
ArtifactWriter::finish()
{
  std::string combined;
  for (const auto& part : markdown_parts_) {
    if (is_blank(part)) {
      continue;
    }
    if (!combined.empty()) {
      combined += "\n\n";
    }
    combined += part;
  }
  write_file_atomic(paths_.md_file, combined);
}

// =============================================================================
// Pipeline
// =============================================================================

Pipeline::Pipeline(
    const RuntimeConfig& cfg, ResourceManager& resources,
    PageCounter page_counter)
    : limits_(cfg.limits), max_upload_bytes_(max_upload_bytes(cfg)),
      batching_(cfg.batching),
      acquire_timeout_(
          std::chrono::seconds(cfg.scheduling.acquire_timeout_seconds)),
      verbosity_(cfg.verbosity), resources_(resources),
      page_counter_(std::move(page_counter))
{
  if (!page_counter_) {
    page_counter_ = [](const std::filesystem::path& path) {
      return pdf_page_count(path);
    };
  }
}

auto
Pipeline::materialize(
    const std::string& input_ref, bool is_url,
    const JobPaths& paths) const -> std::filesystem::path
{
  if (!is_url) {
    return input_ref;
  }
  FetchLimits fetch;
  fetch.max_bytes = max_upload_bytes_;
  fetch.timeout_seconds = limits_.download_timeout_seconds;
  fetch.chunk_bytes =
      static_cast<std::size_t>(std::max(1, limits_.download_chunk_mb)) *
      kBytesPerMiB;
  const auto bytes = fetch_to_file(input_ref, paths.input_file, fetch);
  log_debug(
      verbosity_,
      std::format("Downloaded {} bytes to {}", bytes, paths.input_file.string()));
  return paths.input_file;
}

auto
Pipeline::validate(const std::filesystem::path& input) const
    -> std::optional<int>
{
  std::error_code ec;
  const auto size = std::filesystem::file_size(input, ec);
  if (ec) {
    throw ValidationException(
        std::format("Input file not readable: {}", input.string()));
  }
  if (size > max_upload_bytes_) {
    throw FileTooLargeException(std::format(
        "File size exceeds the {} MB limit", limits_.max_upload_mb));
  }

  if (!has_pdf_suffix(input)) {
    return std::nullopt;
  }
  const auto pages = page_counter_(input);
  if (pages && *pages > limits_.max_pages) {
    throw PageLimitExceededException(std::format(
        "PDF has {} pages, more than the {} page limit", *pages,
        limits_.max_pages));
  }
  return pages;
}

auto
Pipeline::plan(
    const std::filesystem::path& input, std::optional<int> page_count,
    const JobOptions& options) const -> std::vector<std::optional<std::string>>
{
  const bool batched = batching_.enable_auto_batch && has_pdf_suffix(input) &&
                       page_count &&
                       *page_count > batching_.batch_page_size &&
                       !options.page_ranges;
  if (!batched) {
    return {options.page_ranges};
  }
  std::vector<std::optional<std::string>> plan;
  for (auto& range : make_batch_ranges(*page_count, batching_.batch_page_size)) {
    plan.emplace_back(std::move(range));
  }
  return plan;
}

void
Pipeline::run(
    const std::string& input_ref, bool is_url, const JobPaths& paths,
    const JobOptions& options)
{
  const auto input = materialize(input_ref, is_url, paths);
  const auto page_count = validate(input);
  if (options.page_ranges) {
    static_cast<void>(parse_page_ranges(*options.page_ranges, page_count));
  }
  const auto batches = plan(input, page_count, options);

  log_info(
      verbosity_,
      std::format(
          "Pipeline start: pages={} batches={} url={} model_version={} "
          "formula={} table={} bbox={} lang={}",
          page_count ? std::to_string(*page_count) : "unknown", batches.size(),
          is_url, options.model_version.value_or("default"),
          options.enable_formula, options.enable_table, options.bbox,
          options.language));
  const auto started = std::chrono::steady_clock::now();

  ArtifactWriter writer(paths);
  for (const auto& range : batches) {
    run_batch(input, range, options, writer);
  }
  writer.finish();

  if (options.pack_zip) {
    const auto entries = pack_directory(paths.output_dir, paths.zip_file);
    log_debug(
        verbosity_, std::format(
                        "Packed {} files into {}", entries,
                        paths.zip_file.string()));
  }

  const auto elapsed = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - started)
                           .count();
  log_info(
      verbosity_, std::format(
                      "Pipeline done: {} pages in {:.2f}s", writer.page_count(),
                      elapsed));
}

void
Pipeline::run_batch(
    const std::filesystem::path& input, const std::optional<std::string>& range,
    const JobOptions& options, ArtifactWriter& writer)
{
  std::vector<PageResult> pages;
  {
    auto lease = resources_.acquire(acquire_timeout_);
    log_debug(
        verbosity_, std::format(
                        "Running {} on range {}", lease->name(),
                        range.value_or("all")));
    pages = lease->predict(input, to_predict_options(options, range));
  }
  for (const auto& page : pages) {
    writer.append(page);
  }
}

}  // namespace docpipe
