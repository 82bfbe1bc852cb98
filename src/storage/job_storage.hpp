#pragma once

#include <json/json.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace docpipe {

inline constexpr std::string_view kStatusFileName = "job_status.json";
inline constexpr std::string_view kTmpDirName = "tmp";
inline constexpr std::string_view kInboxDirName = "inbox";

// =============================================================================
// On-disk layout of one job:
//
//   <root>/<task_id>/input.<ext>
//                   /output/full.md
//                   /output/layout.json
//                   /output/images/
//                   /result.zip
//                   /job_status.json
// =============================================================================
struct JobPaths {
  std::filesystem::path root;
  std::filesystem::path input_file;
  std::filesystem::path output_dir;
  std::filesystem::path images_dir;
  std::filesystem::path md_file;
  std::filesystem::path json_file;
  std::filesystem::path zip_file;
  std::filesystem::path status_file;
};

auto init_storage(const std::filesystem::path& root) -> std::filesystem::path;

// Allocates a fresh task id and creates its directory tree. The input suffix
// is taken from `filename` when it is one of .pdf .png .jpg .jpeg, otherwise
// ".pdf".
auto new_job(const std::filesystem::path& root, std::string_view filename)
    -> std::pair<std::string, JobPaths>;

// Paths of an existing job. Throws InvalidTaskIdException for malformed ids.
auto get_job_paths(const std::filesystem::path& root, std::string_view task_id)
    -> JobPaths;

auto input_suffix_for(std::string_view filename) -> std::string;
[[nodiscard]] auto is_supported_input(std::string_view filename) -> bool;

void save_status(const JobPaths& paths, const Json::Value& status);
auto load_status(const std::filesystem::path& root, std::string_view task_id)
    -> std::optional<Json::Value>;

// Keeps the `max_retention` most recently modified job directories and
// removes the rest. Returns the number of directories removed.
auto cleanup_old_jobs(
    const std::filesystem::path& root, std::size_t max_retention)
    -> std::size_t;

auto remove_job(const std::filesystem::path& root, std::string_view task_id)
    -> bool;

[[nodiscard]] auto is_valid_task_id(std::string_view task_id) -> bool;
void validate_task_id(std::string_view task_id);

// Resolves `target` and throws PathValidationException unless it lies inside
// the resolved storage root.
auto validate_path_in_storage(
    const std::filesystem::path& root, const std::filesystem::path& target)
    -> std::filesystem::path;

}  // namespace docpipe
