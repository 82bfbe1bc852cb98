#include "job_storage.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <iterator>
#include <ranges>
#include <system_error>
#include <vector>

#include "atomic_file.hpp"
#include "security/random_id.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace docpipe {

namespace {

constexpr std::array<std::string_view, 4> kInputSuffixes{
    ".pdf", ".png", ".jpg", ".jpeg"};

auto
make_paths(const std::filesystem::path& job_root, const std::string& suffix)
    -> JobPaths
{
  JobPaths paths;
  paths.root = job_root;
  paths.input_file = job_root / ("input" + suffix);
  paths.output_dir = job_root / "output";
  paths.images_dir = paths.output_dir / "images";
  paths.md_file = paths.output_dir / "full.md";
  paths.json_file = paths.output_dir / "layout.json";
  paths.zip_file = job_root / "result.zip";
  paths.status_file = job_root / kStatusFileName;
  return paths;
}

auto
is_within(const std::filesystem::path& root, const std::filesystem::path& target)
    -> bool
{
  auto root_it = root.begin();
  auto target_it = target.begin();
  for (; root_it != root.end(); ++root_it, ++target_it) {
    if (root_it->empty() && std::next(root_it) == root.end()) {
      // trailing separator in root
      return true;
    }
    if (target_it == target.end() || *root_it != *target_it) {
      return false;
    }
  }
  return true;
}

}  // namespace

auto
init_storage(const std::filesystem::path& root) -> std::filesystem::path
{
  std::error_code ec;
  std::filesystem::create_directories(root / kTmpDirName, ec);
  if (ec) {
    throw StorageException(std::format(
        "Cannot initialise storage root {}: {}", root.string(), ec.message()));
  }
  return root;
}

auto
input_suffix_for(std::string_view filename) -> std::string
{
  std::string ext = std::filesystem::path(filename).extension().string();
  std::ranges::transform(ext, ext.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });
  if (std::ranges::find(kInputSuffixes, ext) == kInputSuffixes.end()) {
    return ".pdf";
  }
  return ext;
}

auto
is_supported_input(std::string_view filename) -> bool
{
  std::string ext = std::filesystem::path(filename).extension().string();
  std::ranges::transform(ext, ext.begin(), [](unsigned char chr) {
    return static_cast<char>(std::tolower(chr));
  });
  return std::ranges::find(kInputSuffixes, ext) != kInputSuffixes.end();
}

auto
new_job(const std::filesystem::path& root, std::string_view filename)
    -> std::pair<std::string, JobPaths>
{
  std::string task_id = generate_uuid_v4();
  auto paths = make_paths(root / task_id, input_suffix_for(filename));

  std::error_code ec;
  std::filesystem::create_directories(paths.images_dir, ec);
  if (ec) {
    throw StorageException(std::format(
        "Cannot create job directory {}: {}", paths.root.string(),
        ec.message()));
  }
  return {std::move(task_id), std::move(paths)};
}

auto
get_job_paths(const std::filesystem::path& root, std::string_view task_id)
    -> JobPaths
{
  validate_task_id(task_id);
  const auto job_root = root / std::string(task_id);
  for (const auto suffix : kInputSuffixes) {
    const auto candidate = job_root / ("input" + std::string(suffix));
    if (std::error_code ec; std::filesystem::exists(candidate, ec)) {
      return make_paths(job_root, std::string(suffix));
    }
  }
  return make_paths(job_root, ".pdf");
}

void
save_status(const JobPaths& paths, const Json::Value& status)
{
  write_json_atomic(paths.status_file, status);
}

auto
load_status(const std::filesystem::path& root, std::string_view task_id)
    -> std::optional<Json::Value>
{
  validate_task_id(task_id);
  try {
    return read_json_file(root / std::string(task_id) / kStatusFileName);
  }
  catch (const StorageException& e) {
    log_warning(e.what());
    return std::nullopt;
  }
}

auto
cleanup_old_jobs(const std::filesystem::path& root, std::size_t max_retention)
    -> std::size_t
{
  struct Entry {
    std::filesystem::path path;
    std::filesystem::file_time_type mtime;
  };

  std::vector<Entry> jobs;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
    const auto name = entry.path().filename().string();
    if (!entry.is_directory(ec) || !is_valid_task_id(name)) {
      continue;
    }
    const auto mtime = entry.last_write_time(ec);
    if (ec) {
      continue;
    }
    jobs.push_back(Entry{entry.path(), mtime});
  }
  if (jobs.size() <= max_retention) {
    return 0;
  }

  std::ranges::sort(jobs, std::ranges::greater{}, &Entry::mtime);
  std::size_t removed = 0;
  for (const auto& job : jobs | std::views::drop(max_retention)) {
    std::error_code remove_ec;
    std::filesystem::remove_all(job.path, remove_ec);
    if (remove_ec) {
      log_warning(std::format(
          "Failed to remove expired job {}: {}", job.path.string(),
          remove_ec.message()));
      continue;
    }
    ++removed;
  }
  return removed;
}

auto
remove_job(const std::filesystem::path& root, std::string_view task_id) -> bool
{
  validate_task_id(task_id);
  const auto job_root =
      validate_path_in_storage(root, root / std::string(task_id));
  std::error_code ec;
  const auto count = std::filesystem::remove_all(job_root, ec);
  if (ec) {
    throw StorageException(std::format(
        "Failed to remove job {}: {}", std::string(task_id), ec.message()));
  }
  return count > 0;
}

auto
is_valid_task_id(std::string_view task_id) -> bool
{
  constexpr std::size_t kUuidLength = 36;
  if (task_id.size() != kUuidLength) {
    return false;
  }
  for (std::size_t idx = 0; idx < task_id.size(); ++idx) {
    const auto chr = static_cast<unsigned char>(task_id[idx]);
    if (idx == 8 || idx == 13 || idx == 18 || idx == 23) {
      if (chr != '-') {
        return false;
      }
    } else if (std::isxdigit(chr) == 0) {
      return false;
    }
  }
  return true;
}

void
validate_task_id(std::string_view task_id)
{
  if (!is_valid_task_id(task_id)) {
    throw InvalidTaskIdException(
        std::format("Invalid task id: '{}'", std::string(task_id)));
  }
}

auto
validate_path_in_storage(
    const std::filesystem::path& root, const std::filesystem::path& target)
    -> std::filesystem::path
{
  std::error_code ec;
  const auto resolved_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    throw PathValidationException(
        std::format("Cannot resolve storage root {}", root.string()));
  }
  const auto resolved_target = std::filesystem::weakly_canonical(target, ec);
  if (ec || !is_within(resolved_root, resolved_target)) {
    throw PathValidationException(std::format(
        "Invalid path: {} is outside the storage root", target.string()));
  }
  return resolved_target;
}

}  // namespace docpipe
