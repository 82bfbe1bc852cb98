#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace docpipe {

// =============================================================================
// ZipWriter: streams deflate-compressed entries into a .zip file
// -----------------------------------------------------------------------------
// The archive is assembled in a temporary sibling and renamed over the target
// by finish(); an unfinished writer removes its temporary file. Entries and
// the archive itself are limited to 4 GiB (no ZIP64).
// =============================================================================
class ZipWriter {
 public:
  explicit ZipWriter(std::filesystem::path target);
  ~ZipWriter();
  ZipWriter(const ZipWriter&) = delete;
  auto operator=(const ZipWriter&) -> ZipWriter& = delete;
  ZipWriter(ZipWriter&&) = delete;
  auto operator=(ZipWriter&&) -> ZipWriter& = delete;

  void add_bytes(std::string_view archive_name, std::string_view data);
  void add_file(
      const std::filesystem::path& source, std::string_view archive_name);
  void finish();

  [[nodiscard]] auto entry_count() const -> std::size_t
  {
    return entries_.size();
  }

 private:
  struct CentralEntry {
    std::string name;
    std::uint32_t crc{0};
    std::uint32_t compressed_size{0};
    std::uint32_t uncompressed_size{0};
    std::uint32_t local_header_offset{0};
    std::uint16_t dos_time{0};
    std::uint16_t dos_date{0};
  };

  void write_entry(std::string_view archive_name, std::string_view data);

  std::filesystem::path target_;
  std::filesystem::path tmp_path_;
  std::ofstream out_;
  std::vector<CentralEntry> entries_;
  std::uint64_t offset_{0};
  bool finished_{false};
};

// Archives every regular file below `source_dir` with names relative to it,
// so the directory's contents sit at the archive root. Returns the number of
// entries written.
auto pack_directory(
    const std::filesystem::path& source_dir,
    const std::filesystem::path& zip_path) -> std::size_t;

}  // namespace docpipe
