#include "zip_archive.hpp"

#include <unistd.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <format>
#include <limits>
#include <system_error>
#include <utility>

#include "atomic_file.hpp"
#include "utils/exceptions.hpp"

namespace docpipe {

namespace {

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralSignature = 0x06054b50;
constexpr std::uint16_t kVersionNeeded = 20;
constexpr std::uint16_t kVersionMadeBy = (3U << 8U) | 20U;  // unix, 2.0
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kFlagUtf8 = 1U << 11U;
constexpr std::uint64_t kMaxZip32 = std::numeric_limits<std::uint32_t>::max();

void
put_u16(std::string& buffer, std::uint16_t value)
{
  buffer.push_back(static_cast<char>(value & 0xFFU));
  buffer.push_back(static_cast<char>((value >> 8U) & 0xFFU));
}

void
put_u32(std::string& buffer, std::uint32_t value)
{
  for (int shift = 0; shift < 32; shift += 8) {
    buffer.push_back(static_cast<char>((value >> shift) & 0xFFU));
  }
}

auto
deflate_raw(std::string_view data) -> std::string
{
  z_stream stream{};
  if (deflateInit2(
          &stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
          Z_DEFAULT_STRATEGY) != Z_OK) {
    throw StorageException("deflateInit2 failed");
  }

  std::string out;
  out.resize(deflateBound(&stream, static_cast<uLong>(data.size())));
  stream.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  const int status = deflate(&stream, Z_FINISH);
  const auto produced = stream.total_out;
  deflateEnd(&stream);
  if (status != Z_STREAM_END) {
    throw StorageException(std::format("deflate failed with status {}", status));
  }
  out.resize(produced);
  return out;
}

auto
dos_timestamp(std::chrono::system_clock::time_point when)
    -> std::pair<std::uint16_t, std::uint16_t>
{
  const std::time_t time = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&time, &local);
  const int year = std::max(local.tm_year + 1900, 1980) - 1980;
  const auto dos_time = static_cast<std::uint16_t>(
      (local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
  const auto dos_date = static_cast<std::uint16_t>(
      (year << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
  return {dos_time, dos_date};
}

}  // namespace

ZipWriter::ZipWriter(std::filesystem::path target)
    : target_(std::move(target)),
      tmp_path_(target_.parent_path() /
                std::format(".{}.{}.tmp", target_.filename().string(), ::getpid()))
{
  out_.open(tmp_path_, std::ios::binary | std::ios::trunc);
  if (!out_.is_open()) {
    throw StorageException(
        std::format("Cannot create archive {}", target_.string()));
  }
}

ZipWriter::~ZipWriter()
{
  if (!finished_) {
    out_.close();
    std::error_code ec;
    std::filesystem::remove(tmp_path_, ec);
  }
}

void
ZipWriter::add_bytes(std::string_view archive_name, std::string_view data)
{
  write_entry(archive_name, data);
}

void
ZipWriter::add_file(
    const std::filesystem::path& source, std::string_view archive_name)
{
  write_entry(archive_name, read_text_file(source));
}

void
ZipWriter::write_entry(std::string_view archive_name, std::string_view data)
{
  if (finished_) {
    throw StorageException("Archive already finished");
  }
  if (data.size() > kMaxZip32 || offset_ > kMaxZip32) {
    throw StorageException(std::format(
        "Archive entry {} exceeds the 4 GiB limit", std::string(archive_name)));
  }

  const std::string compressed = deflate_raw(data);
  const auto [dos_time, dos_date] =
      dos_timestamp(std::chrono::system_clock::now());

  CentralEntry entry;
  entry.name = std::string(archive_name);
  entry.crc = static_cast<std::uint32_t>(crc32(
      0L, reinterpret_cast<const Bytef*>(data.data()),
      static_cast<uInt>(data.size())));
  entry.compressed_size = static_cast<std::uint32_t>(compressed.size());
  entry.uncompressed_size = static_cast<std::uint32_t>(data.size());
  entry.local_header_offset = static_cast<std::uint32_t>(offset_);
  entry.dos_time = dos_time;
  entry.dos_date = dos_date;

  std::string header;
  put_u32(header, kLocalHeaderSignature);
  put_u16(header, kVersionNeeded);
  put_u16(header, kFlagUtf8);
  put_u16(header, kMethodDeflate);
  put_u16(header, entry.dos_time);
  put_u16(header, entry.dos_date);
  put_u32(header, entry.crc);
  put_u32(header, entry.compressed_size);
  put_u32(header, entry.uncompressed_size);
  put_u16(header, static_cast<std::uint16_t>(entry.name.size()));
  put_u16(header, 0);
  header += entry.name;

  out_.write(header.data(), static_cast<std::streamsize>(header.size()));
  out_.write(
      compressed.data(), static_cast<std::streamsize>(compressed.size()));
  if (!out_) {
    throw StorageException(
        std::format("Failed writing archive {}", target_.string()));
  }
  offset_ += header.size() + compressed.size();
  entries_.push_back(std::move(entry));
}

void
ZipWriter::finish()
{
  if (finished_) {
    return;
  }
  if (offset_ > kMaxZip32) {
    throw StorageException("Archive exceeds the 4 GiB limit");
  }
  const auto central_offset = static_cast<std::uint32_t>(offset_);
  std::string central;
  for (const auto& entry : entries_) {
    put_u32(central, kCentralHeaderSignature);
    put_u16(central, kVersionMadeBy);
    put_u16(central, kVersionNeeded);
    put_u16(central, kFlagUtf8);
    put_u16(central, kMethodDeflate);
    put_u16(central, entry.dos_time);
    put_u16(central, entry.dos_date);
    put_u32(central, entry.crc);
    put_u32(central, entry.compressed_size);
    put_u32(central, entry.uncompressed_size);
    put_u16(central, static_cast<std::uint16_t>(entry.name.size()));
    put_u16(central, 0);  // extra
    put_u16(central, 0);  // comment
    put_u16(central, 0);  // disk
    put_u16(central, 0);  // internal attributes
    put_u32(central, 0100644U << 16U);
    put_u32(central, entry.local_header_offset);
    central += entry.name;
  }

  std::string end;
  put_u32(end, kEndOfCentralSignature);
  put_u16(end, 0);
  put_u16(end, 0);
  put_u16(end, static_cast<std::uint16_t>(entries_.size()));
  put_u16(end, static_cast<std::uint16_t>(entries_.size()));
  put_u32(end, static_cast<std::uint32_t>(central.size()));
  put_u32(end, central_offset);
  put_u16(end, 0);

  out_.write(central.data(), static_cast<std::streamsize>(central.size()));
  out_.write(end.data(), static_cast<std::streamsize>(end.size()));
  out_.close();
  if (!out_) {
    throw StorageException(
        std::format("Failed finalising archive {}", target_.string()));
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path_, target_, ec);
  if (ec) {
    throw StorageException(std::format(
        "Failed to move archive into place {}: {}", target_.string(),
        ec.message()));
  }
  finished_ = true;
}

auto
pack_directory(
    const std::filesystem::path& source_dir,
    const std::filesystem::path& zip_path) -> std::size_t
{
  std::vector<std::filesystem::path> files;
  for (const auto& entry :
       std::filesystem::recursive_directory_iterator(source_dir)) {
    if (entry.is_regular_file()) {
      files.push_back(entry.path());
    }
  }
  std::ranges::sort(files);

  ZipWriter writer(zip_path);
  for (const auto& file : files) {
    writer.add_file(
        file, std::filesystem::relative(file, source_dir).generic_string());
  }
  writer.finish();
  return writer.entry_count();
}

}  // namespace docpipe
