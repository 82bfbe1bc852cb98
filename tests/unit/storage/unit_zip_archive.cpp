#include <gtest/gtest.h>
#include <zlib.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <map>
#include <string>

#include "storage/zip_archive.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace docpipe;

namespace {

auto
read_u16(const std::string& data, std::size_t pos) -> std::uint16_t
{
  return static_cast<std::uint16_t>(
      static_cast<unsigned char>(data[pos]) |
      (static_cast<unsigned char>(data[pos + 1]) << 8U));
}

auto
read_u32(const std::string& data, std::size_t pos) -> std::uint32_t
{
  return static_cast<std::uint32_t>(read_u16(data, pos)) |
         (static_cast<std::uint32_t>(read_u16(data, pos + 2)) << 16U);
}

auto
inflate_raw(std::string_view compressed, std::size_t expected) -> std::string
{
  std::string out(expected, '\0');
  z_stream stream{};
  EXPECT_EQ(inflateInit2(&stream, -MAX_WBITS), Z_OK);
  stream.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());
  stream.next_out = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());
  EXPECT_EQ(inflate(&stream, Z_FINISH), Z_STREAM_END);
  inflateEnd(&stream);
  return out;
}

// Entry name -> decompressed contents, walking the central directory.
auto
read_archive(const std::filesystem::path& path)
    -> std::map<std::string, std::string>
{
  const std::string data = read_file(path);
  std::map<std::string, std::string> entries;
  const std::size_t eocd = data.size() - 22;
  EXPECT_EQ(read_u32(data, eocd), 0x06054b50U);
  const std::uint16_t count = read_u16(data, eocd + 10);
  std::size_t pos = read_u32(data, eocd + 16);
  for (std::uint16_t i = 0; i < count; ++i) {
    EXPECT_EQ(read_u32(data, pos), 0x02014b50U);
    const auto compressed_size = read_u32(data, pos + 20);
    const auto size = read_u32(data, pos + 24);
    const auto name_len = read_u16(data, pos + 28);
    const auto extra_len = read_u16(data, pos + 30);
    const auto comment_len = read_u16(data, pos + 32);
    const auto local = read_u32(data, pos + 42);
    const std::string name = data.substr(pos + 46, name_len);

    const auto local_name_len = read_u16(data, local + 26);
    const auto local_extra_len = read_u16(data, local + 28);
    const auto body = local + 30 + local_name_len + local_extra_len;
    entries[name] = inflate_raw(
        std::string_view(data).substr(body, compressed_size), size);
    pos += 46U + name_len + extra_len + comment_len;
  }
  return entries;
}

}  // namespace

TEST(ZipArchive, WritesReadableEntries)
{
  TempDir dir;
  const auto target = dir.path() / "out.zip";
  {
    ZipWriter writer(target);
    writer.add_bytes("full.md", "# Title\n\nBody text");
    writer.add_bytes("images/page_0001_fig.png", std::string(4096, 'x'));
    writer.finish();
    EXPECT_EQ(writer.entry_count(), 2U);
  }
  const auto entries = read_archive(target);
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries.at("full.md"), "# Title\n\nBody text");
  EXPECT_EQ(entries.at("images/page_0001_fig.png"), std::string(4096, 'x'));
}

TEST(ZipArchive, PackDirectoryUsesRelativeNames)
{
  TempDir dir;
  const auto output = dir.path() / "output";
  write_file(output / "full.md", "markdown");
  write_file(output / "layout.json", "{}");
  write_file(output / "images" / "page_0002_a.png", "png");

  const auto zip = dir.path() / "result.zip";
  EXPECT_EQ(pack_directory(output, zip), 3U);
  const auto entries = read_archive(zip);
  EXPECT_EQ(entries.at("full.md"), "markdown");
  EXPECT_EQ(entries.at("layout.json"), "{}");
  EXPECT_EQ(entries.at("images/page_0002_a.png"), "png");
}

TEST(ZipArchive, EmptyArchiveIsValid)
{
  TempDir dir;
  const auto target = dir.path() / "empty.zip";
  {
    ZipWriter writer(target);
    writer.finish();
  }
  EXPECT_TRUE(read_archive(target).empty());
}
