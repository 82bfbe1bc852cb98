#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/page_ranges.hpp"
#include "core/pipeline.hpp"
#include "storage/atomic_file.hpp"
#include "test_helpers.hpp"

using namespace docpipe;
using namespace std::chrono_literals;

namespace {

// Engine that answers with one page per requested page of a `total` page
// document and records the ranges it was asked for.
struct PageEcho {
  int total = 0;
  std::mutex mutex;
  std::vector<std::optional<std::string>> ranges;

  auto operator()(const std::filesystem::path&, const PredictOptions& options)
      -> std::vector<PageResult>
  {
    {
      const std::scoped_lock lock(mutex);
      ranges.push_back(options.page_ranges);
    }
    std::vector<int> pages;
    if (options.page_ranges) {
      pages = parse_page_ranges(*options.page_ranges);
    } else {
      for (int page = 1; page <= total; ++page) {
        pages.push_back(page);
      }
    }
    std::vector<PageResult> out;
    for (const int page : pages) {
      PageResult result;
      result.page_index = page;
      result.markdown = std::format("page {}", page);
      result.payload["page"] = page;
      out.push_back(std::move(result));
    }
    return out;
  }
};

class PipelineTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    cfg_ = make_test_config(dir_.path());
    std::filesystem::create_directories(cfg_.storage.root);
  }

  auto make_manager() -> std::unique_ptr<ResourceManager>
  {
    return std::make_unique<ResourceManager>(
        cfg_, fake_.registry, cpu_providers(), false);
  }

  auto new_paths() -> JobPaths
  {
    return new_job(cfg_.storage.root, "doc.pdf").second;
  }

  auto write_pdf(const JobPaths& paths, int pages) -> std::string
  {
    write_file(paths.input_file, make_pdf_bytes(pages));
    return paths.input_file.string();
  }

  auto use_echo(int total) -> std::shared_ptr<PageEcho>
  {
    auto echo = std::make_shared<PageEcho>();
    echo->total = total;
    fake_.script->predict = [echo](const auto& input, const auto& options) {
      return (*echo)(input, options);
    };
    return echo;
  }

  TempDir dir_;
  RuntimeConfig cfg_;
  FakeRegistry fake_;
};

auto
layout_indices(const JobPaths& paths) -> std::vector<int>
{
  const auto layout = read_json_file(paths.json_file);
  std::vector<int> indices;
  for (const auto& page : (*layout)["pages"]) {
    indices.push_back(page["page_index"].asInt());
  }
  return indices;
}

}  // namespace

TEST_F(PipelineTest, SmallDocumentRunsInOneCall)
{
  auto echo = use_echo(3);
  auto manager = make_manager();
  Pipeline pipeline(cfg_, *manager);
  const auto paths = new_paths();
  pipeline.run(write_pdf(paths, 3), false, paths, JobOptions{});

  ASSERT_EQ(echo->ranges.size(), 1U);
  EXPECT_FALSE(echo->ranges.front().has_value());
  EXPECT_EQ(layout_indices(paths), (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(read_file(paths.md_file), "page 1\n\npage 2\n\npage 3");
  EXPECT_TRUE(std::filesystem::exists(paths.zip_file));
  EXPECT_EQ(manager->in_flight(), 0);
}

TEST_F(PipelineTest, LargeDocumentIsBatched)
{
  cfg_.batching.batch_page_size = 50;
  auto echo = use_echo(120);
  auto manager = make_manager();
  Pipeline pipeline(cfg_, *manager);
  const auto paths = new_paths();
  pipeline.run(write_pdf(paths, 120), false, paths, JobOptions{});

  ASSERT_EQ(echo->ranges.size(), 3U);
  EXPECT_EQ(echo->ranges[0], "1-50");
  EXPECT_EQ(echo->ranges[1], "51-100");
  EXPECT_EQ(echo->ranges[2], "101-120");

  const auto indices = layout_indices(paths);
  ASSERT_EQ(indices.size(), 120U);
  for (int i = 0; i < 120; ++i) {
    EXPECT_EQ(indices[static_cast<std::size_t>(i)], i + 1);
  }
}

TEST_F(PipelineTest, BatchedAndUnbatchedOutputsMatch)
{
  cfg_.batching.batch_page_size = 4;
  use_echo(10);
  auto manager = make_manager();

  const auto batched_paths = new_paths();
  Pipeline batched(cfg_, *manager);
  batched.run(write_pdf(batched_paths, 10), false, batched_paths, JobOptions{});

  auto whole_cfg = cfg_;
  whole_cfg.batching.enable_auto_batch = false;
  const auto whole_paths = new_paths();
  Pipeline whole(whole_cfg, *manager);
  whole.run(write_pdf(whole_paths, 10), false, whole_paths, JobOptions{});

  EXPECT_EQ(read_file(batched_paths.md_file), read_file(whole_paths.md_file));
  EXPECT_EQ(
      read_file(batched_paths.json_file), read_file(whole_paths.json_file));
}

TEST_F(PipelineTest, ExplicitPageRangesDisableBatching)
{
  cfg_.batching.batch_page_size = 2;
  auto echo = use_echo(10);
  auto manager = make_manager();
  Pipeline pipeline(cfg_, *manager);
  const auto paths = new_paths();
  JobOptions options;
  options.page_ranges = "2-4";
  pipeline.run(write_pdf(paths, 10), false, paths, options);

  ASSERT_EQ(echo->ranges.size(), 1U);
  EXPECT_EQ(echo->ranges.front(), "2-4");
  EXPECT_EQ(layout_indices(paths), (std::vector<int>{2, 3, 4}));
}

TEST_F(PipelineTest, ImagesAreNamespacedPerPage)
{
  fake_.script->predict = [](const auto&, const auto&) {
    std::vector<PageResult> pages;
    for (int page = 1; page <= 2; ++page) {
      PageResult result;
      result.page_index = page;
      result.markdown = std::format("![fig](images/fig.png) page {}", page);
      result.images["images/fig.png"] = std::format("bytes-{}", page);
      pages.push_back(std::move(result));
    }
    return pages;
  };
  auto manager = make_manager();
  Pipeline pipeline(cfg_, *manager);
  const auto paths = new_paths();
  pipeline.run(write_pdf(paths, 2), false, paths, JobOptions{});

  EXPECT_EQ(read_file(paths.images_dir / "page_0001_fig.png"), "bytes-1");
  EXPECT_EQ(read_file(paths.images_dir / "page_0002_fig.png"), "bytes-2");
  EXPECT_EQ(
      read_file(paths.md_file),
      "![fig](images/page_0001_fig.png) page 1\n\n"
      "![fig](images/page_0002_fig.png) page 2");
}

TEST_F(PipelineTest, NoZipWhenNotRequested)
{
  auto manager = make_manager();
  Pipeline pipeline(cfg_, *manager);
  const auto paths = new_paths();
  JobOptions options;
  options.pack_zip = false;
  pipeline.run(write_pdf(paths, 1), false, paths, options);
  EXPECT_TRUE(std::filesystem::exists(paths.md_file));
  EXPECT_FALSE(std::filesystem::exists(paths.zip_file));
}

TEST_F(PipelineTest, ImagesSkipPageCounting)
{
  int counted = 0;
  auto manager = make_manager();
  Pipeline pipeline(cfg_, *manager, [&counted](const std::filesystem::path&) {
    ++counted;
    return std::optional<int>{1};
  });
  const auto [task_id, paths] = new_job(cfg_.storage.root, "scan.png");
  write_file(paths.input_file, "\x89PNG");
  EXPECT_FALSE(pipeline.validate(paths.input_file).has_value());
  EXPECT_EQ(counted, 0);
  pipeline.run(paths.input_file.string(), false, paths, JobOptions{});
  EXPECT_EQ(read_file(paths.md_file), "# input.png");
}

TEST_F(PipelineTest, PredictOptionsAreForwarded)
{
  JobOptions options;
  options.is_ocr = false;
  options.enable_formula = false;
  options.language = "en";
  options.model_version = "v2";
  const auto predict = to_predict_options(options, std::string("1-5"));
  EXPECT_FALSE(predict.is_ocr);
  EXPECT_FALSE(predict.enable_formula);
  EXPECT_TRUE(predict.enable_table);
  EXPECT_EQ(predict.language, "en");
  EXPECT_EQ(predict.model_version, "v2");
  EXPECT_EQ(predict.page_ranges, "1-5");
}

TEST(ArtifactWriter, SanitizesImageNames)
{
  EXPECT_EQ(ArtifactWriter::sanitize_image_name("a/b/c.png"), "c.png");
  EXPECT_EQ(ArtifactWriter::sanitize_image_name("..\\..\\evil.png"), "evil.png");
  EXPECT_FALSE(ArtifactWriter::sanitize_image_name("..").has_value());
  EXPECT_FALSE(ArtifactWriter::sanitize_image_name("dir/").has_value());
  EXPECT_EQ(ArtifactWriter::namespaced_image_name(12, "x.jpg"), "page_0012_x.jpg");
}

TEST(ArtifactWriter, LayoutIsCompleteAfterEveryPage)
{
  TempDir dir;
  const auto paths = new_job(dir.path(), "doc.pdf").second;
  ArtifactWriter writer(paths);
  EXPECT_EQ((*read_json_file(paths.json_file))["pages"].size(), 0U);

  PageResult page;
  page.page_index = 4;
  page.payload["blocks"] = 2;
  page.markdown = "   ";
  writer.append(page);
  const auto layout = *read_json_file(paths.json_file);
  ASSERT_EQ(layout["pages"].size(), 1U);
  EXPECT_EQ(layout["pages"][0]["page_index"].asInt(), 4);
  EXPECT_EQ(layout["pages"][0]["res"]["blocks"].asInt(), 2);

  page.markdown = "text";
  writer.append(page);
  writer.finish();
  EXPECT_EQ(writer.page_count(), 2U);
  EXPECT_EQ(read_file(paths.md_file), "text");
}
