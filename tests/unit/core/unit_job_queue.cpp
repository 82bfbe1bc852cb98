#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/job_queue.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace docpipe;
using namespace std::chrono_literals;

namespace {

class RecordingPublisher : public Publisher {
 public:
  explicit RecordingPublisher(bool fail = false) : fail_(fail) {}

  auto publish(std::string_view task_id, const JobPaths& /*paths*/)
      -> Json::Value override
  {
    calls.fetch_add(1);
    if (fail_) {
      throw PublishException("bucket unreachable");
    }
    Json::Value info;
    info["backend"] = "recording";
    info["md_url"] = std::string(task_id);
    return info;
  }
  [[nodiscard]] auto backend() const -> std::string_view override
  {
    return "recording";
  }

  std::atomic<int> calls{0};

 private:
  bool fail_;
};

class JobQueueTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    cfg_ = make_test_config(dir_.path());
    std::filesystem::create_directories(cfg_.storage.root);
  }

  auto make_job() -> std::shared_ptr<Job>
  {
    auto [task_id, paths] = new_job(cfg_.storage.root, "doc.pdf");
    return std::make_shared<Job>(
        std::move(task_id), std::move(paths), "input.pdf", false, JobOptions{});
  }

  static auto finished(const std::shared_ptr<Job>& job) -> bool
  {
    const auto status = job->status();
    return status == JobStatus::Succeeded || status == JobStatus::Failed;
  }

  TempDir dir_;
  RuntimeConfig cfg_;
};

}  // namespace

TEST_F(JobQueueTest, RejectsBeyondCapacity)
{
  cfg_.scheduling.max_queue_size = 2;
  JobQueue queue(cfg_, [](Job&) {});
  EXPECT_TRUE(queue.submit(make_job()));
  EXPECT_TRUE(queue.submit(make_job()));
  EXPECT_TRUE(queue.is_full());

  const auto rejected = make_job();
  EXPECT_FALSE(queue.submit(rejected));
  EXPECT_EQ(queue.size(), 2U);
  EXPECT_EQ(queue.get(rejected->task_id()), nullptr);
}

TEST_F(JobQueueTest, SubmitPersistsQueuedStatus)
{
  JobQueue queue(cfg_, [](Job&) {});
  const auto job = make_job();
  ASSERT_TRUE(queue.submit(job));
  const auto status = load_status(cfg_.storage.root, job->task_id());
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ((*status)["status"].asString(), "queued");
  EXPECT_EQ(queue.get(job->task_id()), job);
}

TEST_F(JobQueueTest, WorkersRunJobsInOrder)
{
  std::mutex mutex;
  std::vector<std::string> order;
  JobQueue queue(cfg_, [&](Job& job) {
    const std::scoped_lock lock(mutex);
    order.push_back(job.task_id());
  });
  std::vector<std::shared_ptr<Job>> jobs{make_job(), make_job(), make_job()};
  for (const auto& job : jobs) {
    ASSERT_TRUE(queue.submit(job));
  }
  queue.start();
  EXPECT_EQ(queue.running_workers(), 1U);
  ASSERT_TRUE(wait_until([&] { return finished(jobs.back()); }));
  queue.stop();

  const std::scoped_lock lock(mutex);
  ASSERT_EQ(order.size(), 3U);
  for (std::size_t i = 0; i < jobs.size(); ++i) {
    EXPECT_EQ(order[i], jobs[i]->task_id());
    EXPECT_EQ(jobs[i]->status(), JobStatus::Succeeded);
  }
  const auto status = load_status(cfg_.storage.root, jobs[0]->task_id());
  EXPECT_EQ((*status)["status"].asString(), "succeeded");
}

TEST_F(JobQueueTest, FailingJobDoesNotStopWorker)
{
  std::atomic<int> calls{0};
  JobQueue queue(cfg_, [&calls](Job&) {
    if (calls.fetch_add(1) == 0) {
      throw AcquisitionTimeoutException("no slot");
    }
  });
  const auto first = make_job();
  const auto second = make_job();
  ASSERT_TRUE(queue.submit(first));
  ASSERT_TRUE(queue.submit(second));
  {
    CaptureStream capture{std::cerr};
    queue.start();
    ASSERT_TRUE(wait_until([&] { return finished(second); }));
    queue.stop();
  }

  EXPECT_EQ(first->status(), JobStatus::Failed);
  EXPECT_EQ(first->snapshot().error_kind, ErrorKind::Timeout);
  EXPECT_EQ(first->snapshot().message, "no slot");
  EXPECT_EQ(second->status(), JobStatus::Succeeded);

  const auto status = load_status(cfg_.storage.root, first->task_id());
  EXPECT_EQ((*status)["error_kind"].asString(), "timeout");
}

TEST_F(JobQueueTest, ForeignExceptionsAreInternalFailures)
{
  JobQueue queue(cfg_, [](Job&) { throw std::runtime_error("oops"); });
  const auto job = make_job();
  ASSERT_TRUE(queue.submit(job));
  CaptureStream capture{std::cerr};
  queue.start();
  ASSERT_TRUE(wait_until([&] { return finished(job); }));
  queue.stop();
  EXPECT_EQ(job->snapshot().error_kind, ErrorKind::Internal);
}

TEST_F(JobQueueTest, SeveralWorkersShareTheQueue)
{
  cfg_.scheduling.max_workers = 3;
  cfg_.scheduling.max_queue_size = 10;
  std::atomic<int> concurrent{0};
  std::atomic<int> peak{0};
  JobQueue queue(cfg_, [&](Job&) {
    const int now = concurrent.fetch_add(1) + 1;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(30ms);
    concurrent.fetch_sub(1);
  });
  std::vector<std::shared_ptr<Job>> jobs;
  for (int i = 0; i < 6; ++i) {
    jobs.push_back(make_job());
    ASSERT_TRUE(queue.submit(jobs.back()));
  }
  queue.start();
  EXPECT_EQ(queue.running_workers(), 3U);
  ASSERT_TRUE(wait_until([&] {
    return std::ranges::all_of(jobs, [](const auto& job) {
      return finished(job);
    });
  }));
  queue.stop();
  EXPECT_GE(peak.load(), 2);
  EXPECT_LE(peak.load(), 3);
  EXPECT_EQ(queue.running_workers(), 0U);
  EXPECT_EQ(queue.active_jobs(), 0U);
}

TEST_F(JobQueueTest, StopLeavesQueuedJobsQueued)
{
  std::atomic<bool> release{false};
  JobQueue queue(cfg_, [&release](Job&) {
    while (!release.load()) {
      std::this_thread::sleep_for(1ms);
    }
  });
  const auto running = make_job();
  const auto waiting = make_job();
  ASSERT_TRUE(queue.submit(running));
  queue.start();
  ASSERT_TRUE(wait_until(
      [&] { return running->status() == JobStatus::Processing; }));
  ASSERT_TRUE(queue.submit(waiting));

  std::jthread releaser([&release] {
    std::this_thread::sleep_for(20ms);
    release.store(true);
  });
  queue.stop();

  EXPECT_EQ(running->status(), JobStatus::Succeeded);
  EXPECT_EQ(waiting->status(), JobStatus::Queued);
  EXPECT_EQ(queue.size(), 1U);
  EXPECT_FALSE(queue.submit(make_job()));
}

TEST_F(JobQueueTest, AutoPublishStoresResult)
{
  cfg_.publish.auto_publish = true;
  auto publisher = std::make_shared<RecordingPublisher>();
  JobQueue queue(cfg_, [](Job&) {}, publisher);
  const auto job = make_job();
  ASSERT_TRUE(queue.submit(job));
  queue.start();
  ASSERT_TRUE(wait_until([&] { return finished(job); }));
  queue.stop();

  EXPECT_EQ(publisher->calls.load(), 1);
  EXPECT_EQ(job->snapshot().published["md_url"].asString(), job->task_id());
  const auto status = load_status(cfg_.storage.root, job->task_id());
  EXPECT_EQ((*status)["published"]["backend"].asString(), "recording");
}

TEST_F(JobQueueTest, PublishFailureKeepsJobSucceeded)
{
  cfg_.publish.auto_publish = true;
  auto publisher = std::make_shared<RecordingPublisher>(true);
  JobQueue queue(cfg_, [](Job&) {}, publisher);
  const auto job = make_job();
  ASSERT_TRUE(queue.submit(job));
  CaptureStream capture{std::cerr};
  queue.start();
  ASSERT_TRUE(wait_until([&] { return finished(job); }));
  queue.stop();

  EXPECT_EQ(job->status(), JobStatus::Succeeded);
  EXPECT_TRUE(job->snapshot().published.isNull());
  EXPECT_NE(capture.str().find("publish failed"), std::string::npos);
  EXPECT_NE(capture.str().find("bucket unreachable"), std::string::npos);
}

TEST_F(JobQueueTest, ForgetOnlyFinishedJobs)
{
  JobQueue queue(cfg_, [](Job&) {});
  const auto job = make_job();
  ASSERT_TRUE(queue.submit(job));
  EXPECT_FALSE(queue.forget(job->task_id()));
  queue.start();
  ASSERT_TRUE(wait_until([&] { return finished(job); }));
  queue.stop();
  EXPECT_TRUE(queue.forget(job->task_id()));
  EXPECT_EQ(queue.get(job->task_id()), nullptr);
  EXPECT_FALSE(queue.forget(job->task_id()));
}

TEST_F(JobQueueTest, SubmitThatCannotPersistIsNotTracked)
{
  JobQueue queue(cfg_, [](Job&) {});
  const auto job = make_job();
  std::filesystem::create_directories(job->paths().status_file / "blocker");

  EXPECT_THROW((void)queue.submit(job), StorageException);
  EXPECT_EQ(queue.get(job->task_id()), nullptr);
  EXPECT_EQ(queue.size(), 0U);
}

TEST_F(JobQueueTest, UnwritableFinalStatusIsReportedOnTheRecord)
{
  JobQueue queue(cfg_, [](Job& job) {
    std::filesystem::remove(job.paths().status_file);
    std::filesystem::create_directories(job.paths().status_file / "blocker");
  });
  const auto job = make_job();
  ASSERT_TRUE(queue.submit(job));

  CaptureStream capture{std::cerr};
  queue.start();
  ASSERT_TRUE(
      wait_until([&] { return job->snapshot().error_kind.has_value(); }));
  queue.stop();

  const auto snap = job->snapshot();
  EXPECT_EQ(snap.status, JobStatus::Succeeded);
  EXPECT_EQ(snap.error_kind, ErrorKind::Storage);
  ASSERT_TRUE(snap.message.has_value());
  EXPECT_NE(snap.message->find("status not persisted"), std::string::npos);
  EXPECT_NE(
      capture.str().find("final status not persisted"), std::string::npos);
  EXPECT_NE(capture.str().find("write 1 of 3 failed"), std::string::npos);
}

TEST_F(JobQueueTest, FinalStatusWriteRecoversOnRetry)
{
  std::jthread cleaner;
  JobQueue queue(cfg_, [&cleaner](Job& job) {
    const auto blocker = job.paths().status_file;
    std::filesystem::remove(blocker);
    std::filesystem::create_directories(blocker / "blocker");
    // Clears the obstruction while the queue is retrying.
    cleaner = std::jthread([blocker] {
      std::this_thread::sleep_for(5ms);
      std::error_code ec;
      std::filesystem::remove_all(blocker, ec);
    });
  });
  const auto job = make_job();
  ASSERT_TRUE(queue.submit(job));

  CaptureStream capture{std::cerr};
  queue.start();
  ASSERT_TRUE(wait_until([&] {
    const auto stored = load_status(cfg_.storage.root, job->task_id());
    return stored && (*stored)["status"].asString() == "succeeded";
  }));
  queue.stop();

  EXPECT_FALSE(job->snapshot().error_kind.has_value());
}
