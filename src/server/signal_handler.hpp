#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace docpipe {

struct ServerContext {
  std::mutex stop_mutex;
  std::condition_variable stop_cv;
  std::atomic<bool> stop_requested{false};
};

auto server_context() -> ServerContext&;

void signal_handler(int signal);

// Sets stop_requested and wakes everything waiting on stop_cv.
void request_server_stop();

}  // namespace docpipe
