#include "signal_handler.hpp"

namespace docpipe {

auto
server_context() -> ServerContext&
{
  static ServerContext ctx;
  return ctx;
}

void
signal_handler(int /*signal*/)
{
  server_context().stop_requested.store(true);
}

void
request_server_stop()
{
  auto& ctx = server_context();
  {
    const std::scoped_lock lock(ctx.stop_mutex);
    ctx.stop_requested.store(true);
  }
  ctx.stop_cv.notify_all();
}

}  // namespace docpipe
