#pragma once

#include <exception>
#include <new>
#include <string>
#include <string_view>
#include <utility>

#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace docpipe {

struct ExceptionLoggingMessages {
  std::string_view context_prefix;
};

// Runs a best-effort step: failures are logged and do not propagate. Anything
// that is not a std::exception is left to the caller.
template <typename Callback>
auto
run_with_logged_exceptions(
    Callback&& callback,
    const ExceptionLoggingMessages& messages = ExceptionLoggingMessages{})
    -> bool
{
  try {
    std::forward<Callback>(callback)();
    return true;
  }
  catch (const DocpipeException& e) {
    log_error(
        std::string(messages.context_prefix) + "[" +
        std::string(error_kind_name(e.kind())) + "] " + e.what());
  }
  catch (const std::bad_alloc& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  catch (const std::exception& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  return false;
}

}  // namespace docpipe
