#include "stoplight/thread.hpp"
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

stoplight::worker_fault::worker_fault(std::exception_ptr exception)
    : captured(std::move(exception)) {}

std::string stoplight::worker_fault::what() const {
  if (!captured) {
    return "worker fault without an exception";
  }

  try {
    std::rethrow_exception(captured);
  } catch (const std::exception& error) {
    return error.what();
  } catch (...) {
    return "worker threw a non-standard exception";
  }
}

void stoplight::worker_fault::rethrow() const {
  if (!captured) {
    throw std::logic_error("worker fault without an exception");
  }
  std::rethrow_exception(captured);
}
