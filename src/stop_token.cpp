#include "stoplight/stop_token.hpp"
#include <memory>
#include <utility>

bool stoplight::stop_signal::request_stop() {
  // Only the first caller observes the false -> true transition
  return !stop.exchange(true, std::memory_order_acq_rel);
}

bool stoplight::stop_signal::stop_requested() const {
  return stop.load(std::memory_order_acquire);
}

stoplight::stop_token::stop_token(
    std::shared_ptr<const stoplight::stop_signal> signal)
    : signal(std::move(signal)) {}

bool stoplight::stop_token::stop_requested() const {
  return signal && signal->stop_requested();
}

stoplight::stop_source::stop_source()
    : signal(std::make_shared<stoplight::stop_signal>()) {}

stoplight::stop_source::stop_source(
    std::shared_ptr<stoplight::stop_signal> signal)
    : signal(std::move(signal)) {}

bool stoplight::stop_source::request_stop() const {
  return signal && signal->request_stop();
}

bool stoplight::stop_source::stop_requested() const {
  return signal && signal->stop_requested();
}

stoplight::stop_token stoplight::stop_source::get_token() const {
  return stoplight::stop_token(signal);
}
