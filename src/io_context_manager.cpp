#include "io_context_manager.hpp"

#include "util/my_logging.hpp"

#include <algorithm>

namespace hookhub {

IoContextManager::IoContextManager(int threads, std::string name)
    : name_(std::move(name)), ioc_(std::max(1, threads)) {
  work_guard_.emplace(boost::asio::make_work_guard(ioc_));
  const int count = std::max(1, threads);
  threads_.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    threads_.emplace_back([this, i]() {
      for (;;) {
        try {
          ioc_.run();
          break;
        } catch (const std::exception &ex) {
          BOOST_LOG_SEV(lg_, trivial::error)
              << name_ << " worker " << i
              << " handler threw, resuming: " << ex.what();
        }
      }
    });
  }
  BOOST_LOG_SEV(lg_, trivial::debug)
      << name_ << " started with " << count << " thread(s)";
}

IoContextManager::~IoContextManager() { Stop(); }

void IoContextManager::Stop() {
  if (threads_.empty()) {
    return;
  }
  work_guard_.reset();
  ioc_.stop();
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();
  BOOST_LOG_SEV(lg_, trivial::debug) << name_ << " stopped";
}

} // namespace hookhub
