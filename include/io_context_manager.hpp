#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hookhub {

// Runs one io_context on a fixed pool of threads until Stop().
class IoContextManager {
public:
  IoContextManager(int threads, std::string name);
  ~IoContextManager();

  IoContextManager(const IoContextManager &) = delete;
  IoContextManager &operator=(const IoContextManager &) = delete;

  boost::asio::io_context &ioc() { return ioc_; }

  // Drops the work guard, stops the context and joins the threads. Safe to
  // call more than once; must not be called from a pool thread.
  void Stop();

private:
  std::string name_;
  boost::asio::io_context ioc_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> threads_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace hookhub
