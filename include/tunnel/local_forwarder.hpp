#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "relay/relayed_request.hpp"
#include "util/endpoint_util.hpp"

namespace hookhub {

struct ForwardOutcome {
  std::string method;
  std::string target;
  int status{0}; // 0 when no response was received
  std::string error;
  std::chrono::milliseconds elapsed{0};

  bool ok() const { return error.empty(); }
};

// Replays relayed requests against the local server. Each call runs on its
// own connection, over TLS when the endpoint is https://; the outcome is
// logged and otherwise discarded.
class LocalForwarder {
public:
  using Observer = std::function<void(const ForwardOutcome &)>;

  LocalForwarder(boost::asio::io_context &ioc, LocalEndpointParts endpoint,
                 int request_timeout_seconds, std::size_t max_response_bytes,
                 bool verify_tls = true);

  // Called on the call's strand after each call completes; for tests.
  void SetObserver(Observer observer) { observer_ = std::move(observer); }

  void Forward(RelayedRequest request);

  const LocalEndpointParts &endpoint() const { return endpoint_; }

private:
  template <bool Secure> class LocalCall;

  boost::asio::io_context &ioc_;
  LocalEndpointParts endpoint_;
  // Only set for https:// endpoints; shared with in-flight calls.
  std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
  int request_timeout_seconds_;
  std::size_t max_response_bytes_;
  Observer observer_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace hookhub
