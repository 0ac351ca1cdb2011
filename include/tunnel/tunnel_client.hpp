#pragma once

#include "conf/tunnel_config.hpp"
#include "io_context_manager.hpp"
#include "util/backoff.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include "util/my_logging.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <random>

namespace hookhub {

// Keeps one tunnel to the relay open and replays every relayed request
// against the local server. All state changes happen on one strand.
class TunnelClient {
public:
  enum class State { Disconnected, Connecting, Authenticating, Relaying };

  TunnelClient(IoContextManager &io_context_manager,
               ITunnelConfigProvider &config_provider);
  ~TunnelClient();

  void Start();

  // Closes the current session and cancels any pending reconnect. Blocks
  // until the session has been detached on the strand, or until the
  // io_context has stopped; must not be called from a handler.
  void Stop();

  State state() const { return state_.load(); }

  // True while the client is connected or waiting to reconnect.
  bool running() const { return running_.load(); }

  // Set when the relay rejected the secret or version; the client does not
  // retry after that.
  bool auth_failed() const { return auth_failed_.load(); }

  std::uint64_t connection_id() const { return connection_id_.load(); }

private:
  enum class CloseReason { Stopped, TransportError, Rejected };

  class Session;
  template <bool Secure> class SessionImpl;

  void StartSession(TunnelConfig config);
  void HandleSessionClosed(CloseReason reason);
  void HandleSessionConnected(std::uint64_t connection_id);
  void ScheduleReconnect();
  ExponentialBackoffOptions BuildBackoffOptions(const TunnelConfig &config) const;

  boost::asio::io_context &ioc_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  ITunnelConfigProvider &config_provider_;
  std::atomic<bool> running_{false};
  std::atomic<bool> auth_failed_{false};
  std::atomic<State> state_{State::Disconnected};
  std::atomic<std::uint64_t> connection_id_{0};
  std::shared_ptr<Session> session_;
  boost::asio::steady_timer reconnect_timer_;
  // Flipped on the strand by Stop(); pending reconnect waits hold a copy.
  std::shared_ptr<bool> cancelled_;
  JitteredExponentialBackoff backoff_;
  std::mt19937 rng_;
  src::severity_logger_mt<trivial::severity_level> lg;
};

} // namespace hookhub
