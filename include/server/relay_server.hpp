#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <atomic>
#include <cstdint>

#include "conf/server_config.hpp"
#include "io_context_manager.hpp"
#include "server/hub.hpp"
#include "server/ingress_handler.hpp"

namespace hookhub {

// Public face of the relay: one listener serving both webhook ingress and the
// tunnel endpoint.
class RelayServer {
public:
  explicit RelayServer(ServerConfig config);
  ~RelayServer();

  RelayServer(const RelayServer &) = delete;
  RelayServer &operator=(const RelayServer &) = delete;

  // Binds and starts accepting. Throws hookhub::Error with INVALID_ARGUMENT
  // for a malformed bind address, MISSING_FIELD when no secret is configured
  // and CREATE_FAILED when the listener cannot be opened.
  void Start();

  // Closes the listener and joins the worker threads. Idempotent.
  void Stop();

  // Port actually bound; useful when the configured port was 0.
  std::uint16_t port() const { return port_.load(); }

  Hub &hub() { return hub_; }
  const ServerConfig &config() const { return config_; }

private:
  void DoAccept();

  // Declaration order matters: sessions hold references to config_ and hub_,
  // and the io_context must outlive the hub's session references.
  ServerConfig config_;
  IoContextManager io_;
  Hub hub_;
  IngressHandler ingress_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::atomic<std::uint16_t> port_{0};
  std::atomic<bool> stopped_{false};
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

// Splits "host:port" (or "[v6]:port") into an endpoint. Throws
// hookhub::Error(INVALID_ARGUMENT).
boost::asio::ip::tcp::endpoint ParseBindAddress(const std::string &bind);

} // namespace hookhub
