#include "server/relay_server.hpp"

#include "hookhub_error.hpp"
#include "server/http_session.hpp"
#include "util/my_logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <charconv>
#include <chrono>
#include <future>
#include <memory>

namespace hookhub {
namespace net = boost::asio;
using tcp = net::ip::tcp;

tcp::endpoint ParseBindAddress(const std::string &bind) {
  const auto colon = bind.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == bind.size()) {
    throw Error(my_errors::GENERAL::INVALID_ARGUMENT,
                fmt::format("Invalid bind address '{}': expected host:port",
                            bind));
  }
  std::string host = bind.substr(0, colon);
  const std::string port_text = bind.substr(colon + 1);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  unsigned port = 0;
  auto [end, err] = std::from_chars(
      port_text.data(), port_text.data() + port_text.size(), port);
  if (err != std::errc{} || end != port_text.data() + port_text.size() ||
      port > 65535) {
    throw Error(my_errors::GENERAL::INVALID_ARGUMENT,
                fmt::format("Invalid port in bind address '{}'", bind));
  }

  boost::system::error_code ec;
  auto addr = net::ip::make_address(host, ec);
  if (ec) {
    throw Error(my_errors::GENERAL::INVALID_ARGUMENT,
                fmt::format("Invalid bind address '{}': {}", bind,
                            ec.message()));
  }
  return tcp::endpoint{addr, static_cast<std::uint16_t>(port)};
}

RelayServer::RelayServer(ServerConfig config)
    : config_(std::move(config)), io_(config_.threads, "relay-server"),
      ingress_(hub_), acceptor_(net::make_strand(io_.ioc())) {}

RelayServer::~RelayServer() { Stop(); }

void RelayServer::Start() {
  if (config_.secret.empty()) {
    throw Error(my_errors::GENERAL::MISSING_FIELD,
                "A shared secret is required to start the server");
  }
  const auto ep = ParseBindAddress(config_.bind_address);

  try {
    acceptor_.open(ep.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(net::socket_base::max_listen_connections);
  } catch (const boost::system::system_error &se) {
    throw Error(my_errors::GENERAL::CREATE_FAILED,
                fmt::format("Failed to bind/listen {}: {}",
                            config_.bind_address, se.code().message()));
  }

  boost::system::error_code ec;
  const auto local = acceptor_.local_endpoint(ec);
  port_.store(ec ? ep.port() : local.port());

  net::post(acceptor_.get_executor(), [this]() { DoAccept(); });

  BOOST_LOG_SEV(lg_, trivial::info)
      << "Relay listening on " << ep.address().to_string() << ':'
      << port_.load() << ", tunnel path " << config_.tunnel_path;
}

void RelayServer::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  // The acceptor lives on its strand; close it there and wait. io_.Stop()
  // joins the pool, so the handler cannot outlive this call.
  auto closed = std::make_shared<std::promise<void>>();
  auto done = closed->get_future();
  net::post(acceptor_.get_executor(), [this, closed]() {
    boost::system::error_code ignored;
    acceptor_.cancel(ignored);
    acceptor_.close(ignored);
    closed->set_value();
  });
  if (done.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Acceptor did not close within 2s, stopping the I/O threads";
  }
  io_.Stop();
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Relay stopped (" << hub_.Size() << " tunnel(s) still registered)";
}

void RelayServer::DoAccept() {
  acceptor_.async_accept(
      net::make_strand(io_.ioc()),
      [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
          if (ec == net::error::operation_aborted) {
            return;
          }
          BOOST_LOG_SEV(lg_, trivial::warning)
              << "Accept failed: " << ec.message();
        } else {
          std::make_shared<HttpSession>(std::move(socket), hub_, ingress_,
                                        config_)
              ->Run();
        }
        if (!stopped_.load() && acceptor_.is_open()) {
          DoAccept();
        }
      });
}

} // namespace hookhub
