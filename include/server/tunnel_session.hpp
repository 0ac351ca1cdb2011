#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "conf/server_config.hpp"
#include "server/hub.hpp"
#include "tunnel/tunnel_messages.hpp"

namespace hookhub {

// Server end of one tunnel. Lives on its socket's strand; the Hub only ever
// reaches it through Deliver(), which posts onto that strand.
class TunnelSession : public IClientSink,
                      public std::enable_shared_from_this<TunnelSession> {
public:
  enum class State { Connected, Authenticated, Closed };

  using UpgradeRequest =
      boost::beast::http::request<boost::beast::http::string_body>;

  TunnelSession(boost::asio::ip::tcp::socket socket, Hub &hub,
                const ServerConfig &config);
  ~TunnelSession() override;

  void Run(UpgradeRequest upgrade);

  void Deliver(Frame frame) override;

  State state() const { return state_.load(); }

private:
  struct Outgoing {
    Frame data;
    bool text{false};
  };

  void OnAccept(const boost::beast::error_code &ec);
  void OnHandshakeTimeout(const boost::beast::error_code &ec);
  void OnHello(const boost::beast::error_code &ec, std::size_t bytes);
  void Authenticate(const TunnelHello &hello);
  void Reject(int code, std::string reason);
  void OnRejectSent(const boost::beast::error_code &ec, std::size_t bytes);

  void StartRead();
  void OnRead(const boost::beast::error_code &ec, std::size_t bytes);

  void Enqueue(Outgoing out);
  void DoWrite();
  void OnWrite(const boost::beast::error_code &ec, std::size_t bytes);
  void OnWriteTimeout(std::uint64_t seq, const boost::beast::error_code &ec);

  void Fail(const char *context, const boost::beast::error_code &ec);
  void Finish();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  Hub &hub_;
  const ServerConfig &config_;
  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer write_timer_;
  boost::beast::flat_buffer buffer_;
  std::deque<Outgoing> write_queue_;
  std::uint64_t write_seq_{0};
  bool rejecting_{false};
  std::atomic<State> state_{State::Connected};
  std::optional<ConnectionId> connection_id_;
  std::string remote_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace hookhub
