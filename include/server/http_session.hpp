#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <memory>
#include <optional>

#include "conf/server_config.hpp"
#include "server/hub.hpp"
#include "server/ingress_handler.hpp"

namespace hookhub {

// One accepted HTTP connection. Serves webhook calls until the peer stops
// keeping the connection alive, or hands the socket to a TunnelSession when
// the request is a websocket upgrade on the tunnel path.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(boost::asio::ip::tcp::socket socket, Hub &hub,
              IngressHandler &ingress, const ServerConfig &config);

  void Run();

private:
  void DoRead(std::chrono::seconds timeout);
  void OnRead(const boost::beast::error_code &ec, std::size_t bytes);
  void OnWrite(bool keep_alive, const boost::beast::error_code &ec,
               std::size_t bytes);
  void SendError(boost::beast::http::status status);
  void DoClose();

  bool IsTunnelTarget(boost::beast::string_view target) const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<
      boost::beast::http::request_parser<boost::beast::http::string_body>>
      parser_;
  Hub &hub_;
  IngressHandler &ingress_;
  const ServerConfig &config_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace hookhub
