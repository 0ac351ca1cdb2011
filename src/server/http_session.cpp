#include "server/http_session.hpp"

#include "server/tunnel_session.hpp"
#include "util/my_logging.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <algorithm>
#include <chrono>

namespace hookhub {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

HttpSession::HttpSession(tcp::socket socket, Hub &hub, IngressHandler &ingress,
                         const ServerConfig &config)
    : stream_(std::move(socket)), hub_(hub), ingress_(ingress),
      config_(config) {}

void HttpSession::Run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(
                    &HttpSession::DoRead, shared_from_this(),
                    std::chrono::seconds(
                        std::max(1, config_.read_timeout_seconds))));
}

void HttpSession::DoRead(std::chrono::seconds timeout) {
  // A parser handles exactly one message.
  parser_.emplace();
  parser_->body_limit(config_.max_body_bytes);
  parser_->header_limit(16 * 1024);
  stream_.expires_after(timeout);
  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::OnRead,
                                             shared_from_this()));
}

void HttpSession::OnRead(const beast::error_code &ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    DoClose();
    return;
  }
  if (ec == http::error::body_limit) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Webhook body exceeded " << config_.max_body_bytes << " bytes";
    SendError(http::status::payload_too_large);
    return;
  }
  if (ec == beast::error::timeout) {
    BOOST_LOG_SEV(lg_, trivial::debug) << "HTTP read timed out";
    DoClose();
    return;
  }
  if (ec) {
    if (ec.category() ==
        http::make_error_code(http::error::bad_method).category()) {
      SendError(http::status::bad_request);
      return;
    }
    BOOST_LOG_SEV(lg_, trivial::debug) << "HTTP read failed: " << ec.message();
    DoClose();
    return;
  }

  auto req = parser_->release();

  if (websocket::is_upgrade(req) && IsTunnelTarget(req.target())) {
    stream_.expires_never();
    std::make_shared<TunnelSession>(stream_.release_socket(), hub_, config_)
        ->Run(std::move(req));
    return;
  }

  auto res = std::make_shared<IngressHandler::Response>(ingress_.Handle(req));
  const bool keep_alive = res->keep_alive();
  stream_.expires_after(
      std::chrono::seconds(std::max(1, config_.read_timeout_seconds)));
  http::async_write(stream_, *res,
                    [self = shared_from_this(), res,
                     keep_alive](const beast::error_code &ec, std::size_t n) {
                      self->OnWrite(keep_alive, ec, n);
                    });
}

void HttpSession::OnWrite(bool keep_alive, const beast::error_code &ec,
                          std::size_t) {
  if (ec) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "HTTP write failed: " << ec.message();
    DoClose();
    return;
  }
  if (!keep_alive) {
    DoClose();
    return;
  }
  DoRead(std::chrono::seconds(std::max(1, config_.keep_alive_seconds)));
}

void HttpSession::SendError(http::status status) {
  auto res = std::make_shared<http::response<http::string_body>>(status, 11);
  res->set(http::field::server, "hookhub");
  res->set(http::field::content_type, "text/plain");
  res->keep_alive(false);
  res->body() = std::string(http::obsolete_reason(status));
  res->prepare_payload();
  stream_.expires_after(
      std::chrono::seconds(std::max(1, config_.read_timeout_seconds)));
  http::async_write(stream_, *res,
                    [self = shared_from_this(),
                     res](const beast::error_code &, std::size_t) {
                      self->DoClose();
                    });
}

void HttpSession::DoClose() {
  beast::error_code ignored;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
  stream_.socket().close(ignored);
}

bool HttpSession::IsTunnelTarget(beast::string_view target) const {
  const auto query = target.find('?');
  const auto path =
      query == beast::string_view::npos ? target : target.substr(0, query);
  beast::string_view tunnel(config_.tunnel_path);
  auto trim = [](beast::string_view v) {
    while (v.size() > 1 && v.back() == '/') {
      v.remove_suffix(1);
    }
    return v;
  };
  return trim(path) == trim(tunnel);
}

} // namespace hookhub
