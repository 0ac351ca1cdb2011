#include "server/tunnel_session.hpp"

#include "hookhub_error.hpp"
#include "util/my_logging.hpp"
#include "version.h"

#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <chrono>
#include <fmt/format.h>
#include <openssl/crypto.h>

namespace hookhub {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace json = boost::json;
namespace http = beast::http;

namespace {

bool SecretsEqual(const std::string &presented, const std::string &expected) {
  if (presented.size() != expected.size()) {
    return false;
  }
  return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) ==
         0;
}

std::string MajorOf(const std::string &version) {
  return version.substr(0, version.find('.'));
}

} // namespace

TunnelSession::TunnelSession(net::ip::tcp::socket socket, Hub &hub,
                             const ServerConfig &config)
    : ws_(std::move(socket)), hub_(hub), config_(config),
      handshake_timer_(ws_.get_executor()), write_timer_(ws_.get_executor()) {
  beast::error_code ec;
  auto ep = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
  remote_ = ec ? std::string("unknown")
               : fmt::format("{}:{}", ep.address().to_string(), ep.port());
}

TunnelSession::~TunnelSession() {
  BOOST_LOG_SEV(lg_, trivial::trace) << "[" << remote_ << "] session released";
}

void TunnelSession::Run(UpgradeRequest upgrade) {
  ws_.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type &res) {
        res.set(http::field::server,
                std::string("hookhub/") + HOOKHUB_VERSION);
      }));
  ws_.async_accept(upgrade, beast::bind_front_handler(&TunnelSession::OnAccept,
                                                      shared_from_this()));
}

void TunnelSession::OnAccept(const beast::error_code &ec) {
  if (ec) {
    Fail("accept", ec);
    return;
  }
  BOOST_LOG_SEV(lg_, trivial::info) << "[" << remote_ << "] Session started";

  handshake_timer_.expires_after(
      std::chrono::seconds(std::max(1, config_.handshake_timeout_seconds)));
  handshake_timer_.async_wait(beast::bind_front_handler(
      &TunnelSession::OnHandshakeTimeout, shared_from_this()));

  ws_.async_read(buffer_, beast::bind_front_handler(&TunnelSession::OnHello,
                                                    shared_from_this()));
}

void TunnelSession::OnHandshakeTimeout(const beast::error_code &ec) {
  if (ec == net::error::operation_aborted ||
      state_.load() != State::Connected || rejecting_) {
    return;
  }
  BOOST_LOG_SEV(lg_, trivial::warning)
      << "[" << remote_ << "] no hello within "
      << config_.handshake_timeout_seconds << "s, closing";
  Reject(my_errors::TUNNEL::HANDSHAKE_TIMEOUT, "no hello received");
}

void TunnelSession::OnHello(const beast::error_code &ec, std::size_t bytes) {
  if (ec) {
    Fail("handshake read", ec);
    return;
  }
  if (state_.load() != State::Connected || rejecting_) {
    return;
  }
  handshake_timer_.cancel();

  if (!ws_.got_text()) {
    Reject(my_errors::TUNNEL::PROTOCOL_ERROR, "expected hello text frame");
    return;
  }
  const std::string payload = beast::buffers_to_string(buffer_.data());
  buffer_.consume(bytes);

  TunnelHello hello;
  try {
    auto jv = json::parse(payload);
    hello = json::value_to<TunnelHello>(jv);
  } catch (const std::exception &ex) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "[" << remote_ << "] malformed hello: " << ex.what();
    Reject(my_errors::TUNNEL::PROTOCOL_ERROR, "malformed hello");
    return;
  }
  Authenticate(hello);
}

void TunnelSession::Authenticate(const TunnelHello &hello) {
  if (!SecretsEqual(hello.secret, config_.secret)) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "[" << remote_ << "] rejected: invalid secret";
    Reject(my_errors::TUNNEL::UNAUTHORIZED, "invalid secret");
    return;
  }
  if (MajorOf(hello.client_version) != MajorOf(HOOKHUB_VERSION)) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "[" << remote_ << "] rejected: client version '"
        << hello.client_version << "' vs server " << HOOKHUB_VERSION;
    Reject(my_errors::TUNNEL::VERSION_MISMATCH,
           fmt::format("Server is running version {} but you are running {}",
                       HOOKHUB_VERSION, hello.client_version));
    return;
  }

  // Registered before the welcome is queued so no broadcast is missed; frames
  // delivered meanwhile are posted behind the welcome on this strand.
  state_.store(State::Authenticated);
  connection_id_ = hub_.Register(shared_from_this());

  TunnelWelcome welcome;
  welcome.connection_id = *connection_id_;
  welcome.server_version = HOOKHUB_VERSION;
  Enqueue(Outgoing{std::make_shared<const std::string>(
                       json::serialize(json::value_from(welcome))),
                   true});

  BOOST_LOG_SEV(lg_, trivial::info)
      << "[" << remote_ << "] authenticated as connection " << *connection_id_;
  StartRead();
}

void TunnelSession::Reject(int code, std::string reason) {
  rejecting_ = true;
  TunnelReject reject;
  reject.code = code;
  reject.reason = std::move(reason);
  auto payload = std::make_shared<const std::string>(
      json::serialize(json::value_from(reject)));
  ws_.text(true);
  ws_.async_write(net::buffer(*payload),
                  [self = shared_from_this(), payload](
                      const beast::error_code &ec, std::size_t bytes) {
                    self->OnRejectSent(ec, bytes);
                  });
}

void TunnelSession::OnRejectSent(const beast::error_code &ec, std::size_t) {
  if (ec) {
    Fail("reject write", ec);
    return;
  }
  ws_.async_close(websocket::close_code::policy_error,
                  [self = shared_from_this()](const beast::error_code &) {
                    self->Finish();
                  });
}

void TunnelSession::Deliver(Frame frame) {
  net::post(ws_.get_executor(),
            [self = shared_from_this(), frame = std::move(frame)]() mutable {
              self->Enqueue(Outgoing{std::move(frame), false});
            });
}

void TunnelSession::StartRead() {
  ws_.async_read(buffer_, beast::bind_front_handler(&TunnelSession::OnRead,
                                                    shared_from_this()));
}

void TunnelSession::OnRead(const beast::error_code &ec, std::size_t bytes) {
  if (ec) {
    if (ec == websocket::error::closed) {
      BOOST_LOG_SEV(lg_, trivial::info)
          << "[" << remote_ << "] closed by client";
      Finish();
      return;
    }
    Fail("read", ec);
    return;
  }
  // Nothing is expected from the client after the handshake.
  BOOST_LOG_SEV(lg_, trivial::trace)
      << "[" << remote_ << "] ignoring " << bytes << " byte client frame";
  buffer_.consume(bytes);
  StartRead();
}

void TunnelSession::Enqueue(Outgoing out) {
  if (state_.load() != State::Authenticated) {
    return;
  }
  if (write_queue_.size() >=
      static_cast<std::size_t>(std::max(1, config_.max_pending_messages))) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "[" << remote_ << "] " << write_queue_.size()
        << " frames pending, dropping stalled client";
    Finish();
    return;
  }
  write_queue_.push_back(std::move(out));
  if (write_queue_.size() == 1) {
    DoWrite();
  }
}

void TunnelSession::DoWrite() {
  const auto &front = write_queue_.front();
  const std::uint64_t seq = ++write_seq_;
  write_timer_.expires_after(
      std::chrono::seconds(std::max(1, config_.write_timeout_seconds)));
  write_timer_.async_wait(
      [self = shared_from_this(), seq](const beast::error_code &ec) {
        self->OnWriteTimeout(seq, ec);
      });
  ws_.text(front.text);
  // The handler keeps the frame alive; Finish() may clear the queue first.
  ws_.async_write(net::buffer(*front.data),
                  [self = shared_from_this(), frame = front.data](
                      const beast::error_code &ec, std::size_t bytes) {
                    self->OnWrite(ec, bytes);
                  });
}

void TunnelSession::OnWrite(const beast::error_code &ec, std::size_t) {
  write_timer_.cancel();
  if (ec) {
    Fail("write", ec);
    return;
  }
  if (state_.load() != State::Authenticated) {
    return;
  }
  write_queue_.pop_front();
  if (!write_queue_.empty()) {
    DoWrite();
  }
}

void TunnelSession::OnWriteTimeout(std::uint64_t seq,
                                   const beast::error_code &ec) {
  if (ec == net::error::operation_aborted || seq != write_seq_ ||
      write_queue_.empty() || state_.load() == State::Closed) {
    return;
  }
  BOOST_LOG_SEV(lg_, trivial::warning)
      << "[" << remote_ << "] write exceeded "
      << config_.write_timeout_seconds << "s, closing";
  Finish();
}

void TunnelSession::Fail(const char *context, const beast::error_code &ec) {
  if (state_.load() == State::Closed) {
    return;
  }
  if (ec != net::error::operation_aborted) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "[" << remote_ << "] " << context << " error: " << ec.message();
  }
  Finish();
}

void TunnelSession::Finish() {
  if (state_.exchange(State::Closed) == State::Closed) {
    return;
  }
  handshake_timer_.cancel();
  write_timer_.cancel();
  write_queue_.clear();
  if (connection_id_) {
    hub_.Unregister(*connection_id_);
  }
  beast::error_code ignored;
  auto &socket = beast::get_lowest_layer(ws_).socket();
  socket.shutdown(net::ip::tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
  BOOST_LOG_SEV(lg_, trivial::info) << "[" << remote_ << "] Session finished";
}

} // namespace hookhub
