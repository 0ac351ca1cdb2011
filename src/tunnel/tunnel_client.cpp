#include "tunnel/tunnel_client.hpp"

#include "hookhub_error.hpp"
#include "relay/relay_codec.hpp"
#include "tunnel/local_forwarder.hpp"
#include "tunnel/tunnel_messages.hpp"
#include "util/endpoint_util.hpp"
#include "version.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <chrono>
#include <fmt/format.h>
#include <future>
#include <openssl/err.h>
#include <optional>
#include <string>
#include <type_traits>

namespace hookhub {
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace json = boost::json;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

const char *StateName(TunnelClient::State state) {
  switch (state) {
  case TunnelClient::State::Disconnected:
    return "disconnected";
  case TunnelClient::State::Connecting:
    return "connecting";
  case TunnelClient::State::Authenticating:
    return "authenticating";
  case TunnelClient::State::Relaying:
    return "relaying";
  }
  return "unknown";
}

} // namespace

// Everything a session does runs on the client strand, so Detach() and the
// session callbacks never race.
class TunnelClient::Session {
public:
  virtual ~Session() = default;
  virtual void Start() = 0;
  virtual void Stop() = 0;
  virtual void Detach() = 0;
};

template <bool Secure>
class TunnelClient::SessionImpl
    : public TunnelClient::Session,
      public std::enable_shared_from_this<TunnelClient::SessionImpl<Secure>> {
  using NextLayer = std::conditional_t<Secure, ssl::stream<beast::tcp_stream>,
                                       beast::tcp_stream>;
  using WsStream = websocket::stream<NextLayer>;

public:
  SessionImpl(TunnelClient &client, TunnelConfig config,
              EndpointParts endpoint, LocalEndpointParts local_endpoint)
      : client_(&client), config_(std::move(config)),
        endpoint_(std::move(endpoint)),
        max_payload_bytes_(
            static_cast<std::size_t>(std::max(1, config_.max_payload_bytes))),
        forwarder_(client.ioc_, std::move(local_endpoint),
                   config_.request_timeout_seconds, max_payload_bytes_,
                   config_.verify_tls),
        resolver_(client.strand_), ssl_ctx_(ssl::context::tls_client) {
    if constexpr (Secure) {
      ConfigureSsl();
      ws_.emplace(client.strand_, ssl_ctx_);
    } else {
      ws_.emplace(client.strand_);
    }
  }

  void Start() override { Resolve(); }

  void Stop() override {
    closing_ = true;
    resolver_.cancel();
    Close(CloseReason::Stopped);
  }

  void Detach() override { client_ = nullptr; }

private:
  void ConfigureSsl() {
    if (config_.verify_tls) {
      try {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
        ssl_ctx_.set_verify_callback(ssl::host_name_verification(endpoint_.host));
      } catch (const boost::system::system_error &ex) {
        BOOST_LOG_SEV(lg_, trivial::warning)
            << "Tunnel TLS verify setup failed, continuing: " << ex.what();
      }
    } else {
      ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
  }

  void SetState(State state) {
    if (client_) {
      client_->state_.store(state);
    }
    BOOST_LOG_SEV(lg_, trivial::trace) << "Tunnel state -> " << StateName(state);
  }

  void Resolve() {
    SetState(State::Connecting);
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Tunnel resolving " << endpoint_.host << ':' << endpoint_.port;
    resolver_.async_resolve(
        endpoint_.host, endpoint_.port,
        beast::bind_front_handler(&SessionImpl::OnResolve,
                                  this->shared_from_this()));
  }

  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Fail("resolve", ec);
      return;
    }
    beast::get_lowest_layer(*ws_).expires_after(
        std::chrono::seconds(std::max(1, config_.connect_timeout_seconds)));
    beast::get_lowest_layer(*ws_).async_connect(
        results, beast::bind_front_handler(&SessionImpl::OnConnect,
                                           this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Fail("connect", ec);
      return;
    }
    if constexpr (Secure) {
      if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(),
                                    endpoint_.host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Fail("set_sni", sni_error);
        return;
      }
      ws_->next_layer().async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&SessionImpl::OnTlsHandshake,
                                    this->shared_from_this()));
    } else {
      DoWsHandshake();
    }
  }

  void OnTlsHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail("tls_handshake", ec);
      return;
    }
    DoWsHandshake();
  }

  void DoWsHandshake() {
    // The websocket layer applies its own timeouts from here on.
    beast::get_lowest_layer(*ws_).expires_never();

    auto timeouts =
        websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout =
        std::chrono::seconds(std::max(1, config_.connect_timeout_seconds));
    // Beast pings once half the idle timeout has passed without traffic.
    timeouts.idle_timeout =
        std::chrono::seconds(2 * std::max(1, config_.ping_interval_seconds));
    timeouts.keep_alive_pings = true;
    ws_->set_option(timeouts);
    ws_->set_option(
        websocket::stream_base::decorator([](websocket::request_type &req) {
          req.set(http::field::user_agent,
                  std::string("hookhub/") + HOOKHUB_VERSION);
        }));
    ws_->read_message_max(max_payload_bytes_ + 64 * 1024);

    std::string host = endpoint_.host;
    const bool default_port = endpoint_.port == (Secure ? "443" : "80");
    if (!default_port) {
      host += ':';
      host += endpoint_.port;
    }
    ws_->async_handshake(host, endpoint_.target,
                         beast::bind_front_handler(&SessionImpl::OnWsHandshake,
                                                   this->shared_from_this()));
  }

  void OnWsHandshake(const beast::error_code &ec) {
    if (ec) {
      Fail("ws_handshake", ec);
      return;
    }
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Tunnel websocket established to " << endpoint_.host
        << endpoint_.target;
    SetState(State::Authenticating);

    TunnelHello hello;
    hello.secret = config_.secret;
    hello.client_version = HOOKHUB_VERSION;
    hello_payload_ = json::serialize(json::value_from(hello));
    ws_->text(true);
    ws_->async_write(net::buffer(hello_payload_),
                     beast::bind_front_handler(&SessionImpl::OnHelloSent,
                                               this->shared_from_this()));
    StartRead();
  }

  void OnHelloSent(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Fail("hello write", ec);
    }
  }

  void StartRead() {
    ws_->async_read(read_buffer_,
                    beast::bind_front_handler(&SessionImpl::OnRead,
                                              this->shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t bytes_transferred) {
    if (ec) {
      if (closing_) {
        NotifyClosed(close_reason_);
        return;
      }
      if (ec == websocket::error::closed) {
        const auto &reason = ws_->reason().reason;
        BOOST_LOG_SEV(lg_, trivial::warning)
            << "Tunnel websocket closed by relay: "
            << std::string(reason.data(), reason.size());
        NotifyClosed(CloseReason::TransportError);
        return;
      }
      Fail("read", ec);
      return;
    }
    std::string payload = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(bytes_transferred);

    if (!relaying_) {
      HandleHandshakeReply(payload);
      return;
    }
    if (ws_->got_binary()) {
      HandleRelayed(payload);
    } else {
      BOOST_LOG_SEV(lg_, trivial::debug)
          << "Tunnel ignoring " << payload.size() << " byte text frame";
    }
    StartRead();
  }

  void HandleHandshakeReply(const std::string &payload) {
    if (!ws_->got_text()) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Tunnel expected a handshake reply, got a binary frame";
      Close(CloseReason::TransportError);
      return;
    }
    try {
      auto jv = json::parse(payload);
      const auto type = PeekMessageType(jv);
      if (type == "welcome") {
        auto welcome = json::value_to<TunnelWelcome>(jv);
        relaying_ = true;
        SetState(State::Relaying);
        BOOST_LOG_SEV(lg_, trivial::info)
            << "Tunnel authenticated as connection " << welcome.connection_id
            << " (relay version " << welcome.server_version << ")";
        if (client_) {
          client_->HandleSessionConnected(welcome.connection_id);
        }
        StartRead();
        return;
      }
      if (type == "reject") {
        auto reject = json::value_to<TunnelReject>(jv);
        BOOST_LOG_SEV(lg_, trivial::error)
            << "Relay rejected the tunnel (" << reject.code
            << "): " << reject.reason;
        Close(CloseReason::Rejected);
        return;
      }
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Tunnel expected welcome or reject, got '" << type << "'";
    } catch (const std::exception &ex) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Tunnel received malformed handshake reply: " << ex.what();
    }
    Close(CloseReason::TransportError);
  }

  void HandleRelayed(const std::string &payload) {
    RelayedRequest request;
    try {
      request = relay_codec::Decode(payload);
    } catch (const DecodeError &ex) {
      BOOST_LOG_SEV(lg_, trivial::warning)
          << "Dropping malformed relayed frame (" << payload.size()
          << " bytes): " << ex.what();
      return;
    }
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Relayed " << http::to_string(request.method) << ' '
        << request.target << " (" << request.body.size() << " byte body)";
    forwarder_.Forward(std::move(request));
  }

  void Close(CloseReason reason) {
    if (notified_close_) {
      return;
    }
    close_reason_ = reason;
    closing_ = true;
    if (ws_->is_open()) {
      ws_->async_close(websocket::close_code::normal,
                       beast::bind_front_handler(&SessionImpl::OnClose,
                                                 this->shared_from_this()));
    } else {
      NotifyClosed(reason);
    }
  }

  void OnClose(const beast::error_code &ec) {
    if (ec && ec != net::error::operation_aborted) {
      BOOST_LOG_SEV(lg_, trivial::debug)
          << "Tunnel websocket close error: " << ec.message();
    }
    NotifyClosed(close_reason_);
  }

  void Fail(const char *context, const beast::error_code &ec) {
    if (closing_) {
      NotifyClosed(close_reason_);
      return;
    }
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Tunnel " << context << " error: " << ec.message();
    NotifyClosed(CloseReason::TransportError);
  }

  void NotifyClosed(CloseReason reason) {
    if (notified_close_) {
      return;
    }
    notified_close_ = true;
    resolver_.cancel();
    beast::error_code ignored;
    beast::get_lowest_layer(*ws_).socket().close(ignored);
    if (client_) {
      client_->HandleSessionClosed(reason);
    }
  }

  TunnelClient *client_;
  TunnelConfig config_;
  EndpointParts endpoint_;
  std::size_t max_payload_bytes_;
  LocalForwarder forwarder_;
  tcp::resolver resolver_;
  ssl::context ssl_ctx_;
  std::optional<WsStream> ws_;
  beast::flat_buffer read_buffer_;
  std::string hello_payload_;
  bool relaying_{false};
  bool closing_{false};
  bool notified_close_{false};
  CloseReason close_reason_{CloseReason::TransportError};
  src::severity_logger<trivial::severity_level> lg_;
};

TunnelClient::TunnelClient(IoContextManager &io_context_manager,
                           ITunnelConfigProvider &config_provider)
    : ioc_(io_context_manager.ioc()), strand_(net::make_strand(ioc_)),
      config_provider_(config_provider), reconnect_timer_(strand_),
      cancelled_(std::make_shared<bool>(false)),
      rng_(std::random_device{}()) {}

TunnelClient::~TunnelClient() { Stop(); }

void TunnelClient::Start() {
  if (running_.exchange(true)) {
    BOOST_LOG_SEV(lg, trivial::debug) << "Tunnel client already running";
    return;
  }
  auth_failed_.store(false);
  TunnelConfig config = config_provider_.get();
  BOOST_LOG_SEV(lg, trivial::info)
      << "Tunnel client connecting to " << config.remote_endpoint
      << ", forwarding to " << config.local_base_url;
  BOOST_LOG_SEV(lg, trivial::debug) << fmt::format(
      "tunnel cfg: ping={}s timeout={}s max_payload={}B verify_tls={} "
      "reconnect={}",
      config.ping_interval_seconds, config.request_timeout_seconds,
      config.max_payload_bytes, config.verify_tls, config.reconnect);

  net::dispatch(strand_, [this, config = std::move(config)]() mutable {
    cancelled_ = std::make_shared<bool>(false);
    backoff_.UpdateOptions(BuildBackoffOptions(config));
    backoff_.Reset();
    StartSession(std::move(config));
  });
}

void TunnelClient::Stop() {
  const bool was_running = running_.exchange(false);
  auto finish = [this]() {
    *cancelled_ = true;
    reconnect_timer_.cancel();
    if (session_) {
      session_->Detach();
      session_->Stop();
      session_.reset();
    }
    state_.store(State::Disconnected);
  };

  if (strand_.running_in_this_thread() || ioc_.stopped()) {
    finish();
  } else {
    // Whoever claims first runs finish(). A handler that only gets to run
    // after the client is gone finds the claim taken and leaves it alone.
    auto claimed = std::make_shared<std::atomic<bool>>(false);
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    net::post(strand_, [finish, claimed, done]() {
      if (!claimed->exchange(true)) {
        finish();
      }
      done->set_value();
    });
    const auto started = std::chrono::steady_clock::now();
    bool warned = false;
    while (fut.wait_for(std::chrono::milliseconds(100)) !=
           std::future_status::ready) {
      if (ioc_.stopped() && !claimed->exchange(true)) {
        // The context stopped with the handler still queued.
        finish();
        break;
      }
      if (!warned &&
          std::chrono::steady_clock::now() - started > std::chrono::seconds(5)) {
        BOOST_LOG_SEV(lg, trivial::warning)
            << "Tunnel client stop still waiting on the strand after 5s";
        warned = true;
      }
    }
  }
  if (was_running) {
    BOOST_LOG_SEV(lg, trivial::info) << "Tunnel client stopped";
  }
}

void TunnelClient::StartSession(TunnelConfig config) {
  if (!running_.load()) {
    return;
  }
  reconnect_timer_.cancel();
  EndpointParts remote_endpoint;
  LocalEndpointParts local_endpoint;
  try {
    remote_endpoint = ParseEndpoint(config.remote_endpoint, kDefaultTunnelPath);
    local_endpoint = ParseLocalEndpoint(config.local_base_url);
  } catch (const std::exception &ex) {
    // Retrying cannot fix a bad endpoint.
    BOOST_LOG_SEV(lg, trivial::error)
        << "Tunnel configuration error: " << ex.what();
    running_.store(false);
    state_.store(State::Disconnected);
    return;
  }

  if (remote_endpoint.secure) {
    session_ = std::make_shared<SessionImpl<true>>(
        *this, std::move(config), std::move(remote_endpoint),
        std::move(local_endpoint));
  } else {
    session_ = std::make_shared<SessionImpl<false>>(
        *this, std::move(config), std::move(remote_endpoint),
        std::move(local_endpoint));
  }
  session_->Start();
}

void TunnelClient::HandleSessionClosed(CloseReason reason) {
  if (session_) {
    session_->Detach();
    session_.reset();
  }
  state_.store(State::Disconnected);
  connection_id_.store(0);

  if (reason == CloseReason::Rejected) {
    auth_failed_.store(true);
    running_.store(false);
    BOOST_LOG_SEV(lg, trivial::error)
        << "Tunnel client stopping: the relay refused the credentials";
    return;
  }
  if (!running_.load() || reason == CloseReason::Stopped) {
    return;
  }
  if (!config_provider_.get().reconnect) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Tunnel session closed; reconnect disabled";
    running_.store(false);
    return;
  }
  ScheduleReconnect();
}

void TunnelClient::HandleSessionConnected(std::uint64_t connection_id) {
  BOOST_LOG_SEV(lg, trivial::info) << "Tunnel session established";
  connection_id_.store(connection_id);
  backoff_.Reset();
}

void TunnelClient::ScheduleReconnect() {
  if (!running_.load()) {
    return;
  }
  TunnelConfig cfg = config_provider_.get();
  backoff_.UpdateOptions(BuildBackoffOptions(cfg));
  auto delay = backoff_.NextDelay(rng_);
  BOOST_LOG_SEV(lg, trivial::warning)
      << "Tunnel reconnect scheduled in " << delay.count() << " ms";
  reconnect_timer_.expires_after(delay);
  reconnect_timer_.async_wait(
      [this, cancelled = cancelled_,
       cfg = std::move(cfg)](const boost::system::error_code &ec) mutable {
        // A wait that already completed when Stop() ran can still land here
        // after the client is gone.
        if (ec || *cancelled) {
          return;
        }
        if (!running_.load()) {
          return;
        }
        StartSession(std::move(cfg));
      });
}

ExponentialBackoffOptions
TunnelClient::BuildBackoffOptions(const TunnelConfig &config) const {
  ExponentialBackoffOptions opts;
  const int initial = std::max(100, config.reconnect_initial_delay_ms);
  const int maximum = std::max(initial, config.reconnect_max_delay_ms);
  const int jitter = std::max(0, config.reconnect_jitter_ms);
  opts.initial_delay = std::chrono::milliseconds(initial);
  opts.max_delay = std::chrono::milliseconds(maximum);
  opts.jitter = std::chrono::milliseconds(jitter);
  return opts;
}

} // namespace hookhub
