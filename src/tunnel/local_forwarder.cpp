#include "tunnel/local_forwarder.hpp"

#include "util/my_logging.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <memory>
#include <openssl/err.h>
#include <type_traits>

namespace hookhub {
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

template <bool Secure>
class LocalForwarder::LocalCall
    : public std::enable_shared_from_this<LocalForwarder::LocalCall<Secure>> {
  using Strand = net::strand<net::io_context::executor_type>;
  using Stream = std::conditional_t<Secure, ssl::stream<beast::tcp_stream>,
                                    beast::tcp_stream>;

public:
  LocalCall(LocalForwarder &owner, RelayedRequest request)
      : strand_(net::make_strand(owner.ioc_)), ssl_ctx_(owner.ssl_ctx_),
        resolver_(strand_), stream_(MakeStream(strand_, ssl_ctx_.get())),
        deadline_(strand_), endpoint_(owner.endpoint_),
        timeout_(std::chrono::seconds(
            std::max(1, owner.request_timeout_seconds_))),
        observer_(owner.observer_),
        started_(std::chrono::steady_clock::now()) {
    outcome_.method = std::string(http::to_string(request.method));
    outcome_.target = BuildLocalTarget(endpoint_.base_path, request.target);
    BuildHttpRequest(std::move(request));
    parser_.body_limit(owner.max_response_bytes_);
  }

  void Start() {
    auto self = this->shared_from_this();
    net::dispatch(strand_, [self]() {
      self->deadline_.expires_after(self->timeout_);
      self->deadline_.async_wait(
          beast::bind_front_handler(&LocalCall::OnTimeout, self));
      self->resolver_.async_resolve(
          self->endpoint_.host, self->endpoint_.port,
          beast::bind_front_handler(&LocalCall::OnResolve, self));
    });
  }

private:
  static Stream MakeStream(Strand strand, ssl::context *ctx) {
    if constexpr (Secure) {
      return Stream(strand, *ctx);
    } else {
      return Stream(strand);
    }
  }

  void BuildHttpRequest(RelayedRequest request) {
    http_request_.version(11);
    http_request_.method(request.method);
    http_request_.target(outcome_.target);
    for (auto &header : request.headers) {
      if (beast::iequals(header.first, "host")) {
        continue;
      }
      http_request_.insert(header.first, header.second);
    }
    const std::string host_value = endpoint_.host_header.empty()
                                       ? endpoint_.host
                                       : endpoint_.host_header;
    http_request_.set(http::field::host, host_value);
    http_request_.keep_alive(false);
    http_request_.body() = std::move(request.body);
    http_request_.prepare_payload();
  }

  void OnResolve(const beast::error_code &ec,
                 tcp::resolver::results_type results) {
    if (ec) {
      Complete(fmt::format("local resolve failed: {}", ec.message()));
      return;
    }
    beast::get_lowest_layer(stream_).async_connect(
        results, beast::bind_front_handler(&LocalCall::OnConnect,
                                           this->shared_from_this()));
  }

  void OnConnect(const beast::error_code &ec,
                 const tcp::resolver::results_type::endpoint_type &) {
    if (ec) {
      Complete(fmt::format("local connect failed: {}", ec.message()));
      return;
    }
    if constexpr (Secure) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(),
                                    endpoint_.host.c_str())) {
        beast::error_code sni_error{static_cast<int>(::ERR_get_error()),
                                    net::error::get_ssl_category()};
        Complete(fmt::format("local TLS setup failed: {}", sni_error.message()));
        return;
      }
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&LocalCall::OnTlsHandshake,
                                    this->shared_from_this()));
    } else {
      Send();
    }
  }

  void OnTlsHandshake(const beast::error_code &ec) {
    if (ec) {
      Complete(fmt::format("local TLS handshake failed: {}", ec.message()));
      return;
    }
    Send();
  }

  void Send() {
    http::async_write(stream_, http_request_,
                      beast::bind_front_handler(&LocalCall::OnWrite,
                                                this->shared_from_this()));
  }

  void OnWrite(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Complete(fmt::format("local write failed: {}", ec.message()));
      return;
    }
    http::async_read(stream_, buffer_, parser_,
                     beast::bind_front_handler(&LocalCall::OnRead,
                                               this->shared_from_this()));
  }

  void OnRead(const beast::error_code &ec, std::size_t) {
    if (ec) {
      Complete(fmt::format("local read failed: {}", ec.message()));
      return;
    }
    outcome_.status = parser_.get().result_int();
    Complete({});
  }

  void OnTimeout(const beast::error_code &ec) {
    if (ec == net::error::operation_aborted || completed_) {
      return;
    }
    Complete(fmt::format("local request timed out after {}s",
                         timeout_.count()));
  }

  void Complete(std::string error) {
    if (completed_) {
      return;
    }
    completed_ = true;
    deadline_.cancel();
    resolver_.cancel();
    beast::error_code ignored;
    auto &socket = beast::get_lowest_layer(stream_).socket();
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);

    outcome_.error = std::move(error);
    outcome_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    if (outcome_.ok()) {
      BOOST_LOG_SEV(lg_, trivial::info)
          << outcome_.method << ' ' << outcome_.target << " -> "
          << outcome_.status << " (" << outcome_.elapsed.count() << " ms)";
    } else {
      BOOST_LOG_SEV(lg_, trivial::warning)
          << outcome_.method << ' ' << outcome_.target << " failed: "
          << outcome_.error << " (" << outcome_.elapsed.count() << " ms)";
    }
    if (observer_) {
      observer_(outcome_);
    }
  }

  Strand strand_;
  std::shared_ptr<ssl::context> ssl_ctx_;
  tcp::resolver resolver_;
  Stream stream_;
  net::steady_timer deadline_;
  LocalEndpointParts endpoint_;
  std::chrono::seconds timeout_;
  Observer observer_;
  src::severity_logger<trivial::severity_level> lg_;
  std::chrono::steady_clock::time_point started_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> http_request_;
  http::response_parser<http::string_body> parser_;
  ForwardOutcome outcome_;
  bool completed_{false};
};

LocalForwarder::LocalForwarder(net::io_context &ioc,
                               LocalEndpointParts endpoint,
                               int request_timeout_seconds,
                               std::size_t max_response_bytes,
                               bool verify_tls)
    : ioc_(ioc), endpoint_(std::move(endpoint)),
      request_timeout_seconds_(request_timeout_seconds),
      max_response_bytes_(max_response_bytes) {
  if (!endpoint_.secure) {
    return;
  }
  ssl_ctx_ = std::make_shared<ssl::context>(ssl::context::tls_client);
  if (verify_tls) {
    try {
      ssl_ctx_->set_default_verify_paths();
    } catch (const boost::system::system_error &ex) {
      BOOST_LOG_SEV(lg_, trivial::warning)
          << "Local TLS default verify paths unavailable: " << ex.what();
    }
    ssl_ctx_->set_verify_mode(ssl::verify_peer);
    ssl_ctx_->set_verify_callback(ssl::host_name_verification(endpoint_.host));
  } else {
    ssl_ctx_->set_verify_mode(ssl::verify_none);
  }
}

void LocalForwarder::Forward(RelayedRequest request) {
  BOOST_LOG_SEV(lg_, trivial::trace)
      << "Forwarding " << http::to_string(request.method) << ' '
      << request.target << " to " << endpoint_.host << ':' << endpoint_.port;
  if (endpoint_.secure) {
    std::make_shared<LocalCall<true>>(*this, std::move(request))->Start();
  } else {
    std::make_shared<LocalCall<false>>(*this, std::move(request))->Start();
  }
}

} // namespace hookhub
