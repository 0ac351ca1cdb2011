#include "server/ingress_handler.hpp"

#include "relay/relay_codec.hpp"
#include "util/my_logging.hpp"

#include <boost/beast/core/string.hpp>

#include <array>
#include <memory>

namespace hookhub {
namespace http = boost::beast::http;

namespace {

constexpr std::array<std::string_view, 9> kDroppedHeaders{
    "host",    "origin",           "connection", "keep-alive",
    "upgrade", "proxy-connection", "te",         "trailer",
    "transfer-encoding"};

} // namespace

bool IngressHandler::IsForwardableHeader(std::string_view name) {
  for (auto dropped : kDroppedHeaders) {
    if (boost::beast::iequals(name, dropped)) {
      return false;
    }
  }
  return true;
}

std::optional<RelayedRequest>
IngressHandler::BuildRelayedRequest(const Request &req) {
  if (req.method() == http::verb::unknown) {
    return std::nullopt;
  }
  RelayedRequest relayed;
  relayed.method = req.method();
  relayed.target = std::string(req.target());
  for (const auto &field : req) {
    const auto name = field.name_string();
    if (!IsForwardableHeader(std::string_view(name.data(), name.size()))) {
      continue;
    }
    std::string value(field.value());
    // obs-text values would fail decoding on every client
    if (!relay_codec::IsHeaderValueValid(value)) {
      continue;
    }
    relayed.headers.emplace_back(std::string(name), std::move(value));
  }
  relayed.body = req.body();
  return relayed;
}

IngressHandler::Response IngressHandler::Handle(const Request &req) {
  Response res{http::status::ok, req.version()};
  res.set(http::field::server, "hookhub");
  res.keep_alive(req.keep_alive());
  res.prepare_payload();

  auto relayed = BuildRelayedRequest(req);
  if (!relayed) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Not relaying request with unsupported method '"
        << req.method_string() << "' " << req.target();
    return res;
  }

  std::shared_ptr<const std::string> frame;
  try {
    frame = std::make_shared<const std::string>(relay_codec::Encode(*relayed));
  } catch (const EncodeError &ex) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to encode " << req.method_string() << ' ' << req.target()
        << ": " << ex.what();
    return res;
  }

  const auto count = hub_.Broadcast(std::move(frame));
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Forwarded request " << req.method_string() << ' ' << req.target()
      << " to " << count << " client(s)";
  return res;
}

} // namespace hookhub
