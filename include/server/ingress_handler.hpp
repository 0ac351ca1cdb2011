#pragma once

#include <boost/beast/http.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <optional>

#include "relay/relayed_request.hpp"
#include "server/hub.hpp"

namespace hookhub {

// Turns every inbound webhook call into a broadcast frame and answers 200
// without waiting on any tunnel.
class IngressHandler {
public:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response = boost::beast::http::response<boost::beast::http::empty_body>;

  explicit IngressHandler(Hub &hub) : hub_(hub) {}

  Response Handle(const Request &req);

  // Hop-by-hop and endpoint-bound headers are dropped. Returns nullopt for a
  // method Beast does not enumerate.
  static std::optional<RelayedRequest> BuildRelayedRequest(const Request &req);

  static bool IsForwardableHeader(std::string_view name);

private:
  Hub &hub_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg_;
};

} // namespace hookhub
