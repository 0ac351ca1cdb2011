#pragma once

#include <boost/beast/http/verb.hpp>

#include <string>
#include <utility>
#include <vector>

namespace hookhub {

// Ordered, duplicate-preserving list of (name, value) pairs.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// One inbound webhook call as it travels through the tunnel.
struct RelayedRequest {
  boost::beast::http::verb method{boost::beast::http::verb::get};
  std::string target{"/"}; // path plus query, as received
  HeaderList headers;
  std::string body; // raw bytes, may contain NUL

  friend bool operator==(const RelayedRequest &lhs,
                         const RelayedRequest &rhs) {
    return lhs.method == rhs.method && lhs.target == rhs.target &&
           lhs.headers == rhs.headers && lhs.body == rhs.body;
  }
  friend bool operator!=(const RelayedRequest &lhs,
                         const RelayedRequest &rhs) {
    return !(lhs == rhs);
  }
};

} // namespace hookhub
