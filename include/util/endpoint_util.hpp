#pragma once

#include <string>
#include <string_view>

namespace hookhub {

struct EndpointParts {
  bool secure{false};
  std::string host;
  std::string port{"80"};
  std::string target{"/"};
  // The endpoint URL with default_target filled in.
  std::string url;
};

struct LocalEndpointParts {
  bool secure{false};
  std::string host;
  std::string port{"80"};
  std::string base_path{"/"};
  std::string host_header;
};

// ws:// or wss:// tunnel endpoint. An empty or "/" path is replaced by
// default_target. Throws std::runtime_error on invalid input.
EndpointParts ParseEndpoint(const std::string &endpoint,
                            const std::string &default_target);

// http:// or https:// base URL of the local server. Throws
// std::runtime_error on invalid input.
LocalEndpointParts ParseLocalEndpoint(const std::string &endpoint);

// Joins an incoming "path?query" onto the local base path, keeping the query.
std::string BuildLocalTarget(const std::string &base_path,
                             std::string_view incoming);

} // namespace hookhub
