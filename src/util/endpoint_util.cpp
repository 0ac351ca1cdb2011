#include "util/endpoint_util.hpp"

#include <boost/url.hpp>

#include <fmt/format.h>
#include <stdexcept>

namespace hookhub {
namespace urls = boost::urls;

namespace {

std::string NormalizeIncomingPath(std::string_view path) {
  if (path.empty()) {
    return "/";
  }
  if (path[0] != '/') {
    return '/' + std::string(path);
  }
  return std::string(path);
}

std::string JoinLocalPath(const std::string &base_path,
                          const std::string &incoming) {
  const std::string normalized = NormalizeIncomingPath(incoming);
  if (base_path.empty() || base_path == "/") {
    return normalized;
  }
  if (base_path.back() == '/') {
    if (normalized.size() > 1) {
      return base_path + normalized.substr(1);
    }
    return base_path;
  }
  if (normalized == "/") {
    return base_path;
  }
  return base_path + normalized;
}

} // namespace

EndpointParts ParseEndpoint(const std::string &endpoint,
                            const std::string &default_target) {
  auto parsed = urls::parse_uri(endpoint);
  if (!parsed) {
    throw std::runtime_error(fmt::format("invalid tunnel endpoint '{}': {}",
                                         endpoint, parsed.error().message()));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    throw std::runtime_error(
        fmt::format("tunnel endpoint missing host: '{}'", endpoint));
  }

  EndpointParts parts;
  const std::string scheme(url.scheme());
  if (scheme == "wss") {
    parts.secure = true;
  } else if (scheme != "ws") {
    throw std::runtime_error(fmt::format(
        "tunnel endpoint must use ws:// or wss:// scheme (got '{}')", scheme));
  }
  parts.host = std::string(url.host());
  if (url.has_port()) {
    parts.port = std::string(url.port());
  } else {
    parts.port = parts.secure ? "443" : "80";
  }
  urls::url normalized(url);
  std::string target = std::string(url.encoded_path());
  if (target.empty() || target == "/") {
    target = default_target.empty() ? std::string("/") : default_target;
    normalized.set_encoded_path(target);
  }
  parts.url = std::string(normalized.buffer());
  if (url.has_query()) {
    target += "?";
    target += std::string(url.encoded_query());
  }
  parts.target = target;
  return parts;
}

LocalEndpointParts ParseLocalEndpoint(const std::string &endpoint) {
  auto parsed = urls::parse_uri(endpoint);
  if (!parsed) {
    throw std::runtime_error(fmt::format("invalid local_base_url '{}': {}",
                                         endpoint, parsed.error().message()));
  }
  const auto &url = parsed.value();
  if (!url.has_authority() || url.host().empty()) {
    throw std::runtime_error(
        fmt::format("local_base_url missing host: '{}'", endpoint));
  }
  LocalEndpointParts parts;
  const std::string scheme(url.scheme());
  if (scheme == "https") {
    parts.secure = true;
  } else if (scheme != "http") {
    throw std::runtime_error(fmt::format(
        "local_base_url must use http:// or https:// scheme (got '{}')",
        scheme));
  }
  const std::string default_port = parts.secure ? "443" : "80";
  parts.host = std::string(url.host());
  parts.port = url.has_port() ? std::string(url.port()) : default_port;
  std::string base_path = std::string(url.encoded_path());
  if (base_path.empty()) {
    base_path = "/";
  }
  parts.base_path = base_path;
  parts.host_header = parts.host;
  if (parts.port != default_port) {
    parts.host_header += ':';
    parts.host_header += parts.port;
  }
  return parts;
}

std::string BuildLocalTarget(const std::string &base_path,
                             std::string_view incoming) {
  const auto pos = incoming.find('?');
  const std::string_view path =
      pos == std::string_view::npos ? incoming : incoming.substr(0, pos);
  std::string target = JoinLocalPath(base_path, std::string(path));
  if (pos != std::string_view::npos) {
    target += std::string(incoming.substr(pos));
  }
  return target;
}

} // namespace hookhub
