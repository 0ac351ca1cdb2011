#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <string>

namespace hookhub {

inline constexpr const char *kDefaultTunnelPath = "/__hookhub__/";

// Handshake frames, sent as websocket text frames. Relayed requests travel
// as binary frames (see relay/relay_codec.hpp).

struct TunnelHello {
  std::string type{"hello"};
  std::string secret;
  std::string client_version;
};

struct TunnelWelcome {
  std::string type{"welcome"};
  std::uint64_t connection_id{0};
  std::string server_version;
};

struct TunnelReject {
  std::string type{"reject"};
  int code{0};
  std::string reason;
};

// Returns the "type" field; throws DecodeError when absent.
std::string PeekMessageType(const boost::json::value &jv);

void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const TunnelHello &hello);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const TunnelWelcome &welcome);
void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv,
                const TunnelReject &reject);

TunnelHello tag_invoke(const boost::json::value_to_tag<TunnelHello> &,
                       const boost::json::value &jv);
TunnelWelcome tag_invoke(const boost::json::value_to_tag<TunnelWelcome> &,
                         const boost::json::value &jv);
TunnelReject tag_invoke(const boost::json::value_to_tag<TunnelReject> &,
                        const boost::json::value &jv);

} // namespace hookhub
