#include "tunnel/tunnel_messages.hpp"

#include "hookhub_error.hpp"

#include <fmt/format.h>

namespace hookhub {
namespace json = boost::json;

namespace {

const json::object &RequireObject(const json::value &jv, const char *ctx) {
  if (!jv.is_object()) {
    throw DecodeError(fmt::format("{} must be an object", ctx));
  }
  return jv.as_object();
}

std::string RequireString(const json::object &obj, const char *key,
                          const char *ctx) {
  if (auto *p = obj.if_contains(key)) {
    if (p->is_string()) {
      return std::string(p->as_string().c_str());
    }
  }
  throw DecodeError(fmt::format("{} missing string field '{}'", ctx, key));
}

std::string OptionalString(const json::object &obj, const char *key) {
  if (auto *p = obj.if_contains(key); p && p->is_string()) {
    return std::string(p->as_string().c_str());
  }
  return {};
}

void RequireType(const json::object &obj, const char *expected,
                 const char *ctx) {
  if (RequireString(obj, "type", ctx) != expected) {
    throw DecodeError(fmt::format("{} has wrong type field", ctx));
  }
}

} // namespace

std::string PeekMessageType(const json::value &jv) {
  const auto &obj = RequireObject(jv, "tunnel message");
  return RequireString(obj, "type", "tunnel message");
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const TunnelHello &hello) {
  jv = json::object{{"type", "hello"},
                    {"secret", hello.secret},
                    {"client_version", hello.client_version}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const TunnelWelcome &welcome) {
  jv = json::object{{"type", "welcome"},
                    {"connection_id", welcome.connection_id},
                    {"server_version", welcome.server_version}};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const TunnelReject &reject) {
  jv = json::object{
      {"type", "reject"}, {"code", reject.code}, {"reason", reject.reason}};
}

TunnelHello tag_invoke(const json::value_to_tag<TunnelHello> &,
                       const json::value &jv) {
  const auto &obj = RequireObject(jv, "TunnelHello");
  RequireType(obj, "hello", "TunnelHello");
  TunnelHello hello;
  hello.secret = RequireString(obj, "secret", "TunnelHello");
  hello.client_version = OptionalString(obj, "client_version");
  return hello;
}

TunnelWelcome tag_invoke(const json::value_to_tag<TunnelWelcome> &,
                         const json::value &jv) {
  const auto &obj = RequireObject(jv, "TunnelWelcome");
  RequireType(obj, "welcome", "TunnelWelcome");
  TunnelWelcome welcome;
  if (auto *p = obj.if_contains("connection_id")) {
    welcome.connection_id = p->to_number<std::uint64_t>();
  }
  welcome.server_version = OptionalString(obj, "server_version");
  return welcome;
}

TunnelReject tag_invoke(const json::value_to_tag<TunnelReject> &,
                        const json::value &jv) {
  const auto &obj = RequireObject(jv, "TunnelReject");
  RequireType(obj, "reject", "TunnelReject");
  TunnelReject reject;
  if (auto *p = obj.if_contains("code")) {
    reject.code = p->to_number<int>();
  }
  reject.reason = OptionalString(obj, "reason");
  return reject;
}

} // namespace hookhub
