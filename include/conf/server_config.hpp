#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace hookhub {

struct ServerConfig {
  std::string bind_address{"0.0.0.0:8080"};
  std::string secret;
  std::string tunnel_path{"/__hookhub__/"};
  int threads{2};
  int read_timeout_seconds{30};
  int handshake_timeout_seconds{10};
  int write_timeout_seconds{10};
  int keep_alive_seconds{30};
  int max_pending_messages{256};
  std::uint64_t max_body_bytes{5 * 1024 * 1024};

  friend ServerConfig tag_invoke(const boost::json::value_to_tag<ServerConfig> &,
                                 const boost::json::value &jv) {
    ServerConfig cfg{};
    if (auto *obj = jv.if_object()) {
      if (auto *p = obj->if_contains("bind_address"); p && p->is_string()) {
        cfg.bind_address = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("secret"); p && p->is_string()) {
        cfg.secret = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("tunnel_path"); p && p->is_string()) {
        cfg.tunnel_path = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("threads")) {
        cfg.threads = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("read_timeout_seconds")) {
        cfg.read_timeout_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("handshake_timeout_seconds")) {
        cfg.handshake_timeout_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("write_timeout_seconds")) {
        cfg.write_timeout_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("keep_alive_seconds")) {
        cfg.keep_alive_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("max_pending_messages")) {
        cfg.max_pending_messages = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("max_body_bytes")) {
        cfg.max_body_bytes = p->to_number<std::uint64_t>();
      }
      return cfg;
    }
    throw std::runtime_error("ServerConfig is not an object");
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const ServerConfig &cfg) {
    jv = boost::json::object{
        {"bind_address", cfg.bind_address},
        {"tunnel_path", cfg.tunnel_path},
        {"threads", cfg.threads},
        {"read_timeout_seconds", cfg.read_timeout_seconds},
        {"handshake_timeout_seconds", cfg.handshake_timeout_seconds},
        {"write_timeout_seconds", cfg.write_timeout_seconds},
        {"keep_alive_seconds", cfg.keep_alive_seconds},
        {"max_pending_messages", cfg.max_pending_messages},
        {"max_body_bytes", cfg.max_body_bytes}};
  }
};

} // namespace hookhub
