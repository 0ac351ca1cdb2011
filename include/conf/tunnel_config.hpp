#pragma once

#include <boost/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace hookhub {

struct TunnelConfig {
  std::string remote_endpoint{"ws://127.0.0.1:8080/__hookhub__/"};
  std::string secret;
  std::string local_base_url{"http://127.0.0.1:3000/"};
  bool verify_tls{true};
  bool reconnect{true};
  int request_timeout_seconds{30};
  int connect_timeout_seconds{10};
  int ping_interval_seconds{20};
  int max_payload_bytes{5 * 1024 * 1024};
  int reconnect_initial_delay_ms{1000};
  int reconnect_max_delay_ms{30000};
  int reconnect_jitter_ms{250};

  friend TunnelConfig tag_invoke(const boost::json::value_to_tag<TunnelConfig> &,
                                 const boost::json::value &jv) {
    TunnelConfig cfg{};
    if (auto *obj = jv.if_object()) {
      if (auto *p = obj->if_contains("remote_endpoint"); p && p->is_string()) {
        cfg.remote_endpoint = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("secret"); p && p->is_string()) {
        cfg.secret = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("local_base_url"); p && p->is_string()) {
        cfg.local_base_url = std::string(p->as_string().c_str());
      }
      if (auto *p = obj->if_contains("verify_tls")) {
        cfg.verify_tls = p->as_bool();
      }
      if (auto *p = obj->if_contains("reconnect")) {
        cfg.reconnect = p->as_bool();
      }
      if (auto *p = obj->if_contains("request_timeout_seconds")) {
        cfg.request_timeout_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("connect_timeout_seconds")) {
        cfg.connect_timeout_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("ping_interval_seconds")) {
        cfg.ping_interval_seconds = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("max_payload_bytes")) {
        cfg.max_payload_bytes = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("reconnect_initial_delay_ms")) {
        cfg.reconnect_initial_delay_ms = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("reconnect_max_delay_ms")) {
        cfg.reconnect_max_delay_ms = p->to_number<int>();
      }
      if (auto *p = obj->if_contains("reconnect_jitter_ms")) {
        cfg.reconnect_jitter_ms = p->to_number<int>();
      }
      return cfg;
    }
    throw std::runtime_error("TunnelConfig is not an object");
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const TunnelConfig &cfg) {
    jv = boost::json::object{
        {"remote_endpoint", cfg.remote_endpoint},
        {"local_base_url", cfg.local_base_url},
        {"verify_tls", cfg.verify_tls},
        {"reconnect", cfg.reconnect},
        {"request_timeout_seconds", cfg.request_timeout_seconds},
        {"connect_timeout_seconds", cfg.connect_timeout_seconds},
        {"ping_interval_seconds", cfg.ping_interval_seconds},
        {"max_payload_bytes", cfg.max_payload_bytes},
        {"reconnect_initial_delay_ms", cfg.reconnect_initial_delay_ms},
        {"reconnect_max_delay_ms", cfg.reconnect_max_delay_ms},
        {"reconnect_jitter_ms", cfg.reconnect_jitter_ms}};
  }
};

class ITunnelConfigProvider {
public:
  virtual ~ITunnelConfigProvider() = default;
  virtual const TunnelConfig &get() const = 0;
};

class StaticTunnelConfigProvider : public ITunnelConfigProvider {
public:
  explicit StaticTunnelConfigProvider(TunnelConfig cfg)
      : config_(std::move(cfg)) {}

  const TunnelConfig &get() const override { return config_; }

private:
  TunnelConfig config_;
};

} // namespace hookhub
