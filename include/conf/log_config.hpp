#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace hookhub {

struct LogConfig {
  std::string level{"info"};
  std::string log_dir;           // empty: console only
  std::string log_file{"hookhub"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LogConfig tag_invoke(const boost::json::value_to_tag<LogConfig> &,
                              const boost::json::value &jv) {
    const auto *obj = jv.if_object();
    if (!obj) {
      throw std::runtime_error("LogConfig is not an object");
    }
    LogConfig cfg{};
    if (auto *p = obj->if_contains("level"); p && p->is_string()) {
      cfg.level = std::string(p->as_string().c_str());
    }
    if (auto *p = obj->if_contains("log_dir"); p && p->is_string()) {
      cfg.log_dir = std::string(p->as_string().c_str());
    }
    if (auto *p = obj->if_contains("log_file"); p && p->is_string()) {
      cfg.log_file = std::string(p->as_string().c_str());
    }
    if (auto *p = obj->if_contains("rotation_size")) {
      cfg.rotation_size = p->to_number<std::uint64_t>();
    }
    return cfg;
  }

  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const LogConfig &cfg) {
    jv = boost::json::object{{"level", cfg.level},
                             {"log_dir", cfg.log_dir},
                             {"log_file", cfg.log_file},
                             {"rotation_size", cfg.rotation_size}};
  }
};

} // namespace hookhub
