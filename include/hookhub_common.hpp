#pragma once

#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace po = boost::program_options;

namespace hookhub {

struct CliParams {
  std::string subcmd;
  std::string verbose; // trace|debug|info|warning|error or v-count
  std::optional<std::string> config_dir;
  std::optional<std::string> log_dir;
  // server
  std::string bind_addr;
  int threads = 2;
  // connect / profiles add
  std::optional<std::string> profile;
  std::optional<std::string> remote;
  std::optional<std::string> secret;
  std::optional<std::string> local;
  bool insecure = false;
  bool no_reconnect = false;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  CliParams params;

  CliCtx(po::variables_map &&vm, std::vector<std::string> &&positionals,
         CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        params(std::move(params_)) {}

  // True when the option came from the command line or the environment
  // rather than its default_value.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }

  // positionals[0] is the subcommand.
  std::optional<std::string> positional_at(std::size_t index) const {
    if (index < positionals.size()) {
      return positionals[index];
    }
    return std::nullopt;
  }

  // Maps --verbose onto a Boost.Log level name; "vvvv" counts as debug.
  std::string log_level() const {
    const auto &v = params.verbose;
    if (v.empty()) {
      return "info";
    }
    if (v == "trace" || v == "debug" || v == "info" || v == "warning" ||
        v == "error" || v == "fatal") {
      return v;
    }
    const auto count = std::count(v.begin(), v.end(), 'v');
    if (count >= 5) {
      return "trace";
    } else if (count == 4) {
      return "debug";
    } else if (count == 3) {
      return "info";
    } else if (count == 2) {
      return "warning";
    } else if (count == 1) {
      return "error";
    }
    return "info";
  }

  bool wants_help() const { return vm.count("help") > 0; }
  bool wants_version() const { return vm.count("version") > 0; }
};

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 3> kKnown{"server", "connect",
                                                          "profiles"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

// HOOKHUB_BIND_ADDR -> bind-addr and so on; anything else is ignored.
inline std::string map_env_option(const std::string &env_name) {
  static const std::array<std::pair<std::string_view, std::string_view>, 5>
      kMapped{{{"HOOKHUB_BIND_ADDR", "bind-addr"},
               {"HOOKHUB_SECRET", "secret"},
               {"HOOKHUB_LOG_DIR", "log-dir"},
               {"HOOKHUB_VERBOSE", "verbose"},
               {"HOOKHUB_THREADS", "threads"}}};
  for (const auto &[env, option] : kMapped) {
    if (env_name == env) {
      return std::string(option);
    }
  }
  return {};
}

po::options_description build_options_description(CliParams &params);

// Parses argv and then the HOOKHUB_* environment; the command line wins.
// Throws po::error on malformed input.
CliCtx parse_cli(int argc, const char *const argv[]);

} // namespace hookhub
