#include "hookhub_entry.hpp"

#include "conf/config_loader.hpp"
#include "conf/log_config.hpp"
#include "conf/profiles.hpp"
#include "conf/server_config.hpp"
#include "conf/tunnel_config.hpp"
#include "hookhub_error.hpp"
#include "server/relay_server.hpp"
#include "tunnel/tunnel_client.hpp"
#include "util/my_logging.hpp"
#include "version.h"

#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>

namespace hookhub {
namespace net = boost::asio;

App::App(CliCtx &ctx) : ctx_(ctx), signal_io_(1, "signals") {}

void App::PrintUsage(std::ostream &os) {
  CliParams scratch;
  os << "Usage: hookhub <subcommand> [options]" << std::endl << std::endl;
  os << build_options_description(scratch) << std::endl;
  os << "Subcommands:" << std::endl
     << "  server                       Accept webhooks and relay them to "
        "connected tunnels."
     << std::endl
     << "  connect                      Open a tunnel and replay relayed "
        "requests locally."
     << std::endl
     << "  profiles list|add [NAME]|delete NAME" << std::endl
     << "                               Manage saved connect profiles."
     << std::endl;
}

std::filesystem::path App::ConfigDir() const {
  return ResolveConfigDir(ctx_.params.config_dir);
}

int App::Run() {
  if (ctx_.wants_version()) {
    std::cout << HOOKHUB_VERSION << std::endl;
    return EXIT_SUCCESS;
  }
  if (ctx_.wants_help() || ctx_.params.subcmd.empty()) {
    PrintUsage(std::cerr);
    return ctx_.wants_help() ? EXIT_SUCCESS : EXIT_FAILURE;
  }
  if (!is_known_subcommand(ctx_.params.subcmd)) {
    std::cerr << "Unknown subcommand '" << ctx_.params.subcmd << "'"
              << std::endl;
    PrintUsage(std::cerr);
    return EXIT_FAILURE;
  }

  const auto config_dir = ConfigDir();
  LogConfig log_config = LoadJsonConfig<LogConfig>(config_dir, "log_config");
  if (ctx_.is_specified_by_user("verbose") ||
      !std::filesystem::exists(config_dir / "log_config.json")) {
    log_config.level = ctx_.log_level();
  }
  if (ctx_.params.log_dir) {
    log_config.log_dir = *ctx_.params.log_dir;
  }
  init_my_log(log_config);
  BOOST_LOG_SEV(lg, trivial::debug)
      << "hookhub " << HOOKHUB_VERSION << " using config dir "
      << config_dir.string();

  if (ctx_.params.subcmd == "server") {
    return RunServer();
  }
  if (ctx_.params.subcmd == "connect") {
    return RunConnect();
  }
  return RunProfiles();
}

void App::WaitForShutdown(const std::function<bool()> &keep_waiting) {
  auto signalled = std::make_shared<std::promise<int>>();
  auto fut = signalled->get_future();
  net::signal_set signals(signal_io_.ioc(), SIGINT, SIGTERM);
  signals.async_wait(
      [signalled](const boost::system::error_code &ec, int signal) {
        if (!ec) {
          signalled->set_value(signal);
        }
      });

  while (fut.wait_for(std::chrono::milliseconds(200)) !=
         std::future_status::ready) {
    if (!keep_waiting()) {
      break;
    }
  }
  if (fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
    const int signal = fut.get();
    BOOST_LOG_SEV(lg, trivial::info)
        << (signal == SIGINT ? "SIGINT" : "SIGTERM")
        << " received, shutting down";
  }
  boost::system::error_code ignored;
  signals.cancel(ignored);
}

int App::RunServer() {
  ServerConfig config =
      LoadJsonConfig<ServerConfig>(ConfigDir(), "server_config");
  if (ctx_.is_specified_by_user("bind-addr") || config.bind_address.empty()) {
    config.bind_address = ctx_.params.bind_addr;
  }
  if (ctx_.is_specified_by_user("threads")) {
    config.threads = ctx_.params.threads;
  }
  if (ctx_.params.secret) {
    config.secret = *ctx_.params.secret;
  }

  RelayServer server(std::move(config));
  server.Start();
  WaitForShutdown([]() { return true; });
  server.Stop();
  return EXIT_SUCCESS;
}

Profile ResolveConnectProfile(const CliParams &params,
                              const Profiles &profiles) {
  Profile profile;
  if (params.profile) {
    auto found = profiles.Get(*params.profile);
    if (!found) {
      throw Error(my_errors::GENERAL::NOT_FOUND,
                  "profile " + *params.profile + " doesn't exist");
    }
    profile = *found;
  } else if (auto fallback = profiles.Get(kDefaultProfileName)) {
    profile = *fallback;
  } else {
    const TunnelConfig defaults;
    profile.remote = defaults.remote_endpoint;
    profile.local = defaults.local_base_url;
  }
  if (params.remote) {
    profile.remote = *params.remote;
  }
  if (params.secret) {
    profile.secret = *params.secret;
  }
  if (params.local) {
    profile.local = *params.local;
  }
  if (profile.secret.empty()) {
    throw Error(my_errors::GENERAL::MISSING_FIELD,
                "A shared secret is required: pass --secret or --profile");
  }
  return profile;
}

int App::RunConnect() {
  const auto config_dir = ConfigDir();
  const Profile profile =
      ResolveConnectProfile(ctx_.params, Profiles(config_dir)).Prepare();

  TunnelConfig config = profile.ToTunnelConfig(
      LoadJsonConfig<TunnelConfig>(config_dir, "tunnel_config"));
  if (ctx_.params.insecure) {
    config.verify_tls = false;
  }
  if (ctx_.params.no_reconnect) {
    config.reconnect = false;
  }

  StaticTunnelConfigProvider provider(std::move(config));
  IoContextManager io(2, "tunnel-client");
  TunnelClient client(io, provider);
  client.Start();
  WaitForShutdown([&client]() { return client.running(); });
  const bool rejected = client.auth_failed();
  client.Stop();
  io.Stop();
  return rejected ? EXIT_FAILURE : EXIT_SUCCESS;
}

int App::RunProfiles() {
  Profiles profiles(ConfigDir());
  const auto action = ctx_.positional_at(1).value_or("list");

  if (action == "list") {
    if (profiles.All().empty()) {
      std::cout << "No profiles in " << profiles.FilePath().string()
                << std::endl;
    }
    for (const auto &[name, profile] : profiles.All()) {
      std::cout << name << ": " << profile.remote << " -> " << profile.local
                << std::endl;
    }
    return EXIT_SUCCESS;
  }

  if (action == "add") {
    const auto name = ctx_.positional_at(2).value_or(kDefaultProfileName);
    if (!ctx_.params.remote || !ctx_.params.secret || !ctx_.params.local) {
      throw Error(my_errors::GENERAL::MISSING_FIELD,
                  "profiles add needs --remote, --secret and --local");
    }
    Profile profile{*ctx_.params.remote, *ctx_.params.secret,
                    *ctx_.params.local};
    profiles.Add(name, profile.Prepare());
    std::cout << "Profile " << name << " saved" << std::endl;
    return EXIT_SUCCESS;
  }
  const auto name = ctx_.positional_at(2);
  if (!name || name->empty()) {
    throw Error(my_errors::GENERAL::MISSING_FIELD,
                "profiles " + action + " needs a profile name");
  }
  if (action == "delete") {
    profiles.Delete(*name);
    std::cout << "Profile " << *name << " deleted" << std::endl;
    return EXIT_SUCCESS;
  }
  throw Error(my_errors::GENERAL::INVALID_ARGUMENT,
              "unknown profiles action '" + action + "'");
}

} // namespace hookhub
