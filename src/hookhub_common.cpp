#include "hookhub_common.hpp"

namespace hookhub {

po::options_description build_options_description(CliParams &params) {
  po::options_description generic_desc("General options");
  generic_desc.add_options() //
      ("help,h", "Print help") //
      ("version,v", "Print the version") //
      ("verbose",
       po::value<std::string>(&params.verbose)->default_value("info"),
       "verbosity level: trace, debug, info, warning, error or vvvv.") //
      ("config-dir",
       po::value<std::string>()->value_name("DIR")->notifier(
           [&params](const std::string &value) { params.config_dir = value; }),
       "directory holding profiles.json and *_config.json "
       "(default $HOOKHUB_CONFIG_DIR or ~/.hookhub).") //
      ("log-dir",
       po::value<std::string>()->value_name("DIR")->notifier(
           [&params](const std::string &value) { params.log_dir = value; }),
       "also write rotating log files into DIR.");

  po::options_description server_desc("server options");
  server_desc.add_options() //
      ("bind-addr",
       po::value<std::string>(&params.bind_addr)
           ->value_name("HOST:PORT")
           ->default_value("0.0.0.0:8080"),
       "address to listen on ($HOOKHUB_BIND_ADDR).") //
      ("threads", po::value<int>(&params.threads)->default_value(2),
       "worker threads.");

  po::options_description connect_desc("connect / profiles options");
  connect_desc.add_options() //
      ("profile",
       po::value<std::string>()->value_name("NAME")->notifier(
           [&params](const std::string &value) { params.profile = value; }),
       "use a saved profile.") //
      ("remote",
       po::value<std::string>()->value_name("URL")->notifier(
           [&params](const std::string &value) { params.remote = value; }),
       "relay URL, ws:// or wss://.") //
      ("secret",
       po::value<std::string>()->notifier(
           [&params](const std::string &value) { params.secret = value; }),
       "shared secret ($HOOKHUB_SECRET).") //
      ("local",
       po::value<std::string>()->value_name("URL")->notifier(
           [&params](const std::string &value) { params.local = value; }),
       "local server base URL, http:// or https://.") //
      ("insecure", po::bool_switch(&params.insecure)->default_value(false),
       "skip TLS certificate verification for wss:// and https://.") //
      ("no-reconnect",
       po::bool_switch(&params.no_reconnect)->default_value(false),
       "exit instead of reconnecting when the tunnel drops.");

  po::options_description all("hookhub");
  all.add(generic_desc).add(server_desc).add(connect_desc);
  return all;
}

CliCtx parse_cli(int argc, const char *const argv[]) {
  CliParams params;
  po::options_description visible = build_options_description(params);

  po::options_description hidden_desc("Hidden options");
  hidden_desc.add_options() //
      ("positionals",
       po::value<std::vector<std::string>>()->default_value({}, ""),
       "all positional arguments");

  po::options_description cmdline_options("Allowed options");
  cmdline_options.add(visible).add(hidden_desc);

  po::positional_options_description p;
  p.add("positionals", -1);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv)
                .options(cmdline_options)
                .positional(p)
                .run(),
            vm);
  po::store(po::parse_environment(visible, map_env_option), vm);
  po::notify(vm);

  auto positionals = vm["positionals"].as<std::vector<std::string>>();
  if (!positionals.empty()) {
    params.subcmd = positionals.front();
  }
  return CliCtx(std::move(vm), std::move(positionals), std::move(params));
}

} // namespace hookhub
