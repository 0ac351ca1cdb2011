#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <filesystem>
#include <functional>
#include <iosfwd>

#include "conf/profiles.hpp"
#include "hookhub_common.hpp"
#include "io_context_manager.hpp"

namespace hookhub {

inline constexpr const char *kDefaultProfileName = "default";

// Profile used by "connect": --profile NAME, else the "default" profile when
// one is saved, else built-in defaults. --remote/--secret/--local override
// the chosen profile. Throws hookhub::Error for an unknown --profile or a
// missing secret; the result is not yet Prepare()d.
Profile ResolveConnectProfile(const CliParams &params,
                              const Profiles &profiles);

// Runs one subcommand to completion and returns the process exit status.
class App {
public:
  explicit App(CliCtx &ctx);

  int Run();

  static void PrintUsage(std::ostream &os);

private:
  int RunServer();
  int RunConnect();
  int RunProfiles();

  // Blocks until SIGINT/SIGTERM, or until keep_waiting() turns false.
  void WaitForShutdown(const std::function<bool()> &keep_waiting);

  std::filesystem::path ConfigDir() const;

  CliCtx &ctx_;
  IoContextManager signal_io_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;
};

} // namespace hookhub
