#pragma once

#include <boost/json.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "conf/tunnel_config.hpp"
#include "tunnel/tunnel_messages.hpp"

namespace hookhub {
namespace fs = std::filesystem;

struct Profile {
  std::string remote;
  std::string secret;
  std::string local;

  // Validates the schemes and returns a copy whose remote points at
  // tunnel_path when it had no path of its own. Throws hookhub::Error.
  Profile Prepare(const std::string &tunnel_path = kDefaultTunnelPath) const;

  // Overlays remote/secret/local onto base.
  TunnelConfig ToTunnelConfig(TunnelConfig base = {}) const;

  friend Profile tag_invoke(const boost::json::value_to_tag<Profile> &,
                            const boost::json::value &jv);
  friend void tag_invoke(const boost::json::value_from_tag &,
                         boost::json::value &jv, const Profile &profile);
};

// Named client profiles persisted as <dir>/profiles.json.
class Profiles {
public:
  // Loads the file when it exists; a missing file is an empty set.
  explicit Profiles(fs::path dir);

  std::optional<Profile> Get(const std::string &name) const;
  const std::map<std::string, Profile> &All() const { return profiles_; }

  // Throws hookhub::Error when the name is taken or the file cannot be
  // written. The in-memory set is only updated after a successful write.
  void Add(const std::string &name, Profile profile);
  void Delete(const std::string &name);

  fs::path FilePath() const { return dir_ / "profiles.json"; }

private:
  void Save(const std::map<std::string, Profile> &profiles) const;

  fs::path dir_;
  std::map<std::string, Profile> profiles_;
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

// --config-dir, then HOOKHUB_CONFIG_DIR, then $HOME/.hookhub.
fs::path ResolveConfigDir(const std::optional<std::string> &cli_value);

} // namespace hookhub
