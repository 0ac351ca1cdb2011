#include "conf/profiles.hpp"

#include "hookhub_error.hpp"
#include "util/endpoint_util.hpp"
#include "util/my_logging.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace hookhub {
namespace json = boost::json;

Profile Profile::Prepare(const std::string &tunnel_path) const {
  Profile prepared = *this;
  try {
    // Both throw std::runtime_error on a bad scheme or missing host.
    prepared.remote = ParseEndpoint(remote, tunnel_path).url;
    ParseLocalEndpoint(local);
  } catch (const std::runtime_error &ex) {
    throw Error(my_errors::GENERAL::INVALID_ARGUMENT, ex.what());
  }
  return prepared;
}

TunnelConfig Profile::ToTunnelConfig(TunnelConfig base) const {
  base.remote_endpoint = remote;
  base.secret = secret;
  base.local_base_url = local;
  return base;
}

Profile tag_invoke(const json::value_to_tag<Profile> &, const json::value &jv) {
  const auto *obj = jv.if_object();
  if (!obj) {
    throw std::runtime_error("Profile is not an object");
  }
  auto require = [obj](const char *key) {
    auto *p = obj->if_contains(key);
    if (!p || !p->is_string()) {
      throw std::runtime_error(
          fmt::format("Profile missing string field '{}'", key));
    }
    return std::string(p->as_string().c_str());
  };
  Profile profile;
  profile.remote = require("remote");
  profile.secret = require("secret");
  profile.local = require("local");
  return profile;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const Profile &profile) {
  jv = json::object{{"remote", profile.remote},
                    {"secret", profile.secret},
                    {"local", profile.local}};
}

Profiles::Profiles(fs::path dir) : dir_(std::move(dir)) {
  const auto path = FilePath();
  std::ifstream ifs(path);
  if (!ifs) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "No profiles file at " << path.string() << ", starting empty";
    return;
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  try {
    auto jv = json::parse(content);
    profiles_ = json::value_to<std::map<std::string, Profile>>(jv);
  } catch (const std::exception &ex) {
    throw Error(my_errors::GENERAL::JSON_PARSE_ERROR,
                fmt::format("Invalid profiles file {}: {}", path.string(),
                            ex.what()));
  }
}

std::optional<Profile> Profiles::Get(const std::string &name) const {
  auto it = profiles_.find(name);
  if (it == profiles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Profiles::Add(const std::string &name, Profile profile) {
  auto profiles = profiles_;
  if (!profiles.emplace(name, std::move(profile)).second) {
    throw Error(my_errors::GENERAL::ALREADY_EXISTS,
                fmt::format("profile {} already exists", name));
  }
  Save(profiles);
  profiles_ = std::move(profiles);
}

void Profiles::Delete(const std::string &name) {
  auto profiles = profiles_;
  if (profiles.erase(name) == 0) {
    throw Error(my_errors::GENERAL::NOT_FOUND,
                fmt::format("profile {} doesn't exist", name));
  }
  Save(profiles);
  profiles_ = std::move(profiles);
}

void Profiles::Save(const std::map<std::string, Profile> &profiles) const {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec && !fs::exists(dir_)) {
    throw Error(my_errors::GENERAL::FILE_READ_WRITE,
                fmt::format("Unable to create {}: {}", dir_.string(),
                            ec.message()));
  }
  const auto path = FilePath();
  std::ofstream ofs(path, std::ios::trunc);
  if (!ofs) {
    throw Error(my_errors::GENERAL::FILE_READ_WRITE,
                "Unable to open for writing: " + path.string());
  }
  ofs << json::serialize(json::value_from(profiles));
  if (!ofs) {
    throw Error(my_errors::GENERAL::FILE_READ_WRITE,
                "Unable to write: " + path.string());
  }
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Saved " << profiles.size() << " profile(s) to " << path.string();
}

fs::path ResolveConfigDir(const std::optional<std::string> &cli_value) {
  if (cli_value && !cli_value->empty()) {
    return fs::path(*cli_value);
  }
  if (const char *value = std::getenv("HOOKHUB_CONFIG_DIR"); value && *value) {
    return fs::path(value);
  }
  if (const char *home = std::getenv("HOME"); home && *home) {
    return fs::path(home) / ".hookhub";
  }
  throw Error(my_errors::GENERAL::MISSING_FIELD,
              "Cannot resolve config directory: set HOOKHUB_CONFIG_DIR or HOME");
}

} // namespace hookhub
