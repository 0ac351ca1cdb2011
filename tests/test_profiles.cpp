#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <string>

#include "conf/config_loader.hpp"
#include "conf/profiles.hpp"
#include "conf/server_config.hpp"
#include "hookhub_error.hpp"

namespace hookhub {
namespace fs = std::filesystem;

namespace {

class ProfilesTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    dir_ = fs::temp_directory_path() /
           ("hookhub-profiles-" + std::to_string(rd()) + "-" +
            std::to_string(std::chrono::steady_clock::now()
                               .time_since_epoch()
                               .count()));
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  static Profile Sample() {
    Profile p;
    p.remote = "ws://relay.example.com:8080";
    p.secret = "abc123";
    p.local = "http://127.0.0.1:3000";
    return p;
  }

  fs::path dir_;
};

int CodeOf(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const Error &ex) {
    return ex.code();
  }
  return 0;
}

} // namespace

TEST_F(ProfilesTest, MissingFileIsEmpty) {
  Profiles profiles(dir_);
  EXPECT_TRUE(profiles.All().empty());
  EXPECT_FALSE(profiles.Get("dev").has_value());
}

TEST_F(ProfilesTest, AddPersistsAcrossReload) {
  {
    Profiles profiles(dir_);
    profiles.Add("dev", Sample());
    ASSERT_TRUE(fs::exists(profiles.FilePath()));
  }
  Profiles reloaded(dir_);
  auto dev = reloaded.Get("dev");
  ASSERT_TRUE(dev.has_value());
  EXPECT_EQ(dev->remote, "ws://relay.example.com:8080");
  EXPECT_EQ(dev->secret, "abc123");
  EXPECT_EQ(dev->local, "http://127.0.0.1:3000");
}

TEST_F(ProfilesTest, DuplicateAddFails) {
  Profiles profiles(dir_);
  profiles.Add("dev", Sample());
  EXPECT_EQ(CodeOf([&]() { profiles.Add("dev", Sample()); }),
            my_errors::GENERAL::ALREADY_EXISTS);
  EXPECT_EQ(profiles.All().size(), 1u);
}

TEST_F(ProfilesTest, DeleteRemovesAndPersists) {
  Profiles profiles(dir_);
  profiles.Add("dev", Sample());
  profiles.Add("prod", Sample());
  profiles.Delete("dev");
  EXPECT_FALSE(profiles.Get("dev").has_value());

  Profiles reloaded(dir_);
  EXPECT_FALSE(reloaded.Get("dev").has_value());
  EXPECT_TRUE(reloaded.Get("prod").has_value());
}

TEST_F(ProfilesTest, DeleteMissingFails) {
  Profiles profiles(dir_);
  EXPECT_EQ(CodeOf([&]() { profiles.Delete("nope"); }),
            my_errors::GENERAL::NOT_FOUND);
}

TEST_F(ProfilesTest, MalformedFileFails) {
  {
    std::ofstream ofs(dir_ / "profiles.json");
    ofs << "{not json";
  }
  EXPECT_EQ(CodeOf([&]() { Profiles profiles(dir_); }),
            my_errors::GENERAL::JSON_PARSE_ERROR);
}

TEST_F(ProfilesTest, PrepareFillsTunnelPath) {
  auto prepared = Sample().Prepare();
  EXPECT_EQ(prepared.remote, "ws://relay.example.com:8080/__hookhub__/");

  Profile custom = Sample();
  custom.remote = "wss://relay.example.com/hooks";
  EXPECT_EQ(custom.Prepare().remote, "wss://relay.example.com/hooks");
}

TEST_F(ProfilesTest, PrepareAcceptsHttpsLocal) {
  Profile secure = Sample();
  secure.local = "https://localhost:3443/";
  EXPECT_EQ(secure.Prepare().local, "https://localhost:3443/");
}

TEST_F(ProfilesTest, PrepareRejectsBadSchemes) {
  Profile bad_remote = Sample();
  bad_remote.remote = "http://relay.example.com";
  EXPECT_EQ(CodeOf([&]() { (void)bad_remote.Prepare(); }),
            my_errors::GENERAL::INVALID_ARGUMENT);

  Profile bad_local = Sample();
  bad_local.local = "ftp://127.0.0.1";
  EXPECT_EQ(CodeOf([&]() { (void)bad_local.Prepare(); }),
            my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST_F(ProfilesTest, ToTunnelConfigOverlaysFields) {
  TunnelConfig base;
  base.request_timeout_seconds = 7;
  auto cfg = Sample().ToTunnelConfig(base);
  EXPECT_EQ(cfg.secret, "abc123");
  EXPECT_EQ(cfg.local_base_url, "http://127.0.0.1:3000");
  EXPECT_EQ(cfg.request_timeout_seconds, 7);
}

TEST_F(ProfilesTest, ResolveConfigDirPrecedence) {
  ::setenv("HOOKHUB_CONFIG_DIR", "/tmp/from-env", 1);
  EXPECT_EQ(ResolveConfigDir(std::string("/tmp/from-cli")),
            fs::path("/tmp/from-cli"));
  EXPECT_EQ(ResolveConfigDir(std::nullopt), fs::path("/tmp/from-env"));
  ::unsetenv("HOOKHUB_CONFIG_DIR");

  ::setenv("HOME", "/tmp/home", 1);
  EXPECT_EQ(ResolveConfigDir(std::nullopt), fs::path("/tmp/home/.hookhub"));
}

TEST_F(ProfilesTest, LoadJsonConfigFallsBackWhenMissing) {
  ServerConfig fallback;
  fallback.threads = 9;
  auto cfg = LoadJsonConfig<ServerConfig>(dir_, "server_config", fallback);
  EXPECT_EQ(cfg.threads, 9);
}

TEST_F(ProfilesTest, LoadJsonConfigReadsFile) {
  {
    std::ofstream ofs(dir_ / "server_config.json");
    ofs << R"({"bind_address":"127.0.0.1:9999","threads":4})";
  }
  auto cfg = LoadJsonConfig<ServerConfig>(dir_, "server_config");
  EXPECT_EQ(cfg.bind_address, "127.0.0.1:9999");
  EXPECT_EQ(cfg.threads, 4);
  EXPECT_EQ(cfg.read_timeout_seconds, ServerConfig{}.read_timeout_seconds);
}

TEST_F(ProfilesTest, LoadJsonConfigRejectsMalformedFile) {
  {
    std::ofstream ofs(dir_ / "tunnel_config.json");
    ofs << "[1,";
  }
  EXPECT_EQ(CodeOf([&]() {
              (void)LoadJsonConfig<TunnelConfig>(dir_, "tunnel_config");
            }),
            my_errors::GENERAL::JSON_PARSE_ERROR);
}

} // namespace hookhub
