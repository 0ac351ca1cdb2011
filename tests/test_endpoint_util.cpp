#include <gtest/gtest.h>

#include <stdexcept>

#include "tunnel/tunnel_messages.hpp"
#include "util/endpoint_util.hpp"

namespace hookhub {

TEST(EndpointUtilTest, WsDefaultsToPort80AndTunnelPath) {
  auto parts = ParseEndpoint("ws://relay.example.com", kDefaultTunnelPath);
  EXPECT_FALSE(parts.secure);
  EXPECT_EQ(parts.host, "relay.example.com");
  EXPECT_EQ(parts.port, "80");
  EXPECT_EQ(parts.target, kDefaultTunnelPath);
}

TEST(EndpointUtilTest, WssDefaultsToPort443) {
  auto parts = ParseEndpoint("wss://relay.example.com/", kDefaultTunnelPath);
  EXPECT_TRUE(parts.secure);
  EXPECT_EQ(parts.port, "443");
  EXPECT_EQ(parts.target, kDefaultTunnelPath);
  EXPECT_EQ(parts.url, "wss://relay.example.com/__hookhub__/");
}

TEST(EndpointUtilTest, ExplicitPathAndQueryKept) {
  auto parts =
      ParseEndpoint("ws://127.0.0.1:9000/custom/tunnel?x=1", kDefaultTunnelPath);
  EXPECT_EQ(parts.host, "127.0.0.1");
  EXPECT_EQ(parts.port, "9000");
  EXPECT_EQ(parts.target, "/custom/tunnel?x=1");
  EXPECT_EQ(parts.url, "ws://127.0.0.1:9000/custom/tunnel?x=1");
}

TEST(EndpointUtilTest, RejectsOtherSchemes) {
  EXPECT_THROW(ParseEndpoint("http://relay.example.com", kDefaultTunnelPath),
               std::runtime_error);
  EXPECT_THROW(ParseEndpoint("not a url", kDefaultTunnelPath),
               std::runtime_error);
}

TEST(EndpointUtilTest, LocalEndpointHostHeader) {
  auto plain = ParseLocalEndpoint("http://localhost");
  EXPECT_FALSE(plain.secure);
  EXPECT_EQ(plain.port, "80");
  EXPECT_EQ(plain.base_path, "/");
  EXPECT_EQ(plain.host_header, "localhost");

  auto with_port = ParseLocalEndpoint("http://127.0.0.1:3000/api");
  EXPECT_EQ(with_port.port, "3000");
  EXPECT_EQ(with_port.base_path, "/api");
  EXPECT_EQ(with_port.host_header, "127.0.0.1:3000");
}

TEST(EndpointUtilTest, LocalEndpointAcceptsHttps) {
  auto secure = ParseLocalEndpoint("https://localhost");
  EXPECT_TRUE(secure.secure);
  EXPECT_EQ(secure.port, "443");
  EXPECT_EQ(secure.host_header, "localhost");

  auto with_port = ParseLocalEndpoint("https://127.0.0.1:8443/hooks");
  EXPECT_TRUE(with_port.secure);
  EXPECT_EQ(with_port.port, "8443");
  EXPECT_EQ(with_port.base_path, "/hooks");
  EXPECT_EQ(with_port.host_header, "127.0.0.1:8443");

  // 80 is not the default port for https.
  EXPECT_EQ(ParseLocalEndpoint("https://localhost:80").host_header,
            "localhost:80");
}

TEST(EndpointUtilTest, LocalEndpointRequiresHttpScheme) {
  EXPECT_THROW(ParseLocalEndpoint("ws://127.0.0.1:3000"), std::runtime_error);
  EXPECT_THROW(ParseLocalEndpoint("ftp://127.0.0.1"), std::runtime_error);
}

TEST(EndpointUtilTest, BuildLocalTargetJoinsPaths) {
  EXPECT_EQ(BuildLocalTarget("/", "/webhook"), "/webhook");
  EXPECT_EQ(BuildLocalTarget("/api", "/webhook"), "/api/webhook");
  EXPECT_EQ(BuildLocalTarget("/api/", "/webhook"), "/api/webhook");
  EXPECT_EQ(BuildLocalTarget("/api", "/"), "/api");
  EXPECT_EQ(BuildLocalTarget("/", "/hook?a=1&b=2"), "/hook?a=1&b=2");
  EXPECT_EQ(BuildLocalTarget("/api", "/hook?a=1"), "/api/hook?a=1");
}

} // namespace hookhub
