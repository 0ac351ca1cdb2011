#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "hookhub_error.hpp"
#include "my_error_codes.hpp"
#include "tunnel/tunnel_messages.hpp"

namespace hookhub {
namespace json = boost::json;

TEST(TunnelMessagesTest, HelloRoundTrip) {
  TunnelHello hello;
  hello.secret = "abc123";
  hello.client_version = "0.1.0";

  auto serialized = json::value_from(hello);
  ASSERT_TRUE(serialized.is_object());
  const auto &obj = serialized.as_object();
  EXPECT_EQ(obj.at("type"), "hello");
  EXPECT_EQ(obj.at("secret"), "abc123");
  EXPECT_EQ(obj.at("client_version"), "0.1.0");

  auto parsed = json::value_to<TunnelHello>(serialized);
  EXPECT_EQ(parsed.secret, hello.secret);
  EXPECT_EQ(parsed.client_version, hello.client_version);
}

TEST(TunnelMessagesTest, WelcomeRoundTrip) {
  TunnelWelcome welcome;
  welcome.connection_id = 17;
  welcome.server_version = "0.1.0";

  auto serialized = json::value_from(welcome);
  EXPECT_EQ(serialized.as_object().at("type"), "welcome");

  auto parsed = json::value_to<TunnelWelcome>(serialized);
  EXPECT_EQ(parsed.connection_id, 17u);
  EXPECT_EQ(parsed.server_version, "0.1.0");
}

TEST(TunnelMessagesTest, RejectRoundTrip) {
  TunnelReject reject;
  reject.code = my_errors::TUNNEL::UNAUTHORIZED;
  reject.reason = "invalid secret";

  auto serialized = json::value_from(reject);
  EXPECT_EQ(serialized.as_object().at("type"), "reject");
  EXPECT_EQ(serialized.as_object().at("code"), 5300);

  auto parsed = json::value_to<TunnelReject>(serialized);
  EXPECT_EQ(parsed.code, my_errors::TUNNEL::UNAUTHORIZED);
  EXPECT_EQ(parsed.reason, "invalid secret");
}

TEST(TunnelMessagesTest, HelloWithoutSecretIsRejected) {
  auto jv = json::parse(R"({"type":"hello","client_version":"0.1.0"})");
  EXPECT_THROW(json::value_to<TunnelHello>(jv), DecodeError);
}

TEST(TunnelMessagesTest, WrongTypeIsRejected) {
  auto jv = json::parse(R"({"type":"welcome","secret":"x"})");
  EXPECT_THROW(json::value_to<TunnelHello>(jv), DecodeError);
}

TEST(TunnelMessagesTest, PeekMessageType) {
  EXPECT_EQ(PeekMessageType(json::parse(R"({"type":"reject"})")), "reject");
  EXPECT_THROW(PeekMessageType(json::parse(R"({"kind":"hello"})")),
               DecodeError);
  EXPECT_THROW(PeekMessageType(json::parse(R"({"type":1})")), DecodeError);
  EXPECT_THROW(PeekMessageType(json::parse(R"([1,2])")), DecodeError);
}

TEST(TunnelMessagesTest, UnknownFieldsAreIgnored) {
  auto jv = json::parse(
      R"({"type":"welcome","connection_id":3,"server_version":"0.1.0","x":true})");
  auto welcome = json::value_to<TunnelWelcome>(jv);
  EXPECT_EQ(welcome.connection_id, 3u);
}

} // namespace hookhub
