#include <gtest/gtest.h>

#include <string>

#include "hookhub_error.hpp"
#include "relay/relay_codec.hpp"

namespace hookhub {
namespace http = boost::beast::http;

namespace {

RelayedRequest SampleRequest() {
  RelayedRequest req;
  req.method = http::verb::post;
  req.target = "/hooks/github?delivery=42";
  req.headers = {{"Content-Type", "application/json"},
                 {"X-Trace", "a"},
                 {"X-Trace", "b"}};
  req.body = "{\"id\":1}";
  return req;
}

void PutU32(std::string &out, std::uint32_t v) {
  out.push_back(static_cast<char>((v >> 24) & 0xff));
  out.push_back(static_cast<char>((v >> 16) & 0xff));
  out.push_back(static_cast<char>((v >> 8) & 0xff));
  out.push_back(static_cast<char>(v & 0xff));
}

// Hand-built frame so single fields can be corrupted independently.
std::string BuildFrame(const std::string &verb, const std::string &target,
                       const std::string &name, const std::string &value,
                       const std::string &body) {
  std::string out(relay_codec::kMagic);
  out.push_back(static_cast<char>(relay_codec::kFormatVersion));
  out.push_back(static_cast<char>(verb.size()));
  out += verb;
  PutU32(out, static_cast<std::uint32_t>(target.size()));
  out += target;
  PutU32(out, 1);
  PutU32(out, static_cast<std::uint32_t>(name.size()));
  out += name;
  PutU32(out, static_cast<std::uint32_t>(value.size()));
  out += value;
  PutU32(out, static_cast<std::uint32_t>(body.size()));
  out += body;
  return out;
}

} // namespace

TEST(RelayCodecTest, RoundTripKeepsHeaderOrderAndDuplicates) {
  const auto req = SampleRequest();
  const auto decoded = relay_codec::Decode(relay_codec::Encode(req));
  EXPECT_EQ(decoded, req);
  ASSERT_EQ(decoded.headers.size(), 3u);
  EXPECT_EQ(decoded.headers[1].second, "a");
  EXPECT_EQ(decoded.headers[2].second, "b");
}

TEST(RelayCodecTest, BinaryBodySurvives) {
  RelayedRequest req;
  req.method = http::verb::put;
  req.target = "/upload";
  req.body = std::string("\x00\x01\xff\xfe\x00", 5);
  const auto decoded = relay_codec::Decode(relay_codec::Encode(req));
  EXPECT_EQ(decoded.body.size(), 5u);
  EXPECT_EQ(decoded.body, req.body);
}

TEST(RelayCodecTest, EmptyBodyAndNoHeaders) {
  RelayedRequest req;
  req.method = http::verb::delete_;
  req.target = "/";
  const auto decoded = relay_codec::Decode(relay_codec::Encode(req));
  EXPECT_EQ(decoded.method, http::verb::delete_);
  EXPECT_TRUE(decoded.headers.empty());
  EXPECT_TRUE(decoded.body.empty());
}

TEST(RelayCodecTest, FrameStartsWithMagicAndVersion) {
  const auto bytes = relay_codec::Encode(SampleRequest());
  ASSERT_GT(bytes.size(), 5u);
  EXPECT_EQ(bytes.substr(0, 4), "HKHB");
  EXPECT_EQ(static_cast<std::uint8_t>(bytes[4]), relay_codec::kFormatVersion);
}

TEST(RelayCodecTest, EncodeRejectsUnknownMethod) {
  RelayedRequest req;
  req.method = http::verb::unknown;
  try {
    relay_codec::Encode(req);
    FAIL() << "expected EncodeError";
  } catch (const EncodeError &ex) {
    EXPECT_EQ(ex.code(), my_errors::CODEC::ENCODE_ERROR);
  }
}

TEST(RelayCodecTest, EncodeRejectsWhatDecodeWouldReject) {
  auto code_of = [](const RelayedRequest &req) {
    try {
      relay_codec::Encode(req);
    } catch (const EncodeError &ex) {
      return ex.code();
    }
    return 0;
  };

  RelayedRequest bad_name = SampleRequest();
  bad_name.headers.push_back({"\xc3\xa9-bad", "v"});
  EXPECT_EQ(code_of(bad_name), my_errors::CODEC::ENCODE_ERROR);

  RelayedRequest spaced_name = SampleRequest();
  spaced_name.headers.push_back({"Bad Name", "v"});
  EXPECT_EQ(code_of(spaced_name), my_errors::CODEC::ENCODE_ERROR);

  RelayedRequest split_value = SampleRequest();
  split_value.headers.push_back({"X", "a\r\nInjected: 1"});
  EXPECT_EQ(code_of(split_value), my_errors::CODEC::ENCODE_ERROR);

  RelayedRequest bad_utf8 = SampleRequest();
  bad_utf8.headers.push_back({"X", "\xc3\x28"});
  EXPECT_EQ(code_of(bad_utf8), my_errors::CODEC::ENCODE_ERROR);

  RelayedRequest no_target = SampleRequest();
  no_target.target.clear();
  EXPECT_EQ(code_of(no_target), my_errors::CODEC::ENCODE_ERROR);

  RelayedRequest utf8_value = SampleRequest();
  utf8_value.headers.push_back({"X-Name", "caf\xc3\xa9"});
  EXPECT_EQ(relay_codec::Decode(relay_codec::Encode(utf8_value)), utf8_value);
}

TEST(RelayCodecTest, HandBuiltFrameDecodes) {
  const auto frame = BuildFrame("PATCH", "/x", "X-Id", "7", "hi");
  const auto req = relay_codec::Decode(frame);
  EXPECT_EQ(req.method, http::verb::patch);
  EXPECT_EQ(req.target, "/x");
  ASSERT_EQ(req.headers.size(), 1u);
  EXPECT_EQ(req.headers[0].first, "X-Id");
  EXPECT_EQ(req.body, "hi");
}

TEST(RelayCodecTest, RejectsBadMagic) {
  auto frame = relay_codec::Encode(SampleRequest());
  frame[0] = 'X';
  EXPECT_THROW(relay_codec::Decode(frame), DecodeError);
}

TEST(RelayCodecTest, RejectsUnsupportedFormatVersion) {
  auto frame = relay_codec::Encode(SampleRequest());
  frame[4] = static_cast<char>(relay_codec::kFormatVersion + 1);
  EXPECT_THROW(relay_codec::Decode(frame), DecodeError);
}

TEST(RelayCodecTest, RejectsTruncatedFrames) {
  const auto frame = relay_codec::Encode(SampleRequest());
  EXPECT_THROW(relay_codec::Decode(""), DecodeError);
  EXPECT_THROW(relay_codec::Decode(frame.substr(0, 3)), DecodeError);
  EXPECT_THROW(relay_codec::Decode(frame.substr(0, frame.size() - 1)),
               DecodeError);
}

TEST(RelayCodecTest, RejectsLengthPrefixPastEnd) {
  std::string frame(relay_codec::kMagic);
  frame.push_back(static_cast<char>(relay_codec::kFormatVersion));
  frame.push_back(3);
  frame += "GET";
  PutU32(frame, 0xffffffffu);
  frame += "/";
  EXPECT_THROW(relay_codec::Decode(frame), DecodeError);
}

TEST(RelayCodecTest, RejectsInvalidVerb) {
  EXPECT_THROW(relay_codec::Decode(BuildFrame("FETCH", "/", "A", "b", "")),
               DecodeError);
}

TEST(RelayCodecTest, RejectsEmptyTarget) {
  EXPECT_THROW(relay_codec::Decode(BuildFrame("GET", "", "A", "b", "")),
               DecodeError);
}

TEST(RelayCodecTest, RejectsOversizedHeaderCount) {
  std::string frame(relay_codec::kMagic);
  frame.push_back(static_cast<char>(relay_codec::kFormatVersion));
  frame.push_back(3);
  frame += "GET";
  PutU32(frame, 1);
  frame += "/";
  PutU32(frame, 1000000);
  PutU32(frame, 0);
  EXPECT_THROW(relay_codec::Decode(frame), DecodeError);
}

TEST(RelayCodecTest, RejectsInvalidHeaderName) {
  EXPECT_THROW(relay_codec::Decode(BuildFrame("GET", "/", "", "v", "")),
               DecodeError);
  EXPECT_THROW(relay_codec::Decode(BuildFrame("GET", "/", "Bad Name", "v", "")),
               DecodeError);
  EXPECT_THROW(relay_codec::Decode(BuildFrame("GET", "/", "X:Y", "v", "")),
               DecodeError);
}

TEST(RelayCodecTest, RejectsInvalidHeaderValue) {
  EXPECT_THROW(
      relay_codec::Decode(BuildFrame("GET", "/", "X", "a\r\nInjected: 1", "")),
      DecodeError);
  EXPECT_THROW(relay_codec::Decode(BuildFrame("GET", "/", "X", "\xc3\x28", "")),
               DecodeError);
}

TEST(RelayCodecTest, AcceptsUtf8HeaderValue) {
  const auto req =
      relay_codec::Decode(BuildFrame("GET", "/", "X-Name", "caf\xc3\xa9", ""));
  EXPECT_EQ(req.headers[0].second, "caf\xc3\xa9");
}

TEST(RelayCodecTest, RejectsTrailingBytes) {
  auto frame = relay_codec::Encode(SampleRequest());
  frame.push_back('!');
  EXPECT_THROW(relay_codec::Decode(frame), DecodeError);
}

TEST(RelayCodecTest, HeaderValidators) {
  EXPECT_TRUE(relay_codec::IsHeaderNameValid("X-Hub-Signature-256"));
  EXPECT_FALSE(relay_codec::IsHeaderNameValid(""));
  EXPECT_FALSE(relay_codec::IsHeaderNameValid("a b"));
  EXPECT_TRUE(relay_codec::IsHeaderValueValid(""));
  EXPECT_TRUE(relay_codec::IsHeaderValueValid("sha256=abc"));
  EXPECT_FALSE(relay_codec::IsHeaderValueValid(std::string("a\0b", 3)));
  EXPECT_FALSE(relay_codec::IsHeaderValueValid("\xed\xa0\x80")); // surrogate
}

} // namespace hookhub
