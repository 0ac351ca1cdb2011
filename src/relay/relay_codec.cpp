#include "relay/relay_codec.hpp"

#include <boost/beast/http/verb.hpp>

#include <fmt/format.h>
#include <limits>

namespace hookhub::relay_codec {
namespace http = boost::beast::http;

namespace {

void PutU8(std::string &out, std::uint8_t v) {
  out.push_back(static_cast<char>(v));
}

void PutU32(std::string &out, std::uint32_t v) {
  out.push_back(static_cast<char>((v >> 24) & 0xff));
  out.push_back(static_cast<char>((v >> 16) & 0xff));
  out.push_back(static_cast<char>((v >> 8) & 0xff));
  out.push_back(static_cast<char>(v & 0xff));
}

void PutBlob32(std::string &out, std::string_view blob, const char *field) {
  if (blob.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw EncodeError(fmt::format("{} too large: {} bytes", field, blob.size()));
  }
  PutU32(out, static_cast<std::uint32_t>(blob.size()));
  out.append(blob.data(), blob.size());
}

class Reader {
public:
  explicit Reader(std::string_view bytes) : bytes_(bytes) {}

  std::string_view Take(std::size_t n, const char *field) {
    if (n > bytes_.size() - pos_) {
      throw DecodeError(fmt::format(
          "truncated {}: need {} bytes at offset {}, have {}", field, n, pos_,
          bytes_.size() - pos_));
    }
    auto out = bytes_.substr(pos_, n);
    pos_ += n;
    return out;
  }

  std::uint8_t U8(const char *field) {
    return static_cast<std::uint8_t>(Take(1, field)[0]);
  }

  std::uint32_t U32(const char *field) {
    auto raw = Take(4, field);
    return (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[0])) << 24) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[1])) << 16) |
           (static_cast<std::uint32_t>(static_cast<unsigned char>(raw[2])) << 8) |
           static_cast<std::uint32_t>(static_cast<unsigned char>(raw[3]));
  }

  std::string_view Blob32(const char *field) {
    const auto len = U32(field);
    if (len > bytes_.size() - pos_) {
      throw DecodeError(fmt::format(
          "{} length prefix {} exceeds remaining {} bytes", field, len,
          bytes_.size() - pos_));
    }
    return Take(len, field);
  }

  std::size_t Remaining() const { return bytes_.size() - pos_; }

private:
  std::string_view bytes_;
  std::size_t pos_{0};
};

bool IsTokenChar(unsigned char c) {
  if (c >= '0' && c <= '9') {
    return true;
  }
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
    return true;
  }
  switch (c) {
  case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
  case '+': case '-': case '.': case '^': case '_': case '`': case '|':
  case '~':
    return true;
  default:
    return false;
  }
}

bool IsValidUtf8(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<unsigned char>(s[i]);
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xe0) == 0xc0) {
      extra = 1;
      cp = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      extra = 2;
      cp = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= s.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xc0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3f);
    }
    // overlong forms, surrogates, out of range
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10ffff ||
        (cp >= 0xd800 && cp <= 0xdfff)) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

} // namespace

bool IsHeaderNameValid(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  for (unsigned char c : name) {
    if (!IsTokenChar(c)) {
      return false;
    }
  }
  return true;
}

bool IsHeaderValueValid(std::string_view value) {
  for (char c : value) {
    if (c == '\r' || c == '\n' || c == '\0') {
      return false;
    }
  }
  return IsValidUtf8(value);
}

std::string Encode(const RelayedRequest &request) {
  if (request.method == http::verb::unknown) {
    throw EncodeError("cannot encode request with unknown method");
  }
  const auto verb = http::to_string(request.method);
  if (request.target.empty()) {
    throw EncodeError("cannot encode request with empty target");
  }
  for (std::size_t i = 0; i < request.headers.size(); ++i) {
    const auto &[name, value] = request.headers[i];
    if (!IsHeaderNameValid(name)) {
      throw EncodeError(fmt::format("invalid header name at index {}", i));
    }
    if (!IsHeaderValueValid(value)) {
      throw EncodeError(fmt::format("invalid value for header '{}'", name));
    }
  }

  std::size_t reserve = kMagic.size() + 2 + verb.size() + 4 +
                        request.target.size() + 4 + 4 + request.body.size();
  for (const auto &h : request.headers) {
    reserve += 8 + h.first.size() + h.second.size();
  }

  std::string out;
  out.reserve(reserve);
  out.append(kMagic.data(), kMagic.size());
  PutU8(out, kFormatVersion);
  PutU8(out, static_cast<std::uint8_t>(verb.size()));
  out.append(verb.data(), verb.size());
  PutBlob32(out, request.target, "target");
  if (request.headers.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw EncodeError("too many headers");
  }
  PutU32(out, static_cast<std::uint32_t>(request.headers.size()));
  for (const auto &h : request.headers) {
    PutBlob32(out, h.first, "header name");
    PutBlob32(out, h.second, "header value");
  }
  PutBlob32(out, request.body, "body");
  return out;
}

RelayedRequest Decode(std::string_view bytes) {
  Reader reader(bytes);
  if (reader.Take(kMagic.size(), "magic") != kMagic) {
    throw DecodeError("bad magic");
  }
  const auto format = reader.U8("format version");
  if (format != kFormatVersion) {
    throw DecodeError(fmt::format("unsupported format version {}", format));
  }

  RelayedRequest request;
  const auto verb_len = reader.U8("method length");
  const auto verb_token = reader.Take(verb_len, "method");
  request.method = http::string_to_verb({verb_token.data(), verb_token.size()});
  if (request.method == http::verb::unknown) {
    throw DecodeError(fmt::format("invalid verb token '{}'", verb_token));
  }

  request.target = std::string(reader.Blob32("target"));
  if (request.target.empty()) {
    throw DecodeError("empty target");
  }

  const auto count = reader.U32("header count");
  // Each header needs at least 8 bytes of prefixes.
  if (count > reader.Remaining() / 8) {
    throw DecodeError(fmt::format("header count {} exceeds payload", count));
  }
  request.headers.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    auto name = reader.Blob32("header name");
    auto value = reader.Blob32("header value");
    if (!IsHeaderNameValid(name)) {
      throw DecodeError(fmt::format("invalid header name at index {}", i));
    }
    if (!IsHeaderValueValid(value)) {
      throw DecodeError(
          fmt::format("invalid value for header '{}'", name));
    }
    request.headers.emplace_back(std::string(name), std::string(value));
  }

  request.body = std::string(reader.Blob32("body"));
  if (reader.Remaining() != 0) {
    throw DecodeError(
        fmt::format("{} trailing bytes after body", reader.Remaining()));
  }
  return request;
}

} // namespace hookhub::relay_codec
