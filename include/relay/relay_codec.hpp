#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "hookhub_error.hpp"
#include "relay/relayed_request.hpp"

namespace hookhub {

// Binary framing of a RelayedRequest, carried in one websocket binary frame.
//
//   "HKHB" | u8 format | u8 len + verb | u32 len + target | u32 count
//   | count x (u32 len + name, u32 len + value) | u32 len + body
//
// Integers are big-endian. Every variable-size field is length-prefixed so the
// body may hold arbitrary bytes.
namespace relay_codec {

inline constexpr std::string_view kMagic{"HKHB", 4};
inline constexpr std::uint8_t kFormatVersion = 1;

// Throws EncodeError for anything Decode would reject: an unknown method, an
// empty target, an invalid header name or value, or a field that exceeds its
// length prefix.
std::string Encode(const RelayedRequest &request);

// Throws DecodeError on any structural violation, including trailing bytes.
RelayedRequest Decode(std::string_view bytes);

bool IsHeaderNameValid(std::string_view name);
bool IsHeaderValueValid(std::string_view value);

} // namespace relay_codec
} // namespace hookhub
