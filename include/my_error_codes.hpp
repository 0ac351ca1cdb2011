// Error codes shared by the relay server and the tunnel client.
#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int NOT_FOUND = 5003;  // Not found
constexpr int MISSING_FIELD = 5008;  // Missing field
constexpr int CREATE_FAILED = 5014;  // Create failed
constexpr int ALREADY_EXISTS = 5015;  // Already exists
constexpr int FILE_READ_WRITE = 5020;  // File read/write error
constexpr int JSON_PARSE_ERROR = 5021;  // JSON parse error
}  // namespace GENERAL

namespace TUNNEL {  // Tunnel handshake errors

constexpr int UNAUTHORIZED = 5300;  // Secret mismatch
constexpr int VERSION_MISMATCH = 5301;  // Client and server major versions differ
constexpr int PROTOCOL_ERROR = 5302;  // Unexpected or malformed handshake
constexpr int HANDSHAKE_TIMEOUT = 5303;  // No hello within the handshake window
}  // namespace TUNNEL

namespace CODEC {  // Relay codec errors

constexpr int DECODE_ERROR = 9001;  // Failed to decode a relayed request
constexpr int ENCODE_ERROR = 9002;  // Failed to encode a relayed request
}  // namespace CODEC

}  // namespace my_errors
