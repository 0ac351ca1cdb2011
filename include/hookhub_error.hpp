#pragma once

#include <stdexcept>
#include <string>

#include "my_error_codes.hpp"

namespace hookhub {

// Carries one of the codes from my_error_codes.hpp alongside the message.
class Error : public std::runtime_error {
public:
  Error(int code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  int code() const noexcept { return code_; }

private:
  int code_;
};

class DecodeError : public Error {
public:
  explicit DecodeError(const std::string &what)
      : Error(my_errors::CODEC::DECODE_ERROR, what) {}
};

class EncodeError : public Error {
public:
  explicit EncodeError(const std::string &what)
      : Error(my_errors::CODEC::ENCODE_ERROR, what) {}
};

} // namespace hookhub
