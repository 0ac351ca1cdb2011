#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <string>

#include "hookhub_error.hpp"

namespace hookhub {

// Reads <dir>/<name>.json into T through its tag_invoke. A missing file
// yields `fallback`; an unreadable or malformed one throws hookhub::Error.
template <typename T>
T LoadJsonConfig(const std::filesystem::path &dir, const std::string &name,
                 T fallback = T{}) {
  const auto path = dir / (name + ".json");
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return fallback;
  }
  std::ifstream ifs(path);
  if (!ifs) {
    throw Error(my_errors::GENERAL::FILE_READ_WRITE,
                fmt::format("Unable to read {}", path.string()));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code parse_ec;
  auto jv = boost::json::parse(content, parse_ec);
  if (parse_ec) {
    throw Error(my_errors::GENERAL::JSON_PARSE_ERROR,
                fmt::format("{}: {}", path.string(), parse_ec.message()));
  }
  try {
    return boost::json::value_to<T>(jv);
  } catch (const std::exception &ex) {
    throw Error(my_errors::GENERAL::JSON_PARSE_ERROR,
                fmt::format("{}: {}", path.string(), ex.what()));
  }
}

} // namespace hookhub
