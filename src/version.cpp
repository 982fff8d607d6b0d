#include "version.hpp"

#include <regex>
#include <stdexcept>
#include <tuple>

namespace modkit {

bool Version::operator<(const Version& other) const {
  return std::tie(major, minor, patch) < std::tie(other.major, other.minor, other.patch);
}

std::string Version::to_string() const {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

Version version_from_packed(int packed) {
  Version v;
  v.major = (packed >> 16) & 0xff;
  v.minor = (packed >> 8) & 0xff;
  v.patch = packed & 0xff;
  return v;
}

std::optional<Version> version_from_info(const Value& info, Error& err) {
  std::string text;
  switch (info.kind) {
    case Value::Kind::SimpleString:
    case Value::Kind::BulkString:
    case Value::Kind::StringBuffer:
    case Value::Kind::VerbatimString:
      text = info.str;
      break;
    default:
      err = Error::str("Error getting redis_version");
      return std::nullopt;
  }

  static const std::regex pattern(R"(\bredis_version:([0-9]+)\.([0-9]+)\.([0-9]+)\b)");
  std::smatch match;
  if (!std::regex_search(text, match, pattern)) {
    err = Error::str("Error getting redis_version");
    return std::nullopt;
  }

  try {
    Version v;
    v.major = std::stoi(match[1].str());
    v.minor = std::stoi(match[2].str());
    v.patch = std::stoi(match[3].str());
    return v;
  } catch (const std::out_of_range&) {
    err = Error::str("Error getting redis_version");
    return std::nullopt;
  }
}

}  // namespace modkit
