#pragma once

#include "errors.hpp"
#include "value.hpp"

#include <optional>
#include <string>

namespace modkit {

struct Version {
  int major = 0;
  int minor = 0;
  int patch = 0;

  bool operator==(const Version& other) const {
    return major == other.major && minor == other.minor && patch == other.patch;
  }
  bool operator<(const Version& other) const;
  std::string to_string() const;
};

// Host encoding 0x00MMmmpp.
Version version_from_packed(int packed);

// Extracts `redis_version:X.Y.Z` from an INFO reply.
std::optional<Version> version_from_info(const Value& info, Error& err);

} // namespace modkit
