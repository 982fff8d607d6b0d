#pragma once

#include "host_api.hpp"

#include <optional>
#include <string>

namespace modkit {

// Adds sections and fields to the host's INFO output from an info callback.
class InfoContext {
 public:
  InfoContext(HostApi* api, HostInfoContext* ctx) : api_(api), ctx_(ctx) {}

  // Without a name the section is named after the module.
  Status add_info_section(const std::optional<std::string>& name) const;
  Status add_info_field_str(const std::string& name, const std::string& content) const;
  Status add_info_field_long_long(const std::string& name, long long value) const;

 private:
  bool available() const;

  HostApi* api_ = nullptr;
  HostInfoContext* ctx_ = nullptr;
};

} // namespace modkit
