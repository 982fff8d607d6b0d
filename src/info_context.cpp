#include "info_context.hpp"

#include "logger.hpp"

namespace modkit {

bool InfoContext::available() const {
  if (!api_ || !ctx_) return false;
  if (!api_->supports(Capability::InfoFields)) {
    log(LogLevel::Warning, capability_api_name(Capability::InfoFields));
    return false;
  }
  return true;
}

Status InfoContext::add_info_section(const std::optional<std::string>& name) const {
  if (!available()) return Status::Err;
  return to_status(api_->info_add_section(ctx_, name ? name->c_str() : nullptr));
}

Status InfoContext::add_info_field_str(const std::string& name, const std::string& content) const {
  if (!available()) return Status::Err;
  return to_status(api_->info_add_field_cstring(ctx_, name.c_str(), content.c_str()));
}

Status InfoContext::add_info_field_long_long(const std::string& name, long long value) const {
  if (!available()) return Status::Err;
  return to_status(api_->info_add_field_long_long(ctx_, name.c_str(), value));
}

}  // namespace modkit
