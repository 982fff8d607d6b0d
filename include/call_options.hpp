#pragma once

#include "host_api.hpp"

#include <string>
#include <utility>

namespace modkit {

// Encoded invocation flags: the base flag, the requested flags in the order
// they were added, then one NUL terminator.
class CallOptions {
 public:
  const char* c_str() const { return token_.c_str(); }
  const std::string& token() const { return token_; }

 private:
  friend class CallOptionsBuilder;
  explicit CallOptions(std::string token) : token_(std::move(token)) {}

  std::string token_;
};

class CallOptionsBuilder {
 public:
  CallOptionsBuilder() = default;

  CallOptionsBuilder& no_writes() { return add_flag('W'); }
  CallOptionsBuilder& script_mode() { return add_flag('S'); }
  CallOptionsBuilder& verify_acl() { return add_flag('C'); }
  CallOptionsBuilder& verify_oom() { return add_flag('M'); }
  CallOptionsBuilder& errors_as_replies() { return add_flag('E'); }
  CallOptionsBuilder& replicate() { return add_flag('!'); }
  CallOptionsBuilder& resp_3() { return add_flag('3'); }

  CallOptions build() const;

 private:
  CallOptionsBuilder& add_flag(char flag) {
    flags_.push_back(flag);
    return *this;
  }

  std::string flags_ = "v";  // argv-vector calling convention
};

const CallOptions& default_call_options();

class AclPermissions {
 public:
  AclPermissions() = default;

  AclPermissions& add_access_permission() { return add(kKeyAccess); }
  AclPermissions& add_insert_permission() { return add(kKeyInsert); }
  AclPermissions& add_delete_permission() { return add(kKeyDelete); }
  AclPermissions& add_update_permission() { return add(kKeyUpdate); }
  AclPermissions& add_full_permission() {
    return add_access_permission().add_insert_permission().add_delete_permission().add_update_permission();
  }

  bool has(KeyPermission perm) const { return (flags_ & perm) != 0; }
  bool empty() const { return flags_ == 0; }
  std::uint32_t bits() const { return flags_; }

 private:
  AclPermissions& add(KeyPermission perm) {
    flags_ |= perm;
    return *this;
  }

  std::uint32_t flags_ = 0;
};

} // namespace modkit
