#pragma once

#include "call_options.hpp"
#include "errors.hpp"
#include "handles.hpp"
#include "host_api.hpp"
#include "key.hpp"
#include "logger.hpp"
#include "value.hpp"
#include "version.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modkit {

// High-level view of one host context. Not safe for concurrent use: every
// operation is a blocking call on the thread that owns the context.
class Context {
 public:
  Context(HostApi* api, HostContext* ctx) : api_(api), ctx_(ctx) {}

  // A context with no host attached.
  static Context dummy() { return Context(nullptr, nullptr); }

  HostApi* api() const { return api_; }
  HostContext* raw() const { return ctx_; }

  void log(LogLevel level, const std::string& message) const;
  void log_debug(const std::string& message) const { log(LogLevel::Debug, message); }
  void log_verbose(const std::string& message) const { log(LogLevel::Verbose, message); }
  void log_notice(const std::string& message) const { log(LogLevel::Notice, message); }
  void log_warning(const std::string& message) const { log(LogLevel::Warning, message); }

  void auto_memory() const;
  bool is_keys_position_request() const;
  void key_at_pos(int pos) const;

  // ── Invocation ──
  Result call(const std::string& command, const std::vector<std::string>& args) const;
  Result call_ext(const std::string& command, const CallOptions& options,
                  const std::vector<std::string_view>& args) const;

  // ── Replies ──
  Status reply(const Result& result) const;
  Status reply_value(const Value& value) const;
  Status reply_null() const;
  Status reply_simple_string(const std::string& s) const;
  Status reply_bulk_string(const std::string& s) const;
  Status reply_bulk_slice(std::string_view bytes) const;
  Status reply_array(std::size_t size) const;
  Status reply_long(long long value) const;
  Status reply_double(double value) const;
  Status reply_error_string(const std::string& s) const;

  // CR, LF and NUL become spaces so the text fits a single protocol line.
  static std::string str_as_legal_resp_string(std::string_view s);

  // ── Keys and strings ──
  Key open_key(const ModuleString& name) const;
  WritableKey open_key_writable(const ModuleString& name) const;
  ModuleString create_string(const std::string& s) const;
  ModuleString create_string_from_slice(std::string_view bytes) const;

  Status replicate_verbatim() const;
  Status notify_keyspace_event(NotifyEvent type, const std::string& event, const ModuleString& key) const;
  std::optional<std::string> current_command_name(Error& err) const;
  // `func` must stay valid for as long as the module is loaded.
  Status export_shared_api(void* func, const std::string& name) const;

  // ── Server state ──
  void set_module_options(ModuleOptions options) const;
  ContextFlags flags() const;
  bool is_primary() const;
  bool is_oom() const;
  bool allow_block() const;

  std::optional<Version> get_server_version(Error& err, bool force_info = false) const;

  // ── Users and ACL ──
  std::optional<std::string> get_current_user(Error& err) const;
  Status authenticate_user(const std::string& user_name) const;
  bool acl_check_key_permission(const std::string& user_name, const ModuleString& key_name,
                                const AclPermissions& permissions, Error& err) const;

 private:
  Result call_internal(const std::string& command, const char* options,
                       const std::vector<std::string_view>& args) const;
  Status reply_unavailable(Capability cap) const;
  bool require(Capability cap, Error& err) const;

  HostApi* api_ = nullptr;
  HostContext* ctx_ = nullptr;
};

} // namespace modkit
