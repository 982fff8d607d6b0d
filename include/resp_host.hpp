#pragma once

#include "host_api.hpp"
#include "protocol.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace modkit {

// A host that lives in-process: commands go to a handler returning RESP
// text, replies are written as RESP text, keys and users are kept in memory.
// Every native object it hands out is counted so leaks and double releases
// are observable.
class RespHost : public HostApi {
 public:
  // Receives the command name followed by its arguments and returns one
  // RESP-encoded reply.
  using CommandHandler = std::function<std::string(const std::vector<std::string>& args)>;

  explicit RespHost(RespVersion protocol = RespVersion::Resp3);
  ~RespHost() override;

  RespHost(const RespHost&) = delete;
  RespHost& operator=(const RespHost&) = delete;

  HostContext* context();
  HostInfoContext* info_context();

  void set_command_handler(CommandHandler handler) { handler_ = std::move(handler); }
  void set_protocol(RespVersion protocol) { protocol_ = protocol; }
  void set_module_name(std::string name) { module_name_ = std::move(name); }
  void set_context_flags(std::uint32_t flags) { context_flags_ = flags; }
  void set_keys_position_request(bool on) { keys_position_request_ = on; }
  void set_current_command(std::string name) { current_command_ = std::move(name); }
  // nullopt removes the version primitive altogether.
  void set_server_version(std::optional<int> packed) { server_version_ = packed; }
  void disable(Capability cap) { disabled_.insert(cap); }
  void enable(Capability cap) { disabled_.erase(cap); }

  void add_user(const std::string& name, std::uint32_t key_permissions, const std::string& key_prefix = "",
                bool enabled = true);
  const std::string& current_user() const { return current_user_; }

  void set_key(const std::string& name, const std::string& value);
  std::optional<std::string> get_key(const std::string& name) const;

  const std::string& output() const { return output_; }
  void clear_output() { output_.clear(); }
  const std::string& info_text() const { return info_text_; }

  struct LogLine {
    std::string level;
    std::string message;
  };
  const std::vector<LogLine>& logs() const { return logs_; }
  const std::vector<std::string>& last_call_args() const { return last_call_args_; }
  const std::string& last_call_options() const { return last_call_options_; }
  const std::vector<int>& key_positions() const { return key_positions_; }
  const std::vector<std::string>& keyspace_events() const { return keyspace_events_; }
  std::uint32_t module_options() const { return module_options_; }
  // nullptr when nothing was exported under `name`.
  void* shared_api(const std::string& name) const;

  std::size_t calls() const { return calls_; }
  std::size_t live_strings() const { return strings_.size(); }
  std::size_t live_replies() const { return replies_.size(); }
  std::size_t live_users() const { return users_out_.size(); }
  std::size_t open_keys() const { return keys_out_.size(); }
  std::size_t acl_checks() const { return acl_checks_; }
  std::size_t replicated() const { return replicated_; }
  // Releases of objects this host did not hand out, or already took back.
  std::size_t bad_releases() const { return bad_releases_; }

  bool supports(Capability cap) const override;

  HostCallReply* call(HostContext* ctx, const char* command, const char* options, HostString** argv,
                      std::size_t argc) override;
  void free_call_reply(HostCallReply* reply) override;

  ReplyTag call_reply_type(HostCallReply* reply) override;
  std::size_t call_reply_length(HostCallReply* reply) override;
  long long call_reply_integer(HostCallReply* reply) override;
  double call_reply_double(HostCallReply* reply) override;
  bool call_reply_bool(HostCallReply* reply) override;
  const char* call_reply_string_ptr(HostCallReply* reply, std::size_t* len) override;
  const char* call_reply_big_number(HostCallReply* reply, std::size_t* len) override;
  const char* call_reply_verbatim(HostCallReply* reply, std::size_t* len, const char** format) override;
  HostCallReply* call_reply_array_element(HostCallReply* reply, std::size_t idx) override;
  void call_reply_map_element(HostCallReply* reply, std::size_t idx, HostCallReply** key,
                              HostCallReply** val) override;
  HostCallReply* call_reply_set_element(HostCallReply* reply, std::size_t idx) override;

  HostString* create_string(HostContext* ctx, const char* ptr, std::size_t len) override;
  void retain_string(HostContext* ctx, HostString* str) override;
  void free_string(HostContext* ctx, HostString* str) override;
  const char* string_ptr_len(const HostString* str, std::size_t* len) override;

  int reply_with_long_long(HostContext* ctx, long long value) override;
  int reply_with_double(HostContext* ctx, double value) override;
  int reply_with_simple_string(HostContext* ctx, const char* msg) override;
  int reply_with_error(HostContext* ctx, const char* err) override;
  int reply_with_string_buffer(HostContext* ctx, const char* buf, std::size_t len) override;
  int reply_with_string(HostContext* ctx, HostString* str) override;
  int reply_with_array(HostContext* ctx, long len) override;
  int reply_with_map(HostContext* ctx, long len) override;
  int reply_with_set(HostContext* ctx, long len) override;
  int reply_with_bool(HostContext* ctx, bool value) override;
  int reply_with_big_number(HostContext* ctx, const char* num, std::size_t len) override;
  int reply_with_verbatim_string_type(HostContext* ctx, const char* buf, std::size_t len,
                                      const char* format) override;
  int reply_with_null(HostContext* ctx) override;
  int wrong_arity(HostContext* ctx) override;

  std::uint32_t get_context_flags(HostContext* ctx) override;
  bool is_keys_position_request(HostContext* ctx) override;
  void key_at_pos(HostContext* ctx, int pos) override;
  void auto_memory(HostContext* ctx) override;
  int replicate_verbatim(HostContext* ctx) override;
  void set_module_options(HostContext* ctx, std::uint32_t options) override;
  const char* current_command_name(HostContext* ctx) override;
  int notify_keyspace_event(HostContext* ctx, std::uint32_t type, const char* event, HostString* key) override;
  int get_server_version() override;
  void log(HostContext* ctx, const char* level, const char* message) override;
  int export_shared_api(HostContext* ctx, const char* name, void* func) override;

  HostKey* open_key(HostContext* ctx, HostString* name, int mode) override;
  void close_key(HostKey* key) override;
  KeyType key_type(HostKey* key) override;
  const char* string_get(HostKey* key, std::size_t* len) override;
  int string_set(HostKey* key, HostString* value) override;
  int delete_key(HostKey* key) override;
  long long get_expire(HostKey* key) override;
  int set_expire(HostKey* key, long long ms) override;

  HostString* get_current_user_name(HostContext* ctx) override;
  int authenticate_client_with_acl_user(HostContext* ctx, const char* name, std::size_t len) override;
  HostUser* get_module_user_from_user_name(HostString* name) override;
  int acl_check_key_permissions(HostUser* user, HostString* key, std::uint32_t flags) override;
  void free_module_user(HostUser* user) override;

  int info_add_section(HostInfoContext* ictx, const char* name) override;
  int info_add_field_cstring(HostInfoContext* ictx, const char* field, const char* value) override;
  int info_add_field_long_long(HostInfoContext* ictx, const char* field, long long value) override;

 private:
  struct Reply;
  struct String;
  struct Key;
  struct User;
  struct UserEntry {
    std::uint32_t permissions = 0;
    std::string key_prefix;
    bool enabled = true;
  };
  struct KeyEntry {
    std::string value;
    long long ttl_ms = kNoExpire;
  };

  static std::unique_ptr<Reply> build_reply(RespNode& node);
  Reply* reply_at(HostCallReply* reply, std::size_t idx) const;
  String* track_string(std::string data);
  Key* live_key(HostKey* key);
  void emit(const std::string& encoded) { output_ += encoded; }

  RespVersion protocol_;
  CommandHandler handler_;
  std::string module_name_ = "modkit";
  std::string current_user_ = "default";
  std::string current_command_;
  std::uint32_t context_flags_ = kCtxMaster;
  bool keys_position_request_ = false;
  std::optional<int> server_version_ = 0x00070203;
  std::set<Capability> disabled_;
  std::uint32_t module_options_ = 0;

  std::unordered_map<std::string, UserEntry> users_;
  std::unordered_map<std::string, KeyEntry> keys_;

  std::string output_;
  std::string info_text_;
  std::vector<LogLine> logs_;
  std::vector<std::string> last_call_args_;
  std::string last_call_options_;
  std::vector<int> key_positions_;
  std::vector<std::string> keyspace_events_;
  std::unordered_map<std::string, void*> shared_apis_;

  std::unordered_set<Reply*> replies_;
  std::unordered_set<String*> strings_;
  std::unordered_set<Key*> keys_out_;
  std::unordered_set<User*> users_out_;
  std::size_t calls_ = 0;
  std::size_t acl_checks_ = 0;
  std::size_t replicated_ = 0;
  std::size_t bad_releases_ = 0;
  int context_tag_ = 0;
  int info_tag_ = 0;
};

} // namespace modkit
