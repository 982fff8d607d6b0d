#pragma once

#include "context.hpp"
#include "host_api.hpp"
#include "info_context.hpp"

struct RedisModuleCtx;
struct RedisModuleInfoCtx;

namespace modkit {

// HostApi over the RedisModule_* function pointers filled in by
// RedisModule_Init. A primitive is supported when its pointer is set.
class RedisModuleHost : public HostApi {
 public:
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
};

RedisModuleHost& redis_module_host();

Context module_context(RedisModuleCtx* ctx);
InfoContext module_info_context(RedisModuleInfoCtx* ctx);

} // namespace modkit
