#pragma once

#include <cstddef>
#include <cstdint>

namespace modkit {

// Opaque host objects. Only a HostApi implementation knows their layout.
struct HostContext;
struct HostString;
struct HostCallReply;
struct HostKey;
struct HostUser;
struct HostInfoContext;

enum class Status {
  Ok = 0,
  Err = 1,
};

// Reply tags as reported by the host for a call reply. The set is fixed by the protocol.
enum class ReplyTag {
  Unknown,
  String,
  Error,
  Integer,
  Array,
  Null,
  Map,
  Set,
  Bool,
  Double,
  BigNumber,
  VerbatimString,
};

// Primitives a host may lack depending on its version.
enum class Capability {
  Resp3Replies,
  ServerVersion,
  CurrentUserName,
  AuthenticateUser,
  AclUsers,
  CurrentCommandName,
  KeysPositionRequest,
  ModuleOptions,
  KeyspaceNotifications,
  InfoFields,
  SharedApi,
};

const char* capability_api_name(Capability cap);

enum ContextFlag : std::uint32_t {
  kCtxLua           = 1u << 0,
  kCtxMulti         = 1u << 1,
  kCtxMaster        = 1u << 2,
  kCtxReplica       = 1u << 3,
  kCtxReadOnly      = 1u << 4,
  kCtxCluster       = 1u << 5,
  kCtxAof           = 1u << 6,
  kCtxRdb           = 1u << 7,
  kCtxMaxMemory     = 1u << 8,
  kCtxEvict         = 1u << 9,
  kCtxOom           = 1u << 10,
  kCtxOomWarning    = 1u << 11,
  kCtxReplicated    = 1u << 12,
  kCtxLoading       = 1u << 13,
  kCtxDenyBlocking  = 1u << 21,
};

class ContextFlags {
 public:
  ContextFlags() = default;
  explicit ContextFlags(std::uint32_t bits) : bits_(bits) {}

  bool has(ContextFlag flag) const { return (bits_ & flag) != 0; }
  std::uint32_t bits() const { return bits_; }

 private:
  std::uint32_t bits_ = 0;
};

enum KeyPermission : std::uint32_t {
  kKeyAccess = 1u << 4,
  kKeyUpdate = 1u << 5,
  kKeyInsert = 1u << 6,
  kKeyDelete = 1u << 7,
};

enum ModuleOption : std::uint32_t {
  kOptHandleIoErrors              = 1u << 0,
  kOptNoImplicitSignalModified    = 1u << 1,
  kOptHandleReplAsyncLoad         = 1u << 2,
  kOptAllowNestedKeyspaceNotify   = 1u << 3,
};

class ModuleOptions {
 public:
  ModuleOptions() = default;
  explicit ModuleOptions(std::uint32_t bits) : bits_(bits) {}

  ModuleOptions& set(ModuleOption option) {
    bits_ |= option;
    return *this;
  }
  bool has(ModuleOption option) const { return (bits_ & option) != 0; }
  std::uint32_t bits() const { return bits_; }

 private:
  std::uint32_t bits_ = 0;
};

enum KeyOpenMode : int {
  kKeyRead = 1 << 0,
  kKeyWrite = 1 << 1,
};

enum class KeyType {
  Empty = 0,
  String,
  List,
  Hash,
  Set,
  ZSet,
  Module,
  Stream,
};

enum NotifyEvent : std::uint32_t {
  kNotifyGeneric = 1u << 2,
  kNotifyString  = 1u << 3,
  kNotifyList    = 1u << 4,
  kNotifySet     = 1u << 5,
  kNotifyHash    = 1u << 6,
  kNotifyZSet    = 1u << 7,
  kNotifyExpired = 1u << 8,
  kNotifyEvicted = 1u << 9,
  kNotifyStream  = 1u << 10,
  kNotifyModule  = 1u << 13,
};

constexpr long long kNoExpire = -1;

// The native extension API of the host server. One virtual per primitive; a
// primitive guarded by a Capability must only be called when supports() says so.
class HostApi {
 public:
  virtual ~HostApi() = default;

  virtual bool supports(Capability cap) const = 0;

  // Invocation. A null return means the call itself failed.
  virtual HostCallReply* call(HostContext* ctx, const char* command, const char* options,
                              HostString** argv, std::size_t argc) = 0;
  virtual void free_call_reply(HostCallReply* reply) = 0;

  // Reply introspection. Child replies are owned by their parent.
  virtual ReplyTag call_reply_type(HostCallReply* reply) = 0;
  virtual std::size_t call_reply_length(HostCallReply* reply) = 0;
  virtual long long call_reply_integer(HostCallReply* reply) = 0;
  virtual double call_reply_double(HostCallReply* reply) = 0;
  virtual bool call_reply_bool(HostCallReply* reply) = 0;
  virtual const char* call_reply_string_ptr(HostCallReply* reply, std::size_t* len) = 0;
  virtual const char* call_reply_big_number(HostCallReply* reply, std::size_t* len) = 0;
  virtual const char* call_reply_verbatim(HostCallReply* reply, std::size_t* len, const char** format) = 0;
  virtual HostCallReply* call_reply_array_element(HostCallReply* reply, std::size_t idx) = 0;
  virtual void call_reply_map_element(HostCallReply* reply, std::size_t idx, HostCallReply** key,
                                      HostCallReply** val) = 0;
  virtual HostCallReply* call_reply_set_element(HostCallReply* reply, std::size_t idx) = 0;

  // Strings.
  virtual HostString* create_string(HostContext* ctx, const char* ptr, std::size_t len) = 0;
  virtual void retain_string(HostContext* ctx, HostString* str) = 0;
  virtual void free_string(HostContext* ctx, HostString* str) = 0;
  virtual const char* string_ptr_len(const HostString* str, std::size_t* len) = 0;

  // Reply emission.
  virtual int reply_with_long_long(HostContext* ctx, long long value) = 0;
  virtual int reply_with_double(HostContext* ctx, double value) = 0;
  virtual int reply_with_simple_string(HostContext* ctx, const char* msg) = 0;
  virtual int reply_with_error(HostContext* ctx, const char* err) = 0;
  virtual int reply_with_string_buffer(HostContext* ctx, const char* buf, std::size_t len) = 0;
  virtual int reply_with_string(HostContext* ctx, HostString* str) = 0;
  virtual int reply_with_array(HostContext* ctx, long len) = 0;
  virtual int reply_with_map(HostContext* ctx, long len) = 0;
  virtual int reply_with_set(HostContext* ctx, long len) = 0;
  virtual int reply_with_bool(HostContext* ctx, bool value) = 0;
  virtual int reply_with_big_number(HostContext* ctx, const char* num, std::size_t len) = 0;
  virtual int reply_with_verbatim_string_type(HostContext* ctx, const char* buf, std::size_t len,
                                              const char* format) = 0;
  virtual int reply_with_null(HostContext* ctx) = 0;
  virtual int wrong_arity(HostContext* ctx) = 0;

  // Context state.
  virtual std::uint32_t get_context_flags(HostContext* ctx) = 0;
  virtual bool is_keys_position_request(HostContext* ctx) = 0;
  virtual void key_at_pos(HostContext* ctx, int pos) = 0;
  virtual void auto_memory(HostContext* ctx) = 0;
  virtual int replicate_verbatim(HostContext* ctx) = 0;
  virtual void set_module_options(HostContext* ctx, std::uint32_t options) = 0;
  virtual const char* current_command_name(HostContext* ctx) = 0;
  virtual int notify_keyspace_event(HostContext* ctx, std::uint32_t type, const char* event,
                                    HostString* key) = 0;
  virtual int get_server_version() = 0;
  virtual void log(HostContext* ctx, const char* level, const char* message) = 0;
  // Publishes `func` under `name` for other modules to import. The host
  // stores the pointer as given.
  virtual int export_shared_api(HostContext* ctx, const char* name, void* func) = 0;

  // Keys.
  virtual HostKey* open_key(HostContext* ctx, HostString* name, int mode) = 0;
  virtual void close_key(HostKey* key) = 0;
  virtual KeyType key_type(HostKey* key) = 0;
  virtual const char* string_get(HostKey* key, std::size_t* len) = 0;
  virtual int string_set(HostKey* key, HostString* value) = 0;
  virtual int delete_key(HostKey* key) = 0;
  virtual long long get_expire(HostKey* key) = 0;
  virtual int set_expire(HostKey* key, long long ms) = 0;

  // Users and ACL.
  virtual HostString* get_current_user_name(HostContext* ctx) = 0;
  virtual int authenticate_client_with_acl_user(HostContext* ctx, const char* name, std::size_t len) = 0;
  virtual HostUser* get_module_user_from_user_name(HostString* name) = 0;
  virtual int acl_check_key_permissions(HostUser* user, HostString* key, std::uint32_t flags) = 0;
  virtual void free_module_user(HostUser* user) = 0;

  // INFO sections.
  virtual int info_add_section(HostInfoContext* ictx, const char* name) = 0;
  virtual int info_add_field_cstring(HostInfoContext* ictx, const char* field, const char* value) = 0;
  virtual int info_add_field_long_long(HostInfoContext* ictx, const char* field, long long value) = 0;
};

constexpr int kHostOk = 0;
constexpr int kHostErr = 1;

inline Status to_status(int rc) { return rc == kHostOk ? Status::Ok : Status::Err; }

} // namespace modkit
