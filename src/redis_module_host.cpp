#include "redis_module_host.hpp"

// Declarations only: the module's own translation unit, the one that calls
// RedisModule_Init, owns the API pointers.
#define REDISMODULE_API extern
#define REDISMODULE_ATTR
#include <redismodule.h>

namespace modkit {
namespace {

RedisModuleCtx* rm(HostContext* ctx) { return reinterpret_cast<RedisModuleCtx*>(ctx); }
RedisModuleCallReply* rm(HostCallReply* reply) { return reinterpret_cast<RedisModuleCallReply*>(reply); }
RedisModuleString* rm(HostString* str) { return reinterpret_cast<RedisModuleString*>(str); }
const RedisModuleString* rm(const HostString* str) { return reinterpret_cast<const RedisModuleString*>(str); }
RedisModuleKey* rm(HostKey* key) { return reinterpret_cast<RedisModuleKey*>(key); }
RedisModuleUser* rm(HostUser* user) { return reinterpret_cast<RedisModuleUser*>(user); }
RedisModuleInfoCtx* rm(HostInfoContext* ictx) { return reinterpret_cast<RedisModuleInfoCtx*>(ictx); }

HostCallReply* host(RedisModuleCallReply* reply) { return reinterpret_cast<HostCallReply*>(reply); }
HostString* host(RedisModuleString* str) { return reinterpret_cast<HostString*>(str); }

}  // namespace

bool RedisModuleHost::supports(Capability cap) const {
  switch (cap) {
    case Capability::Resp3Replies:
      return RedisModule_ReplyWithMap && RedisModule_ReplyWithSet && RedisModule_ReplyWithBool &&
             RedisModule_ReplyWithBigNumber && RedisModule_ReplyWithVerbatimStringType;
    case Capability::ServerVersion:
      return RedisModule_GetServerVersion != nullptr;
    case Capability::CurrentUserName:
      return RedisModule_GetCurrentUserName != nullptr;
    case Capability::AuthenticateUser:
      return RedisModule_AuthenticateClientWithACLUser != nullptr;
    case Capability::AclUsers:
      return RedisModule_GetModuleUserFromUserName && RedisModule_ACLCheckKeyPermissions &&
             RedisModule_FreeModuleUser;
    case Capability::CurrentCommandName:
      return RedisModule_GetCurrentCommandName != nullptr;
    case Capability::KeysPositionRequest:
      return RedisModule_IsKeysPositionRequest && RedisModule_KeyAtPos;
    case Capability::ModuleOptions:
      return RedisModule_SetModuleOptions != nullptr;
    case Capability::KeyspaceNotifications:
      return RedisModule_NotifyKeyspaceEvent != nullptr;
    case Capability::InfoFields:
      return RedisModule_InfoAddSection && RedisModule_InfoAddFieldCString && RedisModule_InfoAddFieldLongLong;
    case Capability::SharedApi:
      return RedisModule_ExportSharedAPI != nullptr;
  }
  return false;
}

HostCallReply* RedisModuleHost::call(HostContext* ctx, const char* command, const char* options, HostString** argv,
                                     std::size_t argc) {
  return host(RedisModule_Call(rm(ctx), command, options, reinterpret_cast<RedisModuleString**>(argv), argc));
}

void RedisModuleHost::free_call_reply(HostCallReply* reply) { RedisModule_FreeCallReply(rm(reply)); }

ReplyTag RedisModuleHost::call_reply_type(HostCallReply* reply) {
  switch (RedisModule_CallReplyType(rm(reply))) {
    case REDISMODULE_REPLY_STRING: return ReplyTag::String;
    case REDISMODULE_REPLY_ERROR: return ReplyTag::Error;
    case REDISMODULE_REPLY_INTEGER: return ReplyTag::Integer;
    case REDISMODULE_REPLY_ARRAY: return ReplyTag::Array;
    case REDISMODULE_REPLY_NULL: return ReplyTag::Null;
    case REDISMODULE_REPLY_MAP: return ReplyTag::Map;
    case REDISMODULE_REPLY_SET: return ReplyTag::Set;
    case REDISMODULE_REPLY_BOOL: return ReplyTag::Bool;
    case REDISMODULE_REPLY_DOUBLE: return ReplyTag::Double;
    case REDISMODULE_REPLY_BIG_NUMBER: return ReplyTag::BigNumber;
    case REDISMODULE_REPLY_VERBATIM_STRING: return ReplyTag::VerbatimString;
    default: return ReplyTag::Unknown;
  }
}

std::size_t RedisModuleHost::call_reply_length(HostCallReply* reply) { return RedisModule_CallReplyLength(rm(reply)); }

long long RedisModuleHost::call_reply_integer(HostCallReply* reply) {
  return RedisModule_CallReplyInteger(rm(reply));
}

double RedisModuleHost::call_reply_double(HostCallReply* reply) { return RedisModule_CallReplyDouble(rm(reply)); }

bool RedisModuleHost::call_reply_bool(HostCallReply* reply) { return RedisModule_CallReplyBool(rm(reply)) != 0; }

const char* RedisModuleHost::call_reply_string_ptr(HostCallReply* reply, std::size_t* len) {
  return RedisModule_CallReplyStringPtr(rm(reply), len);
}

const char* RedisModuleHost::call_reply_big_number(HostCallReply* reply, std::size_t* len) {
  return RedisModule_CallReplyBigNumber(rm(reply), len);
}

const char* RedisModuleHost::call_reply_verbatim(HostCallReply* reply, std::size_t* len, const char** format) {
  return RedisModule_CallReplyVerbatim(rm(reply), len, format);
}

HostCallReply* RedisModuleHost::call_reply_array_element(HostCallReply* reply, std::size_t idx) {
  return host(RedisModule_CallReplyArrayElement(rm(reply), idx));
}

void RedisModuleHost::call_reply_map_element(HostCallReply* reply, std::size_t idx, HostCallReply** key,
                                             HostCallReply** val) {
  RedisModuleCallReply* k = nullptr;
  RedisModuleCallReply* v = nullptr;
  if (RedisModule_CallReplyMapElement(rm(reply), idx, &k, &v) != REDISMODULE_OK) {
    k = nullptr;
    v = nullptr;
  }
  if (key) *key = host(k);
  if (val) *val = host(v);
}

HostCallReply* RedisModuleHost::call_reply_set_element(HostCallReply* reply, std::size_t idx) {
  return host(RedisModule_CallReplySetElement(rm(reply), idx));
}

HostString* RedisModuleHost::create_string(HostContext* ctx, const char* ptr, std::size_t len) {
  return host(RedisModule_CreateString(rm(ctx), ptr, len));
}

void RedisModuleHost::retain_string(HostContext* ctx, HostString* str) { RedisModule_RetainString(rm(ctx), rm(str)); }

void RedisModuleHost::free_string(HostContext* ctx, HostString* str) { RedisModule_FreeString(rm(ctx), rm(str)); }

const char* RedisModuleHost::string_ptr_len(const HostString* str, std::size_t* len) {
  return RedisModule_StringPtrLen(rm(str), len);
}

int RedisModuleHost::reply_with_long_long(HostContext* ctx, long long value) {
  return RedisModule_ReplyWithLongLong(rm(ctx), value);
}

int RedisModuleHost::reply_with_double(HostContext* ctx, double value) {
  return RedisModule_ReplyWithDouble(rm(ctx), value);
}

int RedisModuleHost::reply_with_simple_string(HostContext* ctx, const char* msg) {
  return RedisModule_ReplyWithSimpleString(rm(ctx), msg);
}

int RedisModuleHost::reply_with_error(HostContext* ctx, const char* err) {
  return RedisModule_ReplyWithError(rm(ctx), err);
}

int RedisModuleHost::reply_with_string_buffer(HostContext* ctx, const char* buf, std::size_t len) {
  return RedisModule_ReplyWithStringBuffer(rm(ctx), buf, len);
}

int RedisModuleHost::reply_with_string(HostContext* ctx, HostString* str) {
  return RedisModule_ReplyWithString(rm(ctx), rm(str));
}

int RedisModuleHost::reply_with_array(HostContext* ctx, long len) { return RedisModule_ReplyWithArray(rm(ctx), len); }

int RedisModuleHost::reply_with_map(HostContext* ctx, long len) { return RedisModule_ReplyWithMap(rm(ctx), len); }

int RedisModuleHost::reply_with_set(HostContext* ctx, long len) { return RedisModule_ReplyWithSet(rm(ctx), len); }

int RedisModuleHost::reply_with_bool(HostContext* ctx, bool value) {
  return RedisModule_ReplyWithBool(rm(ctx), value ? 1 : 0);
}

int RedisModuleHost::reply_with_big_number(HostContext* ctx, const char* num, std::size_t len) {
  return RedisModule_ReplyWithBigNumber(rm(ctx), num, len);
}

int RedisModuleHost::reply_with_verbatim_string_type(HostContext* ctx, const char* buf, std::size_t len,
                                                     const char* format) {
  return RedisModule_ReplyWithVerbatimStringType(rm(ctx), buf, len, format);
}

int RedisModuleHost::reply_with_null(HostContext* ctx) { return RedisModule_ReplyWithNull(rm(ctx)); }

int RedisModuleHost::wrong_arity(HostContext* ctx) { return RedisModule_WrongArity(rm(ctx)); }

std::uint32_t RedisModuleHost::get_context_flags(HostContext* ctx) {
  return static_cast<std::uint32_t>(RedisModule_GetContextFlags(rm(ctx)));
}

bool RedisModuleHost::is_keys_position_request(HostContext* ctx) {
  return RedisModule_IsKeysPositionRequest(rm(ctx)) != 0;
}

void RedisModuleHost::key_at_pos(HostContext* ctx, int pos) { RedisModule_KeyAtPos(rm(ctx), pos); }

void RedisModuleHost::auto_memory(HostContext* ctx) { RedisModule_AutoMemory(rm(ctx)); }

int RedisModuleHost::replicate_verbatim(HostContext* ctx) { return RedisModule_ReplicateVerbatim(rm(ctx)); }

void RedisModuleHost::set_module_options(HostContext* ctx, std::uint32_t options) {
  RedisModule_SetModuleOptions(rm(ctx), static_cast<int>(options));
}

const char* RedisModuleHost::current_command_name(HostContext* ctx) {
  return RedisModule_GetCurrentCommandName(rm(ctx));
}

int RedisModuleHost::notify_keyspace_event(HostContext* ctx, std::uint32_t type, const char* event,
                                           HostString* key) {
  return RedisModule_NotifyKeyspaceEvent(rm(ctx), static_cast<int>(type), event, rm(key));
}

int RedisModuleHost::get_server_version() { return RedisModule_GetServerVersion(); }

void RedisModuleHost::log(HostContext* ctx, const char* level, const char* message) {
  RedisModule_Log(rm(ctx), level, "%s", message);
}

int RedisModuleHost::export_shared_api(HostContext* ctx, const char* name, void* func) {
  return RedisModule_ExportSharedAPI(rm(ctx), name, func);
}

HostKey* RedisModuleHost::open_key(HostContext* ctx, HostString* name, int mode) {
  return reinterpret_cast<HostKey*>(RedisModule_OpenKey(rm(ctx), rm(name), mode));
}

void RedisModuleHost::close_key(HostKey* key) { RedisModule_CloseKey(rm(key)); }

KeyType RedisModuleHost::key_type(HostKey* key) {
  const int t = RedisModule_KeyType(rm(key));
  if (t < REDISMODULE_KEYTYPE_EMPTY || t > REDISMODULE_KEYTYPE_STREAM) return KeyType::Empty;
  return static_cast<KeyType>(t);
}

const char* RedisModuleHost::string_get(HostKey* key, std::size_t* len) {
  return RedisModule_StringDMA(rm(key), len, REDISMODULE_READ);
}

int RedisModuleHost::string_set(HostKey* key, HostString* value) { return RedisModule_StringSet(rm(key), rm(value)); }

int RedisModuleHost::delete_key(HostKey* key) { return RedisModule_DeleteKey(rm(key)); }

long long RedisModuleHost::get_expire(HostKey* key) { return RedisModule_GetExpire(rm(key)); }

int RedisModuleHost::set_expire(HostKey* key, long long ms) { return RedisModule_SetExpire(rm(key), ms); }

HostString* RedisModuleHost::get_current_user_name(HostContext* ctx) {
  return host(RedisModule_GetCurrentUserName(rm(ctx)));
}

int RedisModuleHost::authenticate_client_with_acl_user(HostContext* ctx, const char* name, std::size_t len) {
  return RedisModule_AuthenticateClientWithACLUser(rm(ctx), name, len, nullptr, nullptr, nullptr);
}

HostUser* RedisModuleHost::get_module_user_from_user_name(HostString* name) {
  return reinterpret_cast<HostUser*>(RedisModule_GetModuleUserFromUserName(rm(name)));
}

int RedisModuleHost::acl_check_key_permissions(HostUser* user, HostString* key, std::uint32_t flags) {
  return RedisModule_ACLCheckKeyPermissions(rm(user), rm(key), static_cast<int>(flags));
}

void RedisModuleHost::free_module_user(HostUser* user) { (void)RedisModule_FreeModuleUser(rm(user)); }

int RedisModuleHost::info_add_section(HostInfoContext* ictx, const char* name) {
  return RedisModule_InfoAddSection(rm(ictx), name);
}

int RedisModuleHost::info_add_field_cstring(HostInfoContext* ictx, const char* field, const char* value) {
  return RedisModule_InfoAddFieldCString(rm(ictx), field, value);
}

int RedisModuleHost::info_add_field_long_long(HostInfoContext* ictx, const char* field, long long value) {
  return RedisModule_InfoAddFieldLongLong(rm(ictx), field, value);
}

RedisModuleHost& redis_module_host() {
  static RedisModuleHost host_api;
  return host_api;
}

Context module_context(RedisModuleCtx* ctx) {
  return Context(&redis_module_host(), reinterpret_cast<HostContext*>(ctx));
}

InfoContext module_info_context(RedisModuleInfoCtx* ctx) {
  return InfoContext(&redis_module_host(), reinterpret_cast<HostInfoContext*>(ctx));
}

}  // namespace modkit
