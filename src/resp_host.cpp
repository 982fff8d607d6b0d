#include "resp_host.hpp"

#include <cstring>

namespace modkit {

struct RespHost::Reply {
  ReplyTag tag = ReplyTag::Unknown;
  std::string str;
  std::string format;
  long long integer = 0;
  double dbl = 0;
  bool boolean = false;
  // Maps keep keys and values alternating.
  std::vector<std::unique_ptr<Reply>> children;
};

struct RespHost::String {
  std::string data;
  int refcount = 1;
};

struct RespHost::Key {
  std::string name;
  int mode = 0;
};

struct RespHost::User {
  std::string name;
  UserEntry entry;
};

namespace {

template <typename T, typename H>
T* as(H* handle) {
  return reinterpret_cast<T*>(handle);
}

template <typename H, typename T>
H* handle(T* obj) {
  return reinterpret_cast<H*>(obj);
}

}  // namespace

RespHost::RespHost(RespVersion protocol) : protocol_(protocol) {}

RespHost::~RespHost() {
  for (auto* r : replies_) delete r;
  for (auto* s : strings_) delete s;
  for (auto* k : keys_out_) delete k;
  for (auto* u : users_out_) delete u;
}

HostContext* RespHost::context() { return handle<HostContext>(&context_tag_); }

HostInfoContext* RespHost::info_context() { return handle<HostInfoContext>(&info_tag_); }

void RespHost::add_user(const std::string& name, std::uint32_t key_permissions, const std::string& key_prefix,
                        bool enabled) {
  UserEntry entry;
  entry.permissions = key_permissions;
  entry.key_prefix = key_prefix;
  entry.enabled = enabled;
  users_[name] = entry;
}

void RespHost::set_key(const std::string& name, const std::string& value) { keys_[name] = KeyEntry{value, kNoExpire}; }

std::optional<std::string> RespHost::get_key(const std::string& name) const {
  const auto it = keys_.find(name);
  if (it == keys_.end()) return std::nullopt;
  return it->second.value;
}

bool RespHost::supports(Capability cap) const {
  if (disabled_.count(cap)) return false;
  if (cap == Capability::ServerVersion) return server_version_.has_value();
  return true;
}

// ─── Invocation ──────────────────────────────────────────────────────────────

std::unique_ptr<RespHost::Reply> RespHost::build_reply(RespNode& node) {
  auto reply = std::make_unique<Reply>();
  switch (node.type) {
    case RespNode::Nil:
      reply->tag = ReplyTag::Null;
      break;
    case RespNode::SimpleString:
    case RespNode::BulkString:
      reply->tag = ReplyTag::String;
      reply->str = std::move(node.str);
      break;
    case RespNode::Error:
      reply->tag = ReplyTag::Error;
      reply->str = std::move(node.str);
      break;
    case RespNode::Integer:
      reply->tag = ReplyTag::Integer;
      reply->integer = node.integer;
      break;
    case RespNode::Double:
      reply->tag = ReplyTag::Double;
      reply->dbl = node.dbl;
      break;
    case RespNode::BigNumber:
      reply->tag = ReplyTag::BigNumber;
      reply->str = std::move(node.str);
      break;
    case RespNode::Bool:
      reply->tag = ReplyTag::Bool;
      reply->boolean = node.boolean;
      break;
    case RespNode::Verbatim:
      reply->tag = ReplyTag::VerbatimString;
      reply->format = std::move(node.format);
      reply->str = std::move(node.str);
      break;
    case RespNode::Array:
    case RespNode::Map:
    case RespNode::Set:
      reply->tag = node.type == RespNode::Array ? ReplyTag::Array
                   : node.type == RespNode::Map ? ReplyTag::Map
                                                : ReplyTag::Set;
      reply->children.reserve(node.array.size());
      for (auto& child : node.array) reply->children.push_back(build_reply(child));
      break;
  }
  return reply;
}

HostCallReply* RespHost::call(HostContext*, const char* command, const char* options, HostString** argv,
                              std::size_t argc) {
  ++calls_;
  last_call_options_ = options ? options : "";
  last_call_args_.clear();
  last_call_args_.emplace_back(command ? command : "");
  for (std::size_t i = 0; i < argc; ++i) {
    std::size_t len = 0;
    const char* p = string_ptr_len(argv[i], &len);
    last_call_args_.emplace_back(p, len);
  }

  // Arguments arrive as an argv vector only.
  if (last_call_options_.empty() || last_call_options_[0] != 'v') return nullptr;
  if (!handler_) return nullptr;

  const std::string raw = handler_(last_call_args_);
  RespNode node;
  std::size_t pos = 0;
  if (!parse_reply(raw, pos, node) || pos != raw.size()) return nullptr;

  Reply* root = build_reply(node).release();
  replies_.insert(root);
  return handle<HostCallReply>(root);
}

void RespHost::free_call_reply(HostCallReply* reply) {
  auto* r = as<Reply>(reply);
  if (replies_.erase(r) == 0) {
    ++bad_releases_;
    return;
  }
  delete r;
}

ReplyTag RespHost::call_reply_type(HostCallReply* reply) {
  if (!reply) return ReplyTag::Unknown;
  return as<Reply>(reply)->tag;
}

std::size_t RespHost::call_reply_length(HostCallReply* reply) {
  const auto* r = as<Reply>(reply);
  if (r->tag == ReplyTag::Map) return r->children.size() / 2;
  if (r->tag == ReplyTag::String || r->tag == ReplyTag::Error) return r->str.size();
  return r->children.size();
}

long long RespHost::call_reply_integer(HostCallReply* reply) {
  const auto* r = as<Reply>(reply);
  return r->tag == ReplyTag::Integer ? r->integer : 0;
}

double RespHost::call_reply_double(HostCallReply* reply) {
  const auto* r = as<Reply>(reply);
  return r->tag == ReplyTag::Double ? r->dbl : 0.0;
}

bool RespHost::call_reply_bool(HostCallReply* reply) {
  const auto* r = as<Reply>(reply);
  return r->tag == ReplyTag::Bool && r->boolean;
}

const char* RespHost::call_reply_string_ptr(HostCallReply* reply, std::size_t* len) {
  const auto* r = as<Reply>(reply);
  if (r->tag != ReplyTag::String && r->tag != ReplyTag::Error) {
    if (len) *len = 0;
    return nullptr;
  }
  if (len) *len = r->str.size();
  return r->str.data();
}

const char* RespHost::call_reply_big_number(HostCallReply* reply, std::size_t* len) {
  const auto* r = as<Reply>(reply);
  if (r->tag != ReplyTag::BigNumber) {
    if (len) *len = 0;
    return nullptr;
  }
  if (len) *len = r->str.size();
  return r->str.data();
}

const char* RespHost::call_reply_verbatim(HostCallReply* reply, std::size_t* len, const char** format) {
  const auto* r = as<Reply>(reply);
  if (r->tag != ReplyTag::VerbatimString) {
    if (len) *len = 0;
    return nullptr;
  }
  if (len) *len = r->str.size();
  if (format) *format = r->format.c_str();
  return r->str.data();
}

RespHost::Reply* RespHost::reply_at(HostCallReply* reply, std::size_t idx) const {
  const auto* r = as<Reply>(reply);
  if (idx >= r->children.size()) return nullptr;
  return r->children[idx].get();
}

HostCallReply* RespHost::call_reply_array_element(HostCallReply* reply, std::size_t idx) {
  if (as<Reply>(reply)->tag != ReplyTag::Array) return nullptr;
  return handle<HostCallReply>(reply_at(reply, idx));
}

void RespHost::call_reply_map_element(HostCallReply* reply, std::size_t idx, HostCallReply** key,
                                      HostCallReply** val) {
  const bool is_map = as<Reply>(reply)->tag == ReplyTag::Map;
  if (key) *key = is_map ? handle<HostCallReply>(reply_at(reply, idx * 2)) : nullptr;
  if (val) *val = is_map ? handle<HostCallReply>(reply_at(reply, idx * 2 + 1)) : nullptr;
}

HostCallReply* RespHost::call_reply_set_element(HostCallReply* reply, std::size_t idx) {
  if (as<Reply>(reply)->tag != ReplyTag::Set) return nullptr;
  return handle<HostCallReply>(reply_at(reply, idx));
}

// ─── Strings ─────────────────────────────────────────────────────────────────

RespHost::String* RespHost::track_string(std::string data) {
  auto* s = new String{std::move(data), 1};
  strings_.insert(s);
  return s;
}

HostString* RespHost::create_string(HostContext*, const char* ptr, std::size_t len) {
  return handle<HostString>(track_string(std::string(ptr ? ptr : "", ptr ? len : 0)));
}

void RespHost::retain_string(HostContext*, HostString* str) {
  auto* s = as<String>(str);
  if (!strings_.count(s)) {
    ++bad_releases_;
    return;
  }
  ++s->refcount;
}

void RespHost::free_string(HostContext*, HostString* str) {
  auto* s = as<String>(str);
  if (!strings_.count(s)) {
    ++bad_releases_;
    return;
  }
  if (--s->refcount > 0) return;
  strings_.erase(s);
  delete s;
}

const char* RespHost::string_ptr_len(const HostString* str, std::size_t* len) {
  const auto* s = reinterpret_cast<const String*>(str);
  if (!s) {
    if (len) *len = 0;
    return "";
  }
  if (len) *len = s->data.size();
  return s->data.data();
}

// ─── Reply emission ──────────────────────────────────────────────────────────

int RespHost::reply_with_long_long(HostContext*, long long value) {
  emit(encode_integer(value));
  return kHostOk;
}

int RespHost::reply_with_double(HostContext*, double value) {
  emit(encode_double(value, protocol_));
  return kHostOk;
}

int RespHost::reply_with_simple_string(HostContext*, const char* msg) {
  if (!msg) return kHostErr;
  emit(encode_simple(msg));
  return kHostOk;
}

int RespHost::reply_with_error(HostContext*, const char* err) {
  if (!err) return kHostErr;
  emit(encode_error_raw(err));
  return kHostOk;
}

int RespHost::reply_with_string_buffer(HostContext*, const char* buf, std::size_t len) {
  emit(encode_bulk(std::string_view(buf ? buf : "", buf ? len : 0)));
  return kHostOk;
}

int RespHost::reply_with_string(HostContext*, HostString* str) {
  if (!str) return kHostErr;
  std::size_t len = 0;
  const char* p = string_ptr_len(str, &len);
  emit(encode_bulk(std::string_view(p, len)));
  return kHostOk;
}

int RespHost::reply_with_array(HostContext*, long len) {
  if (len < 0) return kHostErr;
  emit(encode_array_header(static_cast<std::size_t>(len)));
  return kHostOk;
}

int RespHost::reply_with_map(HostContext*, long len) {
  if (len < 0) return kHostErr;
  emit(encode_map_header(static_cast<std::size_t>(len), protocol_));
  return kHostOk;
}

int RespHost::reply_with_set(HostContext*, long len) {
  if (len < 0) return kHostErr;
  emit(encode_set_header(static_cast<std::size_t>(len), protocol_));
  return kHostOk;
}

int RespHost::reply_with_bool(HostContext*, bool value) {
  emit(encode_bool(value, protocol_));
  return kHostOk;
}

int RespHost::reply_with_big_number(HostContext*, const char* num, std::size_t len) {
  if (!num || len == 0) return kHostErr;
  emit(encode_big_number(std::string_view(num, len), protocol_));
  return kHostOk;
}

int RespHost::reply_with_verbatim_string_type(HostContext*, const char* buf, std::size_t len, const char* format) {
  if (!format || std::strlen(format) != 3) return kHostErr;
  emit(encode_verbatim(format, std::string_view(buf ? buf : "", buf ? len : 0), protocol_));
  return kHostOk;
}

int RespHost::reply_with_null(HostContext*) {
  emit(encode_null(protocol_));
  return kHostOk;
}

int RespHost::wrong_arity(HostContext*) {
  emit(encode_error("wrong number of arguments for '" + current_command_ + "' command"));
  return kHostOk;
}

// ─── Context state ───────────────────────────────────────────────────────────

std::uint32_t RespHost::get_context_flags(HostContext*) { return context_flags_; }

bool RespHost::is_keys_position_request(HostContext*) { return keys_position_request_; }

void RespHost::key_at_pos(HostContext*, int pos) { key_positions_.push_back(pos); }

void RespHost::auto_memory(HostContext*) {}

int RespHost::replicate_verbatim(HostContext*) {
  ++replicated_;
  return kHostOk;
}

void RespHost::set_module_options(HostContext*, std::uint32_t options) { module_options_ = options; }

const char* RespHost::current_command_name(HostContext*) {
  if (current_command_.empty()) return nullptr;
  return current_command_.c_str();
}

int RespHost::notify_keyspace_event(HostContext*, std::uint32_t, const char* event, HostString* key) {
  if (!event || !key) return kHostErr;
  std::size_t len = 0;
  const char* p = string_ptr_len(key, &len);
  keyspace_events_.push_back(std::string(event) + ":" + std::string(p, len));
  return kHostOk;
}

int RespHost::get_server_version() { return server_version_.value_or(0); }

void RespHost::log(HostContext*, const char* level, const char* message) {
  logs_.push_back(LogLine{level ? level : "", message ? message : ""});
}

int RespHost::export_shared_api(HostContext*, const char* name, void* func) {
  if (!name || !func) return kHostErr;
  // Names are global across modules; the first export wins.
  if (!shared_apis_.emplace(name, func).second) return kHostErr;
  return kHostOk;
}

void* RespHost::shared_api(const std::string& name) const {
  const auto it = shared_apis_.find(name);
  return it == shared_apis_.end() ? nullptr : it->second;
}

// ─── Keys ────────────────────────────────────────────────────────────────────

RespHost::Key* RespHost::live_key(HostKey* key) {
  auto* k = as<Key>(key);
  if (!keys_out_.count(k)) return nullptr;
  return k;
}

HostKey* RespHost::open_key(HostContext*, HostString* name, int mode) {
  std::size_t len = 0;
  const char* p = string_ptr_len(name, &len);
  auto* k = new Key{std::string(p, len), mode};
  keys_out_.insert(k);
  return handle<HostKey>(k);
}

void RespHost::close_key(HostKey* key) {
  auto* k = as<Key>(key);
  if (keys_out_.erase(k) == 0) {
    ++bad_releases_;
    return;
  }
  delete k;
}

KeyType RespHost::key_type(HostKey* key) {
  const auto* k = live_key(key);
  if (!k) return KeyType::Empty;
  return keys_.count(k->name) ? KeyType::String : KeyType::Empty;
}

const char* RespHost::string_get(HostKey* key, std::size_t* len) {
  const auto* k = live_key(key);
  if (!k) return nullptr;
  const auto it = keys_.find(k->name);
  if (it == keys_.end()) return nullptr;
  if (len) *len = it->second.value.size();
  return it->second.value.data();
}

int RespHost::string_set(HostKey* key, HostString* value) {
  const auto* k = live_key(key);
  if (!k || !(k->mode & kKeyWrite) || !value) return kHostErr;
  std::size_t len = 0;
  const char* p = string_ptr_len(value, &len);
  keys_[k->name] = KeyEntry{std::string(p, len), kNoExpire};
  return kHostOk;
}

int RespHost::delete_key(HostKey* key) {
  const auto* k = live_key(key);
  if (!k || !(k->mode & kKeyWrite)) return kHostErr;
  keys_.erase(k->name);
  return kHostOk;
}

long long RespHost::get_expire(HostKey* key) {
  const auto* k = live_key(key);
  if (!k) return kNoExpire;
  const auto it = keys_.find(k->name);
  return it == keys_.end() ? kNoExpire : it->second.ttl_ms;
}

int RespHost::set_expire(HostKey* key, long long ms) {
  const auto* k = live_key(key);
  if (!k || !(k->mode & kKeyWrite)) return kHostErr;
  const auto it = keys_.find(k->name);
  if (it == keys_.end()) return kHostErr;
  it->second.ttl_ms = ms < 0 ? kNoExpire : ms;
  return kHostOk;
}

// ─── Users and ACL ───────────────────────────────────────────────────────────

HostString* RespHost::get_current_user_name(HostContext*) { return handle<HostString>(track_string(current_user_)); }

int RespHost::authenticate_client_with_acl_user(HostContext*, const char* name, std::size_t len) {
  if (!name) return kHostErr;
  const std::string user(name, len);
  const auto it = users_.find(user);
  if (it == users_.end() || !it->second.enabled) return kHostErr;
  current_user_ = user;
  return kHostOk;
}

HostUser* RespHost::get_module_user_from_user_name(HostString* name) {
  std::size_t len = 0;
  const char* p = string_ptr_len(name, &len);
  const auto it = users_.find(std::string(p, len));
  if (it == users_.end() || !it->second.enabled) return nullptr;
  auto* u = new User{it->first, it->second};
  users_out_.insert(u);
  return handle<HostUser>(u);
}

int RespHost::acl_check_key_permissions(HostUser* user, HostString* key, std::uint32_t flags) {
  ++acl_checks_;
  auto* u = as<User>(user);
  if (!users_out_.count(u)) return kHostErr;
  std::size_t len = 0;
  const char* p = string_ptr_len(key, &len);
  const std::string_view key_name(p, len);
  if (key_name.substr(0, u->entry.key_prefix.size()) != u->entry.key_prefix) return kHostErr;
  return (u->entry.permissions & flags) == flags ? kHostOk : kHostErr;
}

void RespHost::free_module_user(HostUser* user) {
  auto* u = as<User>(user);
  if (users_out_.erase(u) == 0) {
    ++bad_releases_;
    return;
  }
  delete u;
}

// ─── INFO ────────────────────────────────────────────────────────────────────

int RespHost::info_add_section(HostInfoContext* ictx, const char* name) {
  if (ictx != info_context()) return kHostErr;
  info_text_ += "# " + module_name_;
  if (name) info_text_ += std::string("_") + name;
  info_text_ += "\r\n";
  return kHostOk;
}

int RespHost::info_add_field_cstring(HostInfoContext* ictx, const char* field, const char* value) {
  if (ictx != info_context() || !field) return kHostErr;
  info_text_ += module_name_ + "_" + field + ":" + (value ? value : "") + "\r\n";
  return kHostOk;
}

int RespHost::info_add_field_long_long(HostInfoContext* ictx, const char* field, long long value) {
  if (ictx != info_context() || !field) return kHostErr;
  info_text_ += module_name_ + "_" + field + ":" + std::to_string(value) + "\r\n";
  return kHostOk;
}

}  // namespace modkit
