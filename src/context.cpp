#include "context.hpp"

#include "reply_decoder.hpp"

#include <utility>

namespace modkit {

// The host applies its own verbosity; only the process logger filters here.
void Context::log(LogLevel level, const std::string& message) const {
  if (!api_) {
    modkit::log(level, message);
    return;
  }
  api_->log(ctx_, log_level_name(level), message.c_str());
}

bool Context::require(Capability cap, Error& err) const {
  if (!api_) {
    err = Error::str("no host attached to context");
    return false;
  }
  if (!api_->supports(cap)) {
    err = Error::str(capability_api_name(cap));
    return false;
  }
  return true;
}

void Context::auto_memory() const {
  if (api_) api_->auto_memory(ctx_);
}

bool Context::is_keys_position_request() const {
  if (!api_ || !api_->supports(Capability::KeysPositionRequest)) return false;
  return api_->is_keys_position_request(ctx_);
}

void Context::key_at_pos(int pos) const {
  if (!api_ || !api_->supports(Capability::KeysPositionRequest)) return;
  api_->key_at_pos(ctx_, pos);
}

Result Context::call_internal(const std::string& command, const char* options,
                              const std::vector<std::string_view>& args) const {
  if (!api_) return Error::str("no host attached to context");

  std::vector<ModuleString> owned;
  owned.reserve(args.size());
  for (const auto& a : args) owned.emplace_back(api_, ctx_, a);

  std::vector<HostString*> argv;
  argv.reserve(owned.size());
  for (const auto& s : owned) argv.push_back(s.raw());

  CallReply reply(api_, api_->call(ctx_, command.c_str(), options, argv.data(), argv.size()));
  return decode_call_reply(*api_, reply.get());
}

Result Context::call(const std::string& command, const std::vector<std::string>& args) const {
  std::vector<std::string_view> views(args.begin(), args.end());
  return call_internal(command, default_call_options().c_str(), views);
}

Result Context::call_ext(const std::string& command, const CallOptions& options,
                         const std::vector<std::string_view>& args) const {
  return call_internal(command, options.c_str(), args);
}

Key Context::open_key(const ModuleString& name) const { return Key(api_, ctx_, name); }

WritableKey Context::open_key_writable(const ModuleString& name) const { return WritableKey(api_, ctx_, name); }

ModuleString Context::create_string(const std::string& s) const { return ModuleString(api_, ctx_, s); }

ModuleString Context::create_string_from_slice(std::string_view bytes) const {
  return ModuleString(api_, ctx_, bytes);
}

Status Context::replicate_verbatim() const {
  if (!api_) return Status::Err;
  return to_status(api_->replicate_verbatim(ctx_));
}

Status Context::notify_keyspace_event(NotifyEvent type, const std::string& event, const ModuleString& key) const {
  Error err;
  if (!require(Capability::KeyspaceNotifications, err)) {
    log_warning(err.message());
    return Status::Err;
  }
  return to_status(api_->notify_keyspace_event(ctx_, type, event.c_str(), key.raw()));
}

Status Context::export_shared_api(void* func, const std::string& name) const {
  Error err;
  if (!require(Capability::SharedApi, err)) {
    log_warning(err.message());
    return Status::Err;
  }
  return to_status(api_->export_shared_api(ctx_, name.c_str(), func));
}

std::optional<std::string> Context::current_command_name(Error& err) const {
  if (!require(Capability::CurrentCommandName, err)) return std::nullopt;
  const char* name = api_->current_command_name(ctx_);
  if (!name) {
    err = Error::str("no command is being executed");
    return std::nullopt;
  }
  return std::string(name);
}

void Context::set_module_options(ModuleOptions options) const {
  Error err;
  if (!require(Capability::ModuleOptions, err)) {
    log_warning(err.message());
    return;
  }
  api_->set_module_options(ctx_, options.bits());
}

ContextFlags Context::flags() const {
  if (!api_) return ContextFlags();
  return ContextFlags(api_->get_context_flags(ctx_));
}

bool Context::is_primary() const { return flags().has(kCtxMaster); }

bool Context::is_oom() const { return flags().has(kCtxOom); }

bool Context::allow_block() const { return !flags().has(kCtxDenyBlocking); }

std::optional<Version> Context::get_server_version(Error& err, bool force_info) const {
  if (!api_) {
    err = Error::str("no host attached to context");
    return std::nullopt;
  }
  if (!force_info && api_->supports(Capability::ServerVersion)) {
    return version_from_packed(api_->get_server_version());
  }

  const Result info = call("info", {"server"});
  if (!info) {
    err = Error::str("Error calling \"info server\"");
    return std::nullopt;
  }
  return version_from_info(info.value(), err);
}

std::optional<std::string> Context::get_current_user(Error& err) const {
  if (!require(Capability::CurrentUserName, err)) return std::nullopt;
  const ModuleString user = ModuleString::adopt(api_, ctx_, api_->get_current_user_name(ctx_));
  if (user.is_null()) {
    err = Error::str("Error getting current user name");
    return std::nullopt;
  }
  return user.str();
}

Status Context::authenticate_user(const std::string& user_name) const {
  Error err;
  if (!require(Capability::AuthenticateUser, err)) {
    log_warning(err.message());
    return Status::Err;
  }
  return to_status(api_->authenticate_client_with_acl_user(ctx_, user_name.data(), user_name.size()));
}

bool Context::acl_check_key_permission(const std::string& user_name, const ModuleString& key_name,
                                       const AclPermissions& permissions, Error& err) const {
  if (!require(Capability::AclUsers, err)) return false;

  const ModuleString name = create_string(user_name);
  const ModuleUser user(api_, api_->get_module_user_from_user_name(name.raw()));
  if (user.is_null()) {
    err = Error::str("User does not exists or disabled");
    return false;
  }
  if (api_->acl_check_key_permissions(user.get(), key_name.raw(), permissions.bits()) != kHostOk) {
    err = Error::str("User does not have permissions on key");
    return false;
  }
  return true;
}

}  // namespace modkit
