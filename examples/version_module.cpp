// Example module: MODKIT.VERSION and MODKIT.CALL.
//
//   loadmodule /path/libmodkit_version.so loglevel verbose call-verify-acl yes

#include "config.hpp"
#include "context.hpp"
#include "info_context.hpp"
#include "redis_module_host.hpp"

#include <redismodule.h>

#include <string>
#include <string_view>
#include <vector>

namespace {

modkit::ModuleConfig g_config;

int done(modkit::Status status) { return status == modkit::Status::Ok ? REDISMODULE_OK : REDISMODULE_ERR; }

int version_command(RedisModuleCtx* raw, RedisModuleString**, int argc) {
  const modkit::Context ctx = modkit::module_context(raw);
  if (argc != 1) return done(ctx.reply(modkit::Error::wrong_arity()));

  modkit::Error err;
  const auto version = ctx.get_server_version(err, g_config.version_source == "info");
  if (!version) return done(ctx.reply(err));
  return done(ctx.reply(modkit::Value::array({
      modkit::Value::make_integer(version->major),
      modkit::Value::make_integer(version->minor),
      modkit::Value::make_integer(version->patch),
  })));
}

// MODKIT.CALL <command> [arg ...] runs the command with the configured call
// options and relays whatever came back.
int call_command(RedisModuleCtx* raw, RedisModuleString** argv, int argc) {
  const modkit::Context ctx = modkit::module_context(raw);
  if (argc < 2) return done(ctx.reply(modkit::Error::wrong_arity()));

  std::size_t len = 0;
  const char* name = RedisModule_StringPtrLen(argv[1], &len);
  std::vector<std::string_view> args;
  for (int i = 2; i < argc; ++i) {
    std::size_t arg_len = 0;
    const char* arg = RedisModule_StringPtrLen(argv[i], &arg_len);
    args.emplace_back(arg, arg_len);
  }

  const modkit::CallOptions options = modkit::call_options_from_config(g_config);
  const modkit::Result result = ctx.call_ext(std::string(name, len), options, args);
  if (!result) ctx.log_verbose("call failed: " + result.error().message());
  return done(ctx.reply(result));
}

void info_callback(RedisModuleInfoCtx* raw, int) {
  const modkit::InfoContext info = modkit::module_info_context(raw);
  if (info.add_info_section(std::nullopt) != modkit::Status::Ok) return;
  if (info.add_info_field_str("loglevel", g_config.log_level) != modkit::Status::Ok) return;
  if (info.add_info_field_str("version_source", g_config.version_source) != modkit::Status::Ok) {
    modkit::log(modkit::LogLevel::Verbose, "info field version_source dropped");
  }
}

}  // namespace

extern "C" int RedisModule_OnLoad(RedisModuleCtx* raw, RedisModuleString** argv, int argc) {
  if (RedisModule_Init(raw, "modkit", 1, REDISMODULE_APIVER_1) == REDISMODULE_ERR) return REDISMODULE_ERR;

  std::vector<std::string> args;
  for (int i = 0; i < argc; ++i) {
    std::size_t len = 0;
    const char* p = RedisModule_StringPtrLen(argv[i], &len);
    args.emplace_back(p, len);
  }
  g_config = modkit::parse_module_args(args);
  modkit::apply_config(g_config);

  const modkit::Context ctx = modkit::module_context(raw);
  if (RedisModule_CreateCommand(raw, "modkit.version", version_command, "readonly fast", 0, 0, 0) ==
      REDISMODULE_ERR) {
    ctx.log_warning("cannot register modkit.version");
    return REDISMODULE_ERR;
  }
  if (RedisModule_CreateCommand(raw, "modkit.call", call_command, "", 0, 0, 0) == REDISMODULE_ERR) {
    ctx.log_warning("cannot register modkit.call");
    return REDISMODULE_ERR;
  }
  if (RedisModule_RegisterInfoFunc) {
    if (RedisModule_RegisterInfoFunc(raw, info_callback) == REDISMODULE_ERR) {
      ctx.log_warning("cannot register info callback");
    }
  }
  ctx.log_notice("modkit loaded");
  return REDISMODULE_OK;
}
