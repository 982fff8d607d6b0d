#include "context.hpp"
#include "info_context.hpp"
#include "resp_host.hpp"

#include <iostream>
#include <string>

namespace {

bool check_flags(modkit::RespHost& host, const modkit::Context& ctx) {
  if (!ctx.is_primary() || ctx.is_oom() || !ctx.allow_block()) {
    std::cerr << "default flags mismatch\n";
    return false;
  }
  host.set_context_flags(modkit::kCtxReplica | modkit::kCtxOom | modkit::kCtxDenyBlocking);
  if (ctx.is_primary() || !ctx.is_oom() || ctx.allow_block()) {
    std::cerr << "replica/oom/deny-blocking flags mismatch\n";
    return false;
  }
  if (!ctx.flags().has(modkit::kCtxReplica)) {
    std::cerr << "raw flag lookup failed\n";
    return false;
  }
  host.set_context_flags(modkit::kCtxMaster);
  return true;
}

bool check_keys(modkit::RespHost& host, const modkit::Context& ctx) {
  host.set_key("greeting", "hello");
  {
    const auto name = ctx.create_string("greeting");
    const modkit::Key key = ctx.open_key(name);
    const auto value = key.read();
    if (!value || *value != "hello" || key.is_empty() || key.expire() != modkit::kNoExpire) {
      std::cerr << "read-only key access failed\n";
      return false;
    }
  }
  {
    const auto name = ctx.create_string("counter");
    modkit::WritableKey key = ctx.open_key_writable(name);
    if (!key.is_empty()) {
      std::cerr << "new key should be empty\n";
      return false;
    }
    if (key.set_expire(1000) != modkit::Status::Err) {
      std::cerr << "expire on a missing key must fail\n";
      return false;
    }
    if (key.write("1") != modkit::Status::Ok || key.set_expire(1000) != modkit::Status::Ok) {
      std::cerr << "write or expire failed\n";
      return false;
    }
    if (key.expire() != 1000 || host.get_key("counter") != std::optional<std::string>("1")) {
      std::cerr << "written key mismatch\n";
      return false;
    }
    if (key.remove() != modkit::Status::Ok || host.get_key("counter")) {
      std::cerr << "remove failed\n";
      return false;
    }
  }
  if (host.open_keys() != 0 || host.live_strings() != 0 || host.bad_releases() != 0) {
    std::cerr << "key handles leaked\n";
    return false;
  }
  return true;
}

bool check_logging(modkit::RespHost& host, const modkit::Context& ctx) {
  // The process threshold does not hold lines back from the host.
  modkit::set_log_level(modkit::LogLevel::Notice);
  ctx.log_notice("loaded");
  ctx.log_debug("detail");
  ctx.log_verbose("more");
  ctx.log_warning("careful");
  const auto& logs = host.logs();
  if (logs.size() != 4 || logs[0].level != "notice" || logs[0].message != "loaded" || logs[1].level != "debug" ||
      logs[1].message != "detail" || logs[2].level != "verbose" || logs[3].level != "warning") {
    std::cerr << "every log line should reach the host with its level\n";
    return false;
  }
  return true;
}

bool check_info(modkit::RespHost& host) {
  const modkit::InfoContext info(&host, host.info_context());
  if (info.add_info_section(std::nullopt) != modkit::Status::Ok ||
      info.add_info_field_str("mode", "test") != modkit::Status::Ok ||
      info.add_info_section(std::string("stats")) != modkit::Status::Ok ||
      info.add_info_field_long_long("calls", 12) != modkit::Status::Ok) {
    std::cerr << "info callbacks failed\n";
    return false;
  }
  if (host.info_text() != "# modkit\r\nmodkit_mode:test\r\n# modkit_stats\r\nmodkit_calls:12\r\n") {
    std::cerr << "info text mismatch: " << host.info_text() << "\n";
    return false;
  }
  host.disable(modkit::Capability::InfoFields);
  if (info.add_info_field_long_long("calls", 1) != modkit::Status::Err) {
    std::cerr << "info without the primitive must fail\n";
    return false;
  }
  host.enable(modkit::Capability::InfoFields);
  return true;
}

bool check_command_state(modkit::RespHost& host, const modkit::Context& ctx) {
  modkit::Error err;
  if (ctx.current_command_name(err) || err.message() != "no command is being executed") {
    std::cerr << "no current command expected\n";
    return false;
  }
  host.set_current_command("modkit.get");
  const auto name = ctx.current_command_name(err);
  if (!name || *name != "modkit.get") {
    std::cerr << "current command name mismatch\n";
    return false;
  }

  host.set_keys_position_request(true);
  if (!ctx.is_keys_position_request()) {
    std::cerr << "keys-position request not seen\n";
    return false;
  }
  ctx.key_at_pos(1);
  ctx.key_at_pos(3);
  if (host.key_positions() != std::vector<int>{1, 3}) {
    std::cerr << "key positions mismatch\n";
    return false;
  }
  host.disable(modkit::Capability::KeysPositionRequest);
  if (ctx.is_keys_position_request()) {
    std::cerr << "keys-position request must read false without the primitive\n";
    return false;
  }
  host.enable(modkit::Capability::KeysPositionRequest);
  host.set_keys_position_request(false);

  {
    const auto key = ctx.create_string("greeting");
    if (ctx.notify_keyspace_event(modkit::kNotifyGeneric, "touched", key) != modkit::Status::Ok) {
      std::cerr << "keyspace notification failed\n";
      return false;
    }
  }
  if (host.keyspace_events() != std::vector<std::string>{"touched:greeting"}) {
    std::cerr << "keyspace event mismatch\n";
    return false;
  }

  ctx.set_module_options(modkit::ModuleOptions().set(modkit::kOptHandleIoErrors));
  if (host.module_options() != modkit::kOptHandleIoErrors) {
    std::cerr << "module options mismatch\n";
    return false;
  }

  if (ctx.replicate_verbatim() != modkit::Status::Ok || host.replicated() != 1) {
    std::cerr << "replicate verbatim failed\n";
    return false;
  }
  ctx.auto_memory();
  return true;
}

int g_exported_table = 7;

bool check_shared_api(modkit::RespHost& host, const modkit::Context& ctx) {
  if (ctx.export_shared_api(&g_exported_table, "modkit.table") != modkit::Status::Ok ||
      host.shared_api("modkit.table") != &g_exported_table) {
    std::cerr << "shared API export failed\n";
    return false;
  }
  int other = 0;
  if (ctx.export_shared_api(&other, "modkit.table") != modkit::Status::Err ||
      host.shared_api("modkit.table") != &g_exported_table) {
    std::cerr << "a taken shared API name must be refused\n";
    return false;
  }
  host.disable(modkit::Capability::SharedApi);
  if (ctx.export_shared_api(&other, "modkit.other") != modkit::Status::Err || host.shared_api("modkit.other")) {
    std::cerr << "export without the primitive must fail\n";
    return false;
  }
  host.enable(modkit::Capability::SharedApi);
  if (modkit::Context::dummy().export_shared_api(&other, "modkit.other") != modkit::Status::Err) {
    std::cerr << "dummy context cannot export\n";
    return false;
  }
  return true;
}

bool check_dummy() {
  const auto ctx = modkit::Context::dummy();
  modkit::Error err;
  if (ctx.get_server_version(err) || err.message() != "no host attached to context") {
    std::cerr << "dummy version lookup should fail\n";
    return false;
  }
  if (ctx.get_current_user(err) || ctx.reply(modkit::Value::make_integer(1)) != modkit::Status::Err) {
    std::cerr << "dummy context must refuse host operations\n";
    return false;
  }
  if (ctx.replicate_verbatim() != modkit::Status::Err || ctx.is_keys_position_request() || ctx.is_primary()) {
    std::cerr << "dummy context state mismatch\n";
    return false;
  }
  const auto s = ctx.create_string("x");
  if (!s.is_null()) {
    std::cerr << "dummy context cannot create strings\n";
    return false;
  }
  ctx.log_debug("dummy logs go to the process logger");
  return true;
}

}  // namespace

int main() {
  modkit::RespHost host;
  const modkit::Context ctx(&host, host.context());

  if (!check_flags(host, ctx) || !check_keys(host, ctx) || !check_logging(host, ctx) || !check_info(host) ||
      !check_command_state(host, ctx) || !check_shared_api(host, ctx) || !check_dummy()) {
    return 1;
  }
  if (host.live_strings() != 0 || host.bad_releases() != 0) {
    std::cerr << "context operations leaked strings\n";
    return 1;
  }

  std::cout << "context_test passed\n";
  return 0;
}
