#include "config.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace modkit {
namespace {

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end()) return "";
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return std::string(first, last);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool parse_bool(const std::string& value) {
  const auto v = lower(value);
  return v == "yes" || v == "1" || v == "true";
}

void apply_directive(ModuleConfig& cfg, const std::string& raw_key, const std::string& value) {
  const std::string key = lower(raw_key);
  cfg.raw[key] = value;

  if (key == "loglevel") {
    cfg.log_level = lower(value);
  } else if (key == "version-source") {
    cfg.version_source = lower(value) == "info" ? "info" : "auto";
  } else if (key == "call-verify-acl") {
    cfg.call_verify_acl = parse_bool(value);
  } else if (key == "call-verify-oom") {
    cfg.call_verify_oom = parse_bool(value);
  } else if (key == "call-errors-as-replies") {
    cfg.call_errors_as_replies = parse_bool(value);
  } else if (key == "call-resp3") {
    cfg.call_resp3 = parse_bool(value);
  } else if (key == "call-no-writes") {
    cfg.call_no_writes = parse_bool(value);
  } else if (key == "call-replicate") {
    cfg.call_replicate = parse_bool(value);
  } else if (key == "call-script-mode") {
    cfg.call_script_mode = parse_bool(value);
  }
}

void load_into(ModuleConfig& cfg, const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    log(LogLevel::Warning, "cannot open config file " + path);
    return;
  }

  std::string line;
  while (std::getline(in, line)) {
    const auto no_comment = line.substr(0, line.find('#'));
    const auto cleaned = trim(no_comment);
    if (cleaned.empty()) continue;

    std::istringstream iss(cleaned);
    std::string key;
    if (!(iss >> key)) continue;

    std::string value;
    std::getline(iss, value);
    value = trim(value);
    if (value.empty()) continue;

    apply_directive(cfg, key, value);
  }
}

}  // namespace

ModuleConfig load_config(const std::string& path) {
  ModuleConfig cfg;
  if (path.empty()) return cfg;
  load_into(cfg, path);
  return cfg;
}

ModuleConfig parse_module_args(const std::vector<std::string>& args) {
  ModuleConfig cfg;
  for (std::size_t i = 0; i + 1 < args.size(); i += 2) {
    if (lower(args[i]) == "config") load_into(cfg, args[i + 1]);
  }
  for (std::size_t i = 0; i + 1 < args.size(); i += 2) {
    if (lower(args[i]) == "config") continue;
    apply_directive(cfg, args[i], args[i + 1]);
  }
  if (args.size() % 2 != 0) {
    log(LogLevel::Warning, "ignoring module argument without a value: " + args.back());
  }
  return cfg;
}

CallOptions call_options_from_config(const ModuleConfig& cfg) {
  CallOptionsBuilder builder;
  if (cfg.call_no_writes) builder.no_writes();
  if (cfg.call_script_mode) builder.script_mode();
  if (cfg.call_verify_acl) builder.verify_acl();
  if (cfg.call_verify_oom) builder.verify_oom();
  if (cfg.call_errors_as_replies) builder.errors_as_replies();
  if (cfg.call_replicate) builder.replicate();
  if (cfg.call_resp3) builder.resp_3();
  return builder.build();
}

void apply_config(const ModuleConfig& cfg) { set_log_level(parse_log_level(cfg.log_level)); }

}  // namespace modkit
