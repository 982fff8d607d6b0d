#pragma once

#include "call_options.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace modkit {

struct ModuleConfig {
  std::string log_level = "notice";
  std::string version_source = "auto";  // auto | info
  bool call_verify_acl = false;
  bool call_verify_oom = false;
  bool call_errors_as_replies = false;
  bool call_resp3 = false;
  bool call_no_writes = false;
  bool call_replicate = false;
  bool call_script_mode = false;
  std::unordered_map<std::string, std::string> raw;
};

ModuleConfig load_config(const std::string& path);

// Module load arguments as `key value` pairs. `config <path>` loads a file
// first; pairs given on the command line win over the file.
ModuleConfig parse_module_args(const std::vector<std::string>& args);

CallOptions call_options_from_config(const ModuleConfig& cfg);
void apply_config(const ModuleConfig& cfg);

} // namespace modkit
