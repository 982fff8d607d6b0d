#include "context.hpp"
#include "resp_host.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  using namespace std::string_literals;

  modkit::RespHost host;
  const modkit::Context ctx(&host, host.context());

  std::vector<std::string> seen;
  host.set_command_handler([&seen](const std::vector<std::string>& args) {
    seen = args;
    return std::string("+OK\r\n");
  });

  const auto r = ctx.call("set", {"key", "val"});
  if (!r || r.value() != modkit::Value::string_buffer("OK")) {
    std::cerr << "plain call failed\n";
    return 1;
  }
  if (seen != std::vector<std::string>{"set", "key", "val"}) {
    std::cerr << "command and arguments must reach the host in order\n";
    return 1;
  }
  if (host.last_call_options() != "v") {
    std::cerr << "plain call should use the default options\n";
    return 1;
  }
  if (host.live_strings() != 0 || host.live_replies() != 0) {
    std::cerr << "argument strings and replies must be released after the call\n";
    return 1;
  }

  // Binary arguments keep their length.
  const std::string binary("a\0b", 3);
  const auto options = modkit::CallOptionsBuilder().verify_acl().errors_as_replies().build();
  const auto r2 = ctx.call_ext("get", options, {binary, "x"});
  if (!r2 || seen.size() != 3 || seen[1] != binary) {
    std::cerr << "binary argument lost bytes\n";
    return 1;
  }
  if (host.last_call_options() != "vCE") {
    std::cerr << "call_ext should pass its options, got " << host.last_call_options() << "\n";
    return 1;
  }

  host.set_command_handler([](const std::vector<std::string>&) { return "-NOPERM no\r\n"s; });
  const auto r3 = ctx.call("get", {"k"});
  if (r3 || r3.error().message() != "NOPERM no") {
    std::cerr << "error reply should surface as an error\n";
    return 1;
  }

  // A host that refuses the call yields no reply at all.
  host.set_command_handler(nullptr);
  const auto r4 = ctx.call("ping", {});
  if (r4 || r4.error().message() != "Error on method call") {
    std::cerr << "refused call should be an error\n";
    return 1;
  }

  const auto r5 = modkit::Context::dummy().call("ping", {});
  if (r5 || r5.error().message() != "no host attached to context") {
    std::cerr << "dummy context call should fail\n";
    return 1;
  }

  if (host.calls() != 4 || host.live_strings() != 0 || host.live_replies() != 0 || host.bad_releases() != 0) {
    std::cerr << "bookkeeping mismatch after calls\n";
    return 1;
  }

  std::cout << "invoke_test passed\n";
  return 0;
}
