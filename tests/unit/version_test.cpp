#include "context.hpp"
#include "resp_host.hpp"
#include "version.hpp"

#include <iostream>
#include <string>

int main() {
  modkit::Error err;

  const auto parsed = modkit::version_from_info(
      modkit::Value::string_buffer("# Server\r\nredis_version:7.2.3\r\nredis_git_sha1:00000000\r\n"), err);
  if (!parsed || !(*parsed == modkit::Version{7, 2, 3})) {
    std::cerr << "INFO text parse failed\n";
    return 1;
  }

  if (modkit::version_from_info(modkit::Value::string_buffer("# Server\r\nredis_mode:standalone\r\n"), err) ||
      err.message() != "Error getting redis_version") {
    std::cerr << "INFO text without a version must fail\n";
    return 1;
  }
  if (modkit::version_from_info(modkit::Value::make_integer(7), err)) {
    std::cerr << "non-text INFO reply must fail\n";
    return 1;
  }
  if (modkit::version_from_info(modkit::Value::string_buffer("redis_version:99999999999.0.0"), err)) {
    std::cerr << "out of range component must fail\n";
    return 1;
  }

  const auto packed = modkit::version_from_packed(0x00060209);
  if (!(packed == modkit::Version{6, 2, 9}) || packed.to_string() != "6.2.9") {
    std::cerr << "packed version decode failed\n";
    return 1;
  }
  if (!(modkit::Version{6, 2, 9} < modkit::Version{7, 0, 0})) {
    std::cerr << "version ordering failed\n";
    return 1;
  }

  modkit::RespHost host;
  const modkit::Context ctx(&host, host.context());
  host.set_command_handler([](const std::vector<std::string>& args) {
    if (args.size() == 2 && args[0] == "info" && args[1] == "server") {
      const std::string body = "# Server\r\nredis_version:6.0.16\r\n";
      return "$" + std::to_string(body.size()) + "\r\n" + body + "\r\n";
    }
    return std::string("-ERR unexpected\r\n");
  });

  auto v = ctx.get_server_version(err);
  if (!v || !(*v == modkit::Version{7, 2, 3})) {
    std::cerr << "packed host version should be used when available\n";
    return 1;
  }
  if (host.calls() != 0) {
    std::cerr << "packed path must not call INFO\n";
    return 1;
  }

  v = ctx.get_server_version(err, true);
  if (!v || !(*v == modkit::Version{6, 0, 16})) {
    std::cerr << "forced INFO path failed\n";
    return 1;
  }

  host.set_server_version(std::nullopt);
  v = ctx.get_server_version(err);
  if (!v || !(*v == modkit::Version{6, 0, 16}) || host.calls() != 2) {
    std::cerr << "missing version primitive should fall back to INFO\n";
    return 1;
  }

  host.set_command_handler([](const std::vector<std::string>&) { return std::string("-ERR no info\r\n"); });
  v = ctx.get_server_version(err);
  if (v || err.message() != "Error calling \"info server\"") {
    std::cerr << "failed INFO call must be reported\n";
    return 1;
  }

  if (host.live_strings() != 0 || host.live_replies() != 0) {
    std::cerr << "version lookups leaked host objects\n";
    return 1;
  }

  std::cout << "version_test passed\n";
  return 0;
}
