#include "context.hpp"
#include "resp_host.hpp"

#include <iostream>
#include <sstream>
#include <string>

int main() {
  std::ostringstream ss;
  ss << std::cin.rdbuf();
  const std::string input = ss.str();

  modkit::RespHost host;
  host.set_command_handler([&input](const std::vector<std::string>&) { return input; });
  const modkit::Context ctx(&host, host.context());
  const modkit::Result result = ctx.call("stress", {});
  if (result) (void)ctx.reply(result);
  if (host.live_replies() != 0 || host.bad_releases() != 0) {
    std::cerr << "reply bookkeeping mismatch\n";
    return 1;
  }
  return 0;
}
