#include "context.hpp"
#include "resp_host.hpp"

#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  const std::string input(reinterpret_cast<const char*>(data), size);
  modkit::RespHost host;
  host.set_command_handler([&input](const std::vector<std::string>&) { return input; });
  const modkit::Context ctx(&host, host.context());
  const modkit::Result result = ctx.call("fuzz", {});
  if (result) (void)ctx.reply(result);
  return 0;
}
