#include "context.hpp"
#include "reply_decoder.hpp"
#include "resp_host.hpp"

#include <iostream>
#include <string>

namespace {

// Runs one call whose reply is `raw` and decodes it.
modkit::Result call_with(modkit::RespHost& host, const std::string& raw) {
  host.set_command_handler([raw](const std::vector<std::string>&) { return raw; });
  const modkit::Context ctx(&host, host.context());
  return ctx.call("test.cmd", {});
}

bool fail(const char* what) {
  std::cerr << what << "\n";
  return false;
}

bool scalars(modkit::RespHost& host) {
  auto r = call_with(host, ":42\r\n");
  if (!r || r.value() != modkit::Value::make_integer(42)) return fail("integer decode failed");

  r = call_with(host, "$5\r\nhello\r\n");
  if (!r || r.value() != modkit::Value::string_buffer("hello")) return fail("bulk string decode failed");

  r = call_with(host, "+OK\r\n");
  if (!r || r.value() != modkit::Value::string_buffer("OK")) return fail("simple string should decode to bytes");

  r = call_with(host, std::string("$3\r\na\0b\r\n", 9));
  if (!r || r.value().str != std::string("a\0b", 3)) return fail("binary bulk string lost bytes");

  r = call_with(host, ",3.5\r\n");
  if (!r || r.value() != modkit::Value::make_double(3.5)) return fail("double decode failed");

  r = call_with(host, "#t\r\n");
  if (!r || r.value() != modkit::Value::make_bool(true)) return fail("bool decode failed");

  r = call_with(host, "(3492890328409238509324850943850943825024385\r\n");
  if (!r || r.value() != modkit::Value::big_number("3492890328409238509324850943850943825024385")) {
    return fail("big number decode failed");
  }

  r = call_with(host, "=15\r\ntxt:Some string\r\n");
  if (!r || r.value() != modkit::Value::verbatim_string("txt", "Some string")) {
    return fail("verbatim decode failed");
  }

  r = call_with(host, "_\r\n");
  if (!r || r.value().kind != modkit::Value::Kind::Null) return fail("resp3 null decode failed");

  r = call_with(host, "$-1\r\n");
  if (!r || r.value().kind != modkit::Value::Kind::Null) return fail("nil bulk decode failed");
  return true;
}

bool aggregates(modkit::RespHost& host) {
  auto r = call_with(host, "*3\r\n:1\r\n$1\r\na\r\n*1\r\n_\r\n");
  const auto expected_array = modkit::Value::array({
      modkit::Value::make_integer(1),
      modkit::Value::string_buffer("a"),
      modkit::Value::array({modkit::Value::null()}),
  });
  if (!r || r.value() != expected_array) return fail("nested array decode failed");

  r = call_with(host, "%2\r\n$1\r\nb\r\n:2\r\n:7\r\n$3\r\nsev\r\n");
  std::map<std::string, modkit::Value> entries;
  entries["b"] = modkit::Value::make_integer(2);
  entries["7"] = modkit::Value::string_buffer("sev");
  if (!r || r.value() != modkit::Value::map(entries)) return fail("map decode failed");

  r = call_with(host, "~3\r\n$1\r\nx\r\n:5\r\n$1\r\nx\r\n");
  if (!r || r.value() != modkit::Value::set({"x", "5"})) return fail("set decode failed");

  r = call_with(host, "*0\r\n");
  if (!r || r.value() != modkit::Value::array({})) return fail("empty array decode failed");
  return true;
}

bool errors(modkit::RespHost& host) {
  auto r = call_with(host, "-ERR unknown command\r\n");
  if (r || r.error().kind != modkit::Error::Kind::String || r.error().message() != "ERR unknown command") {
    return fail("error reply should become an owned error message");
  }

  // An error nested in an aggregate fails the whole decode.
  r = call_with(host, "*2\r\n:1\r\n-WRONGTYPE nope\r\n");
  if (r || r.error().message() != "WRONGTYPE nope") return fail("nested error should propagate");

  r = call_with(host, "%1\r\n*1\r\n:1\r\n:2\r\n");
  if (r || r.error().message() != "type is not supported as map key") return fail("array map key must be rejected");

  r = call_with(host, "%1\r\n,1.5\r\n:1\r\n");
  if (r || r.error().message() != "type is not supported as map key") return fail("double map key must be rejected");

  r = call_with(host, "~1\r\n,2.5\r\n");
  if (r || r.error().message() != "type is not supported on set") return fail("double set member must be rejected");

  r = call_with(host, "~1\r\n*0\r\n");
  if (r || r.error().message() != "type is not supported on set") return fail("array set member must be rejected");

  r = call_with(host, ":12");
  if (r || r.error().message() != "Error on method call") return fail("truncated reply should fail the call");

  r = call_with(host, "?nonsense\r\n");
  if (r || r.error().message() != "Error on method call") return fail("unparsable reply should fail the call");
  return true;
}

}  // namespace

int main() {
  modkit::RespHost host;
  if (!scalars(host) || !aggregates(host) || !errors(host)) return 1;

  if (host.live_replies() != 0) {
    std::cerr << "every root reply must be released, " << host.live_replies() << " left\n";
    return 1;
  }
  if (host.live_strings() != 0 || host.bad_releases() != 0) {
    std::cerr << "string bookkeeping mismatch\n";
    return 1;
  }

  // Decoding a null handle directly.
  const auto r = modkit::decode_call_reply(host, nullptr);
  if (r || r.error().message() != "Error on method call") {
    std::cerr << "null reply handle should be an error\n";
    return 1;
  }

  std::cout << "reply_decoder_test passed\n";
  return 0;
}
