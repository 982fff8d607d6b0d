#include "context.hpp"
#include "resp_host.hpp"

#include <iostream>
#include <string>

namespace {

std::string emit(modkit::RespHost& host, const modkit::Result& result, modkit::Status* status = nullptr) {
  host.clear_output();
  const modkit::Context ctx(&host, host.context());
  const modkit::Status s = ctx.reply(result);
  if (status) *status = s;
  return host.output();
}

bool expect_output(modkit::RespHost& host, const modkit::Result& result, const std::string& expected,
                   const char* what) {
  const std::string got = emit(host, result);
  if (got != expected) {
    std::cerr << what << ": got [" << got << "]\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  using modkit::Value;
  modkit::RespHost host(modkit::RespVersion::Resp3);
  host.set_current_command("modkit.test");

  if (!expect_output(host, Value::simple_string(std::string("a\r\nb\0c", 6)), "+a  b c\r\n",
                     "simple string must be sanitized")) {
    return 1;
  }
  if (!expect_output(host, Value::bulk_string(std::string("a\r\nb", 4)), "$4\r\na\r\nb\r\n",
                     "bulk string must be emitted raw")) {
    return 1;
  }
  if (!expect_output(host, Value::simple_string_static("PONG"), "+PONG\r\n", "static simple string")) return 1;
  if (!expect_output(host, Value::make_integer(-7), ":-7\r\n", "integer")) return 1;
  if (!expect_output(host, Value::make_float(1.5), ",1.5\r\n", "float goes out as double")) return 1;
  if (!expect_output(host, Value::null(), "_\r\n", "resp3 null")) return 1;
  if (!expect_output(host, Value::make_bool(false), "#f\r\n", "bool")) return 1;
  if (!expect_output(host, Value::big_number("123456789012345678901234567890"),
                     "(123456789012345678901234567890\r\n", "big number")) {
    return 1;
  }
  if (!expect_output(host, Value::verbatim_string("mkd", "# hi"), "=8\r\nmkd:# hi\r\n", "verbatim")) return 1;

  if (!expect_output(host, Value::array({Value::make_integer(1), Value::array({Value::bulk_string("x")})}),
                     "*2\r\n:1\r\n*1\r\n$1\r\nx\r\n", "nested array")) {
    return 1;
  }

  std::map<std::string, Value> entries;
  entries["k\r\n"] = Value::make_integer(1);
  if (!expect_output(host, Value::map(entries), "%1\r\n$3\r\nk  \r\n:1\r\n", "map keys are sanitized")) return 1;
  if (!expect_output(host, Value::set({"b", "a"}), "~2\r\n$1\r\na\r\n$1\r\nb\r\n", "set")) return 1;

  modkit::Status status = modkit::Status::Err;
  if (emit(host, Value::no_reply(), &status) != "" || status != modkit::Status::Ok) {
    std::cerr << "no-reply must emit nothing and succeed\n";
    return 1;
  }

  // Errors.
  if (!expect_output(host, modkit::Error::wrong_type(),
                     "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n", "wrong type")) {
    return 1;
  }
  if (!expect_output(host, modkit::Error::string("ERR bad\r\nthing"), "-ERR bad  thing\r\n",
                     "error text must be sanitized")) {
    return 1;
  }
  if (!expect_output(host, modkit::Error::wrong_arity(),
                     "-ERR wrong number of arguments for 'modkit.test' command\r\n", "wrong arity")) {
    return 1;
  }

  host.set_keys_position_request(true);
  status = modkit::Status::Ok;
  if (emit(host, modkit::Error::wrong_arity(), &status) != "" || status != modkit::Status::Err) {
    std::cerr << "wrong arity during a keys-position request must be silent and fail\n";
    return 1;
  }
  host.set_keys_position_request(false);

  // RESP2 clients see the degraded shapes.
  host.set_protocol(modkit::RespVersion::Resp2);
  if (!expect_output(host, Value::null(), "$-1\r\n", "resp2 null")) return 1;
  if (!expect_output(host, Value::make_bool(true), ":1\r\n", "resp2 bool")) return 1;
  if (!expect_output(host, Value::make_double(2.25), "$4\r\n2.25\r\n", "resp2 double")) return 1;
  if (!expect_output(host, Value::map(entries), "*2\r\n$3\r\nk  \r\n:1\r\n", "resp2 map")) return 1;
  host.set_protocol(modkit::RespVersion::Resp3);

  // Without the RESP3 primitives the slot still gets an error reply.
  host.disable(modkit::Capability::Resp3Replies);
  const std::string out = emit(host, Value::make_bool(true), &status);
  if (status != modkit::Status::Err || out.empty() || out[0] != '-') {
    std::cerr << "missing resp3 primitive should emit an error reply\n";
    return 1;
  }
  if (host.logs().empty() || host.logs().back().level != "warning") {
    std::cerr << "missing resp3 primitive should log a warning\n";
    return 1;
  }
  host.enable(modkit::Capability::Resp3Replies);

  if (emit(host, Value::verbatim_string("toolong", "x"), &status).empty() || status != modkit::Status::Err) {
    std::cerr << "bad verbatim format should fail with an error reply\n";
    return 1;
  }

  // Handle-backed bulk strings.
  const modkit::Context ctx(&host, host.context());
  {
    const Value v = Value::bulk_string_handle(ctx.create_string("held"));
    if (!expect_output(host, v, "$4\r\nheld\r\n", "handle bulk string")) return 1;
  }
  if (host.live_strings() != 0 || host.bad_releases() != 0) {
    std::cerr << "handle bulk string leaked\n";
    return 1;
  }

  std::cout << "reply_encoder_test passed\n";
  return 0;
}
