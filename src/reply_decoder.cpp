#include "reply_decoder.hpp"

#include <string>
#include <utility>

namespace modkit {
namespace {

std::string reply_bytes(const char* p, std::size_t len) {
  if (!p) return std::string();
  return std::string(p, len);
}

Result decode_array(HostApi& api, HostCallReply* reply) {
  const std::size_t length = api.call_reply_length(reply);
  std::vector<Value> items;
  items.reserve(length);
  for (std::size_t i = 0; i < length; ++i) {
    Result elem = decode_call_reply(api, api.call_reply_array_element(reply, i));
    if (!elem) return elem;
    items.push_back(std::move(elem.value()));
  }
  return Value::array(std::move(items));
}

Result decode_map(HostApi& api, HostCallReply* reply) {
  const std::size_t length = api.call_reply_length(reply);
  std::map<std::string, Value> entries;
  for (std::size_t i = 0; i < length; ++i) {
    HostCallReply* raw_key = nullptr;
    HostCallReply* raw_val = nullptr;
    api.call_reply_map_element(reply, i, &raw_key, &raw_val);
    Result key = decode_call_reply(api, raw_key);
    if (!key) return key;
    Result val = decode_call_reply(api, raw_val);
    if (!val) return val;
    std::string key_bytes;
    if (!value_as_key_bytes(key.value(), key_bytes)) {
      return Error::str("type is not supported as map key");
    }
    entries[std::move(key_bytes)] = std::move(val.value());
  }
  return Value::map(std::move(entries));
}

Result decode_set(HostApi& api, HostCallReply* reply) {
  const std::size_t length = api.call_reply_length(reply);
  std::set<std::string> members;
  for (std::size_t i = 0; i < length; ++i) {
    Result elem = decode_call_reply(api, api.call_reply_set_element(reply, i));
    if (!elem) return elem;
    std::string member;
    if (!value_as_key_bytes(elem.value(), member)) {
      return Error::str("type is not supported on set");
    }
    members.insert(std::move(member));
  }
  return Value::set(std::move(members));
}

}  // namespace

Result decode_call_reply(HostApi& api, HostCallReply* reply) {
  if (!reply) return Error::str("Error on method call");

  switch (api.call_reply_type(reply)) {
    case ReplyTag::Error: {
      std::size_t len = 0;
      const char* p = api.call_reply_string_ptr(reply, &len);
      return Error::string(reply_bytes(p, len));
    }
    case ReplyTag::Unknown:
      return Error::str("Error on method call");
    case ReplyTag::Array:
      return decode_array(api, reply);
    case ReplyTag::Integer:
      return Value::make_integer(api.call_reply_integer(reply));
    case ReplyTag::String: {
      std::size_t len = 0;
      const char* p = api.call_reply_string_ptr(reply, &len);
      return Value::string_buffer(reply_bytes(p, len));
    }
    case ReplyTag::Null:
      return Value::null();
    case ReplyTag::Map:
      return decode_map(api, reply);
    case ReplyTag::Set:
      return decode_set(api, reply);
    case ReplyTag::Bool:
      return Value::make_bool(api.call_reply_bool(reply));
    case ReplyTag::Double:
      return Value::make_double(api.call_reply_double(reply));
    case ReplyTag::BigNumber: {
      std::size_t len = 0;
      const char* p = api.call_reply_big_number(reply, &len);
      return Value::big_number(reply_bytes(p, len));
    }
    case ReplyTag::VerbatimString: {
      std::size_t len = 0;
      const char* format = nullptr;
      const char* p = api.call_reply_verbatim(reply, &len, &format);
      return Value::verbatim_string(format ? std::string(format, 3) : std::string("txt"), reply_bytes(p, len));
    }
  }
  return Error::str("Error on method call");
}

}  // namespace modkit
