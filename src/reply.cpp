#include "context.hpp"

#include <string>

namespace modkit {

std::string Context::str_as_legal_resp_string(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    if (c == '\r' || c == '\n' || c == '\0') c = ' ';
  }
  return out;
}

Status Context::reply_unavailable(Capability cap) const {
  const char* msg = capability_api_name(cap);
  log_warning(msg);
  // Keep aggregate framing intact: the slot still receives a reply.
  (void)api_->reply_with_error(ctx_, msg);
  return Status::Err;
}

Status Context::reply_null() const {
  if (!api_) return Status::Err;
  return to_status(api_->reply_with_null(ctx_));
}

Status Context::reply_simple_string(const std::string& s) const {
  if (!api_) return Status::Err;
  const std::string msg = str_as_legal_resp_string(s);
  return to_status(api_->reply_with_simple_string(ctx_, msg.c_str()));
}

Status Context::reply_bulk_string(const std::string& s) const { return reply_bulk_slice(s); }

Status Context::reply_bulk_slice(std::string_view bytes) const {
  if (!api_) return Status::Err;
  return to_status(api_->reply_with_string_buffer(ctx_, bytes.data(), bytes.size()));
}

Status Context::reply_array(std::size_t size) const {
  if (!api_) return Status::Err;
  return to_status(api_->reply_with_array(ctx_, static_cast<long>(size)));
}

Status Context::reply_long(long long value) const {
  if (!api_) return Status::Err;
  return to_status(api_->reply_with_long_long(ctx_, value));
}

Status Context::reply_double(double value) const {
  if (!api_) return Status::Err;
  return to_status(api_->reply_with_double(ctx_, value));
}

Status Context::reply_error_string(const std::string& s) const {
  if (!api_) return Status::Err;
  const std::string msg = str_as_legal_resp_string(s);
  return to_status(api_->reply_with_error(ctx_, msg.c_str()));
}

Status Context::reply(const Result& result) const {
  if (!api_) return Status::Err;

  if (!result.ok()) {
    const Error& err = result.error();
    switch (err.kind) {
      case Error::Kind::WrongArity:
        // A keys-position scan has no client to answer.
        if (is_keys_position_request()) return Status::Err;
        return to_status(api_->wrong_arity(ctx_));
      case Error::Kind::WrongType:
        return reply_error_string(wrongtype_error_message());
      case Error::Kind::String:
      case Error::Kind::Str:
        return reply_error_string(err.message());
    }
    return Status::Err;
  }
  return reply_value(result.value());
}

Status Context::reply_value(const Value& v) const {
  if (!api_) return Status::Err;

  switch (v.kind) {
    case Value::Kind::Integer:
      return to_status(api_->reply_with_long_long(ctx_, v.integer));

    case Value::Kind::Float:
    case Value::Kind::Double:
      return to_status(api_->reply_with_double(ctx_, v.number));

    case Value::Kind::SimpleString:
      return reply_simple_string(v.str);

    case Value::Kind::SimpleStringStatic:
      return reply_simple_string(v.static_str);

    case Value::Kind::BulkString:
    case Value::Kind::StringBuffer:
      return to_status(api_->reply_with_string_buffer(ctx_, v.str.data(), v.str.size()));

    case Value::Kind::BulkStringHandle:
      if (v.handle.is_null()) return to_status(api_->reply_with_null(ctx_));
      return to_status(api_->reply_with_string(ctx_, v.handle.raw()));

    case Value::Kind::Array: {
      Status status = to_status(api_->reply_with_array(ctx_, static_cast<long>(v.items.size())));
      for (const auto& elem : v.items) {
        if (reply_value(elem) != Status::Ok) status = Status::Err;
      }
      return status;
    }

    case Value::Kind::Map: {
      if (!api_->supports(Capability::Resp3Replies)) return reply_unavailable(Capability::Resp3Replies);
      Status status = to_status(api_->reply_with_map(ctx_, static_cast<long>(v.entries.size())));
      for (const auto& [key, val] : v.entries) {
        const std::string legal_key = str_as_legal_resp_string(key);
        if (api_->reply_with_string_buffer(ctx_, legal_key.data(), legal_key.size()) != kHostOk) {
          status = Status::Err;
        }
        if (reply_value(val) != Status::Ok) status = Status::Err;
      }
      return status;
    }

    case Value::Kind::Set: {
      if (!api_->supports(Capability::Resp3Replies)) return reply_unavailable(Capability::Resp3Replies);
      Status status = to_status(api_->reply_with_set(ctx_, static_cast<long>(v.members.size())));
      for (const auto& member : v.members) {
        if (api_->reply_with_string_buffer(ctx_, member.data(), member.size()) != kHostOk) status = Status::Err;
      }
      return status;
    }

    case Value::Kind::Bool:
      if (!api_->supports(Capability::Resp3Replies)) return reply_unavailable(Capability::Resp3Replies);
      return to_status(api_->reply_with_bool(ctx_, v.boolean));

    case Value::Kind::BigNumber:
      if (!api_->supports(Capability::Resp3Replies)) return reply_unavailable(Capability::Resp3Replies);
      return to_status(api_->reply_with_big_number(ctx_, v.str.data(), v.str.size()));

    case Value::Kind::VerbatimString:
      if (!api_->supports(Capability::Resp3Replies)) return reply_unavailable(Capability::Resp3Replies);
      if (v.format.size() != 3) {
        (void)api_->reply_with_error(ctx_, "verbatim string format must be 3 bytes");
        return Status::Err;
      }
      return to_status(api_->reply_with_verbatim_string_type(ctx_, v.str.data(), v.str.size(), v.format.c_str()));

    case Value::Kind::Null:
      return to_status(api_->reply_with_null(ctx_));

    case Value::Kind::NoReply:
      return Status::Ok;
  }
  return Status::Err;
}

}  // namespace modkit
