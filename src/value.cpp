#include "value.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>

namespace modkit {

Value Value::make_integer(std::int64_t v) {
  Value out;
  out.kind = Kind::Integer;
  out.integer = v;
  return out;
}

Value Value::make_float(double v) {
  Value out;
  out.kind = Kind::Float;
  out.number = v;
  return out;
}

Value Value::simple_string(std::string s) {
  Value out;
  out.kind = Kind::SimpleString;
  out.str = std::move(s);
  return out;
}

Value Value::simple_string_static(const char* s) {
  Value out;
  out.kind = Kind::SimpleStringStatic;
  out.static_str = s ? s : "";
  return out;
}

Value Value::bulk_string(std::string s) {
  Value out;
  out.kind = Kind::BulkString;
  out.str = std::move(s);
  return out;
}

Value Value::bulk_string_handle(ModuleString s) {
  Value out;
  out.kind = Kind::BulkStringHandle;
  out.handle = std::move(s);
  return out;
}

Value Value::string_buffer(std::string bytes) {
  Value out;
  out.kind = Kind::StringBuffer;
  out.str = std::move(bytes);
  return out;
}

Value Value::array(std::vector<Value> values) {
  Value out;
  out.kind = Kind::Array;
  out.items = std::move(values);
  return out;
}

Value Value::map(std::map<std::string, Value> values) {
  Value out;
  out.kind = Kind::Map;
  out.entries = std::move(values);
  return out;
}

Value Value::set(std::set<std::string> values) {
  Value out;
  out.kind = Kind::Set;
  out.members = std::move(values);
  return out;
}

Value Value::make_bool(bool v) {
  Value out;
  out.kind = Kind::Bool;
  out.boolean = v;
  return out;
}

Value Value::make_double(double v) {
  Value out;
  out.kind = Kind::Double;
  out.number = v;
  return out;
}

Value Value::big_number(std::string digits) {
  Value out;
  out.kind = Kind::BigNumber;
  out.str = std::move(digits);
  return out;
}

Value Value::verbatim_string(std::string format, std::string body) {
  Value out;
  out.kind = Kind::VerbatimString;
  out.format = std::move(format);
  out.str = std::move(body);
  return out;
}

Value Value::null() { return Value{}; }

Value Value::no_reply() {
  Value out;
  out.kind = Kind::NoReply;
  return out;
}

bool Value::operator==(const Value& other) const {
  if (kind != other.kind) return false;
  switch (kind) {
    case Kind::Integer:
      return integer == other.integer;
    case Kind::Float:
    case Kind::Double:
      return number == other.number;
    case Kind::SimpleString:
    case Kind::BulkString:
    case Kind::StringBuffer:
    case Kind::BigNumber:
      return str == other.str;
    case Kind::SimpleStringStatic:
      return std::strcmp(static_str, other.static_str) == 0;
    case Kind::BulkStringHandle:
      return handle.bytes() == other.handle.bytes();
    case Kind::Array:
      return items == other.items;
    case Kind::Map:
      return entries == other.entries;
    case Kind::Set:
      return members == other.members;
    case Kind::Bool:
      return boolean == other.boolean;
    case Kind::VerbatimString:
      return format == other.format && str == other.str;
    case Kind::Null:
    case Kind::NoReply:
      return true;
  }
  return false;
}

const char* kind_name(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::Integer: return "integer";
    case Value::Kind::Float: return "float";
    case Value::Kind::SimpleString: return "simple-string";
    case Value::Kind::SimpleStringStatic: return "simple-string";
    case Value::Kind::BulkString: return "bulk-string";
    case Value::Kind::BulkStringHandle: return "bulk-string";
    case Value::Kind::StringBuffer: return "string-buffer";
    case Value::Kind::Array: return "array";
    case Value::Kind::Map: return "map";
    case Value::Kind::Set: return "set";
    case Value::Kind::Bool: return "bool";
    case Value::Kind::Double: return "double";
    case Value::Kind::BigNumber: return "big-number";
    case Value::Kind::VerbatimString: return "verbatim-string";
    case Value::Kind::Null: return "null";
    case Value::Kind::NoReply: return "no-reply";
  }
  return "unknown";
}

// Shortest decimal text that reads back as the same double.
std::string format_float(double v) {
  std::string text;
  for (int precision = std::numeric_limits<double>::digits10; precision <= std::numeric_limits<double>::max_digits10;
       ++precision) {
    std::ostringstream out;
    out << std::setprecision(precision) << v;
    text = out.str();
    std::istringstream in(text);
    double back = 0;
    if ((in >> back) && back == v) break;
  }
  return text;
}

std::string format_float_plain(double v) {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

  const std::string text = format_float(v);
  const auto e = text.find_first_of("eE");
  if (e == std::string::npos) return text;

  std::string mantissa = text.substr(0, e);
  const long exponent = std::strtol(text.c_str() + e + 1, nullptr, 10);
  std::string sign;
  if (!mantissa.empty() && mantissa[0] == '-') {
    sign = "-";
    mantissa.erase(0, 1);
  }

  const auto dot = mantissa.find('.');
  long point = static_cast<long>(dot == std::string::npos ? mantissa.size() : dot);
  if (dot != std::string::npos) mantissa.erase(dot, 1);
  point += exponent;

  const long digits = static_cast<long>(mantissa.size());
  if (point >= digits) return sign + mantissa + std::string(static_cast<std::size_t>(point - digits), '0');
  if (point <= 0) return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + mantissa;
  return sign + mantissa.substr(0, static_cast<std::size_t>(point)) + "." +
         mantissa.substr(static_cast<std::size_t>(point));
}

bool value_as_key_bytes(const Value& v, std::string& out) {
  switch (v.kind) {
    case Value::Kind::SimpleString:
    case Value::Kind::BulkString:
    case Value::Kind::StringBuffer:
      out = v.str;
      return true;
    case Value::Kind::SimpleStringStatic:
      out = v.static_str;
      return true;
    case Value::Kind::BulkStringHandle:
      out = v.handle.str();
      return true;
    case Value::Kind::Integer:
      out = std::to_string(v.integer);
      return true;
    case Value::Kind::Float:
      out = format_float_plain(v.number);
      return true;
    default:
      return false;
  }
}

}  // namespace modkit
