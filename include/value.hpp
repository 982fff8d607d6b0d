#pragma once

#include "errors.hpp"
#include "handles.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace modkit {

// One reply or value shape. Only the fields that belong to `kind` are meaningful.
struct Value {
  enum class Kind {
    Integer,
    Float,
    SimpleString,
    SimpleStringStatic,
    BulkString,
    BulkStringHandle,
    StringBuffer,
    Array,
    Map,
    Set,
    Bool,
    Double,
    BigNumber,
    VerbatimString,
    Null,
    NoReply,
  };

  Kind kind = Kind::Null;
  std::int64_t integer = 0;
  double number = 0;
  bool boolean = false;
  std::string str;            // text, bytes, big number digits, verbatim body
  const char* static_str = "";
  std::string format;         // 3-byte verbatim type tag
  ModuleString handle;
  std::vector<Value> items;
  std::map<std::string, Value> entries;
  std::set<std::string> members;

  static Value make_integer(std::int64_t v);
  static Value make_float(double v);
  static Value simple_string(std::string s);
  static Value simple_string_static(const char* s);
  static Value bulk_string(std::string s);
  static Value bulk_string_handle(ModuleString s);
  static Value string_buffer(std::string bytes);
  static Value array(std::vector<Value> values);
  static Value map(std::map<std::string, Value> values);
  static Value set(std::set<std::string> values);
  static Value make_bool(bool v);
  static Value make_double(double v);
  static Value big_number(std::string digits);
  static Value verbatim_string(std::string format, std::string body);
  static Value null();
  static Value no_reply();

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }
};

const char* kind_name(Value::Kind kind);

// Byte projection used for map keys and set members. Integers and floats
// become their decimal text; every other non-textual kind has no projection.
bool value_as_key_bytes(const Value& v, std::string& out);

std::string format_float(double v);
// format_float without exponent notation: 1e20 is "100000000000000000000".
std::string format_float_plain(double v);

class Result {
 public:
  Result(Value value) : ok_(true), value_(std::move(value)) {}
  Result(Error error) : ok_(false), error_(std::move(error)) {}

  bool ok() const { return ok_; }
  explicit operator bool() const { return ok_; }

  const Value& value() const { return value_; }
  Value& value() { return value_; }
  const Error& error() const { return error_; }

 private:
  bool ok_;
  Value value_;
  Error error_;
};

} // namespace modkit
