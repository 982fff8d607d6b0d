#pragma once

#include <string>

namespace modkit {

inline const char* wrongtype_error_message() {
  return "WRONGTYPE Operation against a key holding the wrong kind of value";
}

struct Error {
  enum class Kind {
    WrongArity,
    WrongType,
    String,  // owned message
    Str,     // static message
  };

  Kind kind = Kind::Str;
  std::string text;
  const char* static_text = "";

  static Error wrong_arity() { return Error{Kind::WrongArity, {}, ""}; }
  static Error wrong_type() { return Error{Kind::WrongType, {}, ""}; }
  static Error string(std::string message) { return Error{Kind::String, std::move(message), ""}; }
  static Error str(const char* message) { return Error{Kind::Str, {}, message}; }

  std::string message() const;

  bool operator==(const Error& other) const { return kind == other.kind && message() == other.message(); }
  bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace modkit
