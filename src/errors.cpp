#include "errors.hpp"

namespace modkit {

std::string Error::message() const {
  switch (kind) {
    case Kind::WrongArity:
      return "Wrong Arity";
    case Kind::WrongType:
      return wrongtype_error_message();
    case Kind::String:
      return text;
    case Kind::Str:
      return static_text ? static_text : "";
  }
  return "";
}

}  // namespace modkit
