#include "call_options.hpp"

namespace modkit {

CallOptions CallOptionsBuilder::build() const {
  std::string token = flags_;
  token.push_back('\0');
  return CallOptions(std::move(token));
}

const CallOptions& default_call_options() {
  static const CallOptions options = CallOptionsBuilder().build();
  return options;
}

}  // namespace modkit
