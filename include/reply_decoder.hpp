#pragma once

#include "host_api.hpp"
#include "value.hpp"

namespace modkit {

// Converts a borrowed reply tree into an owned Value tree. Releases nothing:
// the root belongs to the caller and children belong to their parent.
Result decode_call_reply(HostApi& api, HostCallReply* reply);

} // namespace modkit
