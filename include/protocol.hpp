#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace modkit {

enum class RespVersion {
  Resp2 = 2,
  Resp3 = 3,
};

// A parsed reply. Maps keep keys and values alternating in `array`.
struct RespNode {
  enum Type { Nil, SimpleString, Error, Integer, BulkString, Array, Double, BigNumber, Bool, Verbatim, Map, Set };
  Type type = Nil;
  std::string str;
  std::string format;
  long long integer = 0;
  double dbl = 0;
  bool boolean = false;
  std::vector<RespNode> array;
};

// Parses one complete reply starting at `pos` and advances `pos` past it.
// Returns false on truncated or malformed input, leaving `pos` unspecified.
bool parse_reply(std::string_view data, std::size_t& pos, RespNode& out);

std::string encode_simple(std::string_view v);
std::string encode_error(std::string_view v);
// The text already starts with its error code.
std::string encode_error_raw(std::string_view v);
std::string encode_integer(long long v);
std::string encode_bulk(std::string_view v);
std::string encode_null(RespVersion ver);
std::string encode_array_header(std::size_t n);
std::string encode_map_header(std::size_t n, RespVersion ver);
std::string encode_set_header(std::size_t n, RespVersion ver);
std::string encode_double(double v, RespVersion ver);
std::string encode_bool(bool v, RespVersion ver);
std::string encode_big_number(std::string_view digits, RespVersion ver);
std::string encode_verbatim(std::string_view format, std::string_view body, RespVersion ver);

} // namespace modkit
