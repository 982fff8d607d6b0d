#include "protocol.hpp"

#include "value.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace modkit {
namespace {

constexpr int kMaxNesting = 64;

bool parse_i64(std::string_view sv, long long& out) {
  if (sv.empty()) return false;
  bool negative = false;
  std::size_t i = 0;
  if (sv[0] == '-' || sv[0] == '+') {
    negative = sv[0] == '-';
    i = 1;
    if (i == sv.size()) return false;
  }
  unsigned long long value = 0;
  const unsigned long long limit =
      negative ? static_cast<unsigned long long>(std::numeric_limits<long long>::max()) + 1
               : static_cast<unsigned long long>(std::numeric_limits<long long>::max());
  for (; i < sv.size(); ++i) {
    const char c = sv[i];
    if (c < '0' || c > '9') return false;
    const unsigned digit = static_cast<unsigned>(c - '0');
    if (value > (limit - digit) / 10) return false;
    value = value * 10 + digit;
  }
  if (negative) {
    out = value == limit ? std::numeric_limits<long long>::min() : -static_cast<long long>(value);
  } else {
    out = static_cast<long long>(value);
  }
  return true;
}

bool parse_double(std::string_view sv, double& out) {
  if (sv.empty()) return false;
  const std::string text(sv);
  char* end = nullptr;
  out = std::strtod(text.c_str(), &end);
  return end == text.c_str() + text.size();
}

bool read_line(std::string_view data, std::size_t& pos, std::string_view& line) {
  const auto end = data.find("\r\n", pos);
  if (end == std::string_view::npos) return false;
  line = data.substr(pos, end - pos);
  pos = end + 2;
  return true;
}

bool read_payload(std::string_view data, std::size_t& pos, long long len, std::string& out) {
  if (len < 0) return false;
  const auto n = static_cast<std::size_t>(len);
  if (n > data.size() || pos > data.size() - n || data.size() - n - pos < 2) return false;
  if (data[pos + n] != '\r' || data[pos + n + 1] != '\n') return false;
  out.assign(data.substr(pos, n));
  pos += n + 2;
  return true;
}

// `per_entry` is the number of elements one counted entry holds (2 for maps
// and attributes).
bool read_count(std::string_view data, std::size_t& pos, long long& count, unsigned per_entry = 1) {
  std::string_view line;
  if (!read_line(data, pos, line)) return false;
  if (!parse_i64(line, count)) return false;
  if (count < 0) return true;
  // Every element needs at least three bytes, which bounds the reservation.
  const unsigned long long max_elements = (data.size() - pos) / 3;
  return static_cast<unsigned long long>(count) <= max_elements / per_entry;
}

bool parse_node(std::string_view data, std::size_t& pos, RespNode& out, int depth);

// Children are appended as they parse, so a header alone never allocates.
bool parse_elements(std::string_view data, std::size_t& pos, RespNode& out, std::size_t n, int depth) {
  out.array.clear();
  for (std::size_t i = 0; i < n; ++i) {
    RespNode elem;
    if (!parse_node(data, pos, elem, depth + 1)) return false;
    out.array.push_back(std::move(elem));
  }
  return true;
}

bool parse_node(std::string_view data, std::size_t& pos, RespNode& out, int depth) {
  if (depth > kMaxNesting) return false;
  if (pos >= data.size()) return false;
  const char prefix = data[pos++];
  std::string_view line;

  switch (prefix) {
    case '+':
      out.type = RespNode::SimpleString;
      if (!read_line(data, pos, line)) return false;
      out.str.assign(line);
      return true;
    case '-':
      out.type = RespNode::Error;
      if (!read_line(data, pos, line)) return false;
      out.str.assign(line);
      return true;
    case ':':
      out.type = RespNode::Integer;
      return read_line(data, pos, line) && parse_i64(line, out.integer);
    case '$':
    case '!': {
      long long len = 0;
      if (!read_line(data, pos, line) || !parse_i64(line, len)) return false;
      if (len == -1) {
        out.type = RespNode::Nil;
        return true;
      }
      out.type = prefix == '$' ? RespNode::BulkString : RespNode::Error;
      return read_payload(data, pos, len, out.str);
    }
    case '*':
    case '>':
    case '~': {
      long long cnt = 0;
      if (!read_count(data, pos, cnt)) return false;
      if (cnt == -1) {
        out.type = RespNode::Nil;
        return true;
      }
      if (cnt < 0) return false;
      out.type = prefix == '~' ? RespNode::Set : RespNode::Array;
      return parse_elements(data, pos, out, static_cast<std::size_t>(cnt), depth);
    }
    case '%': {
      long long cnt = 0;
      if (!read_count(data, pos, cnt, 2) || cnt < 0) return false;
      out.type = RespNode::Map;
      return parse_elements(data, pos, out, static_cast<std::size_t>(cnt) * 2, depth);
    }
    case '_':
      out.type = RespNode::Nil;
      return read_line(data, pos, line) && line.empty();
    case ',':
      out.type = RespNode::Double;
      if (!read_line(data, pos, line)) return false;
      out.str.assign(line);
      return parse_double(line, out.dbl);
    case '#':
      out.type = RespNode::Bool;
      if (!read_line(data, pos, line)) return false;
      if (line != "t" && line != "f") return false;
      out.boolean = line == "t";
      out.integer = out.boolean ? 1 : 0;
      return true;
    case '(':
      out.type = RespNode::BigNumber;
      if (!read_line(data, pos, line) || line.empty()) return false;
      out.str.assign(line);
      return true;
    case '=': {
      long long len = 0;
      if (!read_line(data, pos, line) || !parse_i64(line, len)) return false;
      std::string payload;
      if (!read_payload(data, pos, len, payload)) return false;
      if (payload.size() < 4 || payload[3] != ':') return false;
      out.type = RespNode::Verbatim;
      out.format = payload.substr(0, 3);
      out.str = payload.substr(4);
      return true;
    }
    case '|': {
      // Attributes carry metadata only; skip them and parse the value they annotate.
      long long cnt = 0;
      if (!read_count(data, pos, cnt, 2) || cnt < 0) return false;
      for (long long i = 0; i < cnt * 2; ++i) {
        RespNode dummy;
        if (!parse_node(data, pos, dummy, depth + 1)) return false;
      }
      return parse_node(data, pos, out, depth + 1);
    }
    default:
      return false;
  }
}

}  // namespace

bool parse_reply(std::string_view data, std::size_t& pos, RespNode& out) {
  return parse_node(data, pos, out, 0);
}

std::string encode_simple(std::string_view v) { return "+" + std::string(v) + "\r\n"; }

std::string encode_error(std::string_view v) { return "-ERR " + std::string(v) + "\r\n"; }

std::string encode_error_raw(std::string_view v) { return "-" + std::string(v) + "\r\n"; }

std::string encode_integer(long long v) { return ":" + std::to_string(v) + "\r\n"; }

std::string encode_bulk(std::string_view v) {
  return "$" + std::to_string(v.size()) + "\r\n" + std::string(v) + "\r\n";
}

std::string encode_null(RespVersion ver) { return ver == RespVersion::Resp3 ? "_\r\n" : "$-1\r\n"; }

std::string encode_array_header(std::size_t n) { return "*" + std::to_string(n) + "\r\n"; }

std::string encode_map_header(std::size_t n, RespVersion ver) {
  if (ver == RespVersion::Resp3) return "%" + std::to_string(n) + "\r\n";
  return encode_array_header(n * 2);
}

std::string encode_set_header(std::size_t n, RespVersion ver) {
  if (ver == RespVersion::Resp3) return "~" + std::to_string(n) + "\r\n";
  return encode_array_header(n);
}

std::string encode_double(double v, RespVersion ver) {
  std::string text;
  if (std::isnan(v)) {
    text = "nan";
  } else if (std::isinf(v)) {
    text = v > 0 ? "inf" : "-inf";
  } else {
    text = format_float(v);
  }
  if (ver == RespVersion::Resp3) return "," + text + "\r\n";
  return encode_bulk(text);
}

std::string encode_bool(bool v, RespVersion ver) {
  if (ver == RespVersion::Resp3) return v ? "#t\r\n" : "#f\r\n";
  return encode_integer(v ? 1 : 0);
}

std::string encode_big_number(std::string_view digits, RespVersion ver) {
  if (ver == RespVersion::Resp3) return "(" + std::string(digits) + "\r\n";
  return encode_bulk(digits);
}

std::string encode_verbatim(std::string_view format, std::string_view body, RespVersion ver) {
  if (ver == RespVersion::Resp3) {
    return "=" + std::to_string(body.size() + 4) + "\r\n" + std::string(format) + ":" + std::string(body) + "\r\n";
  }
  return encode_bulk(body);
}

}  // namespace modkit
