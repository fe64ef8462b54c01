#pragma once

// wjson: a small, header-only C++17 codec for a compact JSON-derived wire format.
// Booleans travel as 1/0, 64/128-bit integers as quoted decimals, bytes as url-safe base64,
// and tagged variants as "Tag" or {"Tag":payload}. Types hook in through serializer<T> and
// deserializer<T> specializations.

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#if defined(_M_X64) || defined(__SSE2__)
  #if defined(_MSC_VER)
    #include <intrin.h>
  #endif
  #include <immintrin.h>
#endif
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

// Config: default nesting limit for decode_options.
#ifndef WJSON_DEFAULT_MAX_DEPTH
  #define WJSON_DEFAULT_MAX_DEPTH 128
#endif

// Config: 128-bit integer support. Detected from the compiler; define to 0 to disable.
#ifndef WJSON_HAS_INT128
  #if defined(__SIZEOF_INT128__)
    #define WJSON_HAS_INT128 1
  #else
    #define WJSON_HAS_INT128 0
  #endif
#endif

namespace wjson {

#if WJSON_HAS_INT128
__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;
#endif

enum class error_code {
  ok = 0,
  unexpected_eof,
  unexpected_token,
  invalid_unicode_escape,
  unexpected_unicode_escape,
  invalid_base64,
  invalid_utf8,
  invalid_integer,
  invalid_float,
  not_a_number,
  nesting_too_deep,
  trailing_characters,
  custom
};

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  // unexpected_token: the offending character.
  char32_t token{0};
  // unexpected_unicode_escape: the rejected code point.
  std::uint32_t code_point{0};
  // invalid_integer / invalid_float: what the literal parser reported.
  std::errc num_ec{};
  // custom: free-form message from a serializer/deserializer.
  std::string message{};

  explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::unexpected_token: return "unexpected token";
    case error_code::invalid_unicode_escape: return "invalid unicode escape sequence";
    case error_code::unexpected_unicode_escape: return "unexpected unicode escape sequence";
    case error_code::invalid_base64: return "base64 decode error";
    case error_code::invalid_utf8: return "utf-8 error";
    case error_code::invalid_integer: return "parse int error";
    case error_code::invalid_float: return "parse float error";
    case error_code::not_a_number: return "not a number";
    case error_code::nesting_too_deep: return "nesting too deep";
    case error_code::trailing_characters: return "trailing characters";
    case error_code::custom: return "custom error";
  }
  return "unknown error";
}

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(const char* buf, std::size_t size, std::size_t& i) noexcept {
  // Fast path: SSE2 scan 16 bytes at a time (available on MSVC x64 and most x86).
#if defined(_M_X64) || defined(__SSE2__)
  while (i + 16 <= size) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
    const __m128i is_space = _mm_cmpeq_epi8(v, _mm_set1_epi8(' '));
    const __m128i is_nl = _mm_cmpeq_epi8(v, _mm_set1_epi8('\n'));
    const __m128i is_cr = _mm_cmpeq_epi8(v, _mm_set1_epi8('\r'));
    const __m128i is_tab = _mm_cmpeq_epi8(v, _mm_set1_epi8('\t'));
    const __m128i is_ws_v = _mm_or_si128(_mm_or_si128(is_space, is_nl), _mm_or_si128(is_cr, is_tab));
    const unsigned ws_mask = static_cast<unsigned>(_mm_movemask_epi8(is_ws_v));
    if (ws_mask == 0xFFFFu) {
      i += 16;
      continue;
    }
    const unsigned non = (~ws_mask) & 0xFFFFu;
#if defined(_MSC_VER)
    unsigned long idx = 0;
    _BitScanForward(&idx, non);
    i += static_cast<std::size_t>(idx);
#else
    i += static_cast<std::size_t>(__builtin_ctz(non));
#endif
    return;
  }
#endif

  while (i < size && is_ws(buf[i])) ++i;
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline bool is_scalar_value(std::uint32_t cp) noexcept {
  return cp <= 0x10FFFFu && !(cp >= 0xD800u && cp <= 0xDFFFu);
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

// Decodes one UTF-8 sequence at `i`. Returns its length, or 0 if the bytes there are not
// well-formed (overlong forms, surrogates and values above U+10FFFF are rejected).
inline std::size_t decode_utf8_at(const char* buf, std::size_t size, std::size_t i, char32_t& out) noexcept {
  if (i >= size) return 0;
  const unsigned char b0 = static_cast<unsigned char>(buf[i]);
  if (b0 < 0x80u) {
    out = b0;
    return 1;
  }

  std::size_t len = 0;
  std::uint32_t cp = 0;
  std::uint32_t min = 0;
  if ((b0 & 0xE0u) == 0xC0u) {
    len = 2;
    cp = b0 & 0x1Fu;
    min = 0x80u;
  } else if ((b0 & 0xF0u) == 0xE0u) {
    len = 3;
    cp = b0 & 0x0Fu;
    min = 0x800u;
  } else if ((b0 & 0xF8u) == 0xF0u) {
    len = 4;
    cp = b0 & 0x07u;
    min = 0x10000u;
  } else {
    return 0;
  }
  if (i + len > size) return 0;

  for (std::size_t k = 1; k < len; ++k) {
    const unsigned char b = static_cast<unsigned char>(buf[i + k]);
    if ((b & 0xC0u) != 0x80u) return 0;
    cp = (cp << 6) | (b & 0x3Fu);
  }
  if (cp < min || !is_scalar_value(cp)) return 0;
  out = static_cast<char32_t>(cp);
  return len;
}

inline bool validate_utf8(const char* buf, std::size_t size, std::size_t& bad_at) noexcept {
  std::size_t i = 0;
  while (i < size) {
    // ASCII run.
    while (i < size && static_cast<unsigned char>(buf[i]) < 0x80u) ++i;
    if (i == size) break;
    char32_t cp = 0;
    const std::size_t len = decode_utf8_at(buf, size, i, cp);
    if (len == 0) {
      bad_at = i;
      return false;
    }
    i += len;
  }
  return true;
}

// Position of the next '"' or '\\' at or after `i`, or `size`.
inline std::size_t find_quote_or_backslash(const char* buf, std::size_t size, std::size_t i) noexcept {
#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  while (i + 16 <= size) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
    const __m128i any = _mm_or_si128(_mm_cmpeq_epi8(v, q), _mm_cmpeq_epi8(v, bs));
    const int mask = _mm_movemask_epi8(any);
    if (mask != 0) {
#if defined(_MSC_VER)
      unsigned long bit = 0;
      _BitScanForward(&bit, static_cast<unsigned long>(mask));
      return i + static_cast<std::size_t>(bit);
#else
      return i + static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
    }
    i += 16;
  }
#endif
  while (i < size && buf[i] != '"' && buf[i] != '\\') ++i;
  return i;
}

inline bool needs_escape(unsigned char uc) noexcept {
  return uc == '"' || uc == '\\' || uc == '/' || uc <= 0x1F;
}

inline std::size_t find_first_escape(std::string_view s) noexcept {
  const char* p = s.data();
  const std::size_t n = s.size();
  std::size_t i = 0;

#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  const __m128i sl = _mm_set1_epi8('/');
  const __m128i k1f = _mm_set1_epi8(0x1F);
  const __m128i zero = _mm_setzero_si128();

  while (i + 16 <= n) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p + i));
    const __m128i is_q = _mm_cmpeq_epi8(v, q);
    const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
    const __m128i is_sl = _mm_cmpeq_epi8(v, sl);
    // Unsigned check for v <= 0x1F using saturated subtract.
    const __m128i sub = _mm_subs_epu8(v, k1f);
    const __m128i is_ctrl = _mm_cmpeq_epi8(sub, zero);
    const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), _mm_or_si128(is_sl, is_ctrl));
    const int mask = _mm_movemask_epi8(any);
    if (mask != 0) {
#if defined(_MSC_VER)
      unsigned long bit = 0;
      _BitScanForward(&bit, static_cast<unsigned long>(mask));
      return i + static_cast<std::size_t>(bit);
#else
      return i + static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
    }
    i += 16;
  }
#endif
  for (; i < n; ++i) {
    if (needs_escape(static_cast<unsigned char>(p[i]))) return i;
  }
  return n;
}

inline void write_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";

  const char* data = s.data();
  const std::size_t n = s.size();
  const std::size_t first = find_first_escape(s);

  out.push_back('"');
  if (first == n) {
    out.append(data, n);
    out.push_back('"');
    return;
  }

  if (first > 0) out.append(data, first);

  std::size_t chunk_begin = first;
  for (std::size_t i = first; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);
    if (!needs_escape(uc)) continue;

    if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
    chunk_begin = i + 1;
    switch (data[i]) {
      case '"': out.append("\\\"", 2); break;
      case '\\': out.append("\\\\", 2); break;
      case '/': out.append("\\/", 2); break;
      case '\b': out.append("\\b", 2); break;
      case '\f': out.append("\\f", 2); break;
      case '\n': out.append("\\n", 2); break;
      case '\r': out.append("\\r", 2); break;
      case '\t': out.append("\\t", 2); break;
      default:
        out.append("\\u00", 4);
        out.push_back(hex[(uc >> 4) & 0xF]);
        out.push_back(hex[uc & 0xF]);
        break;
    }
  }

  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

// URL-safe alphabet (RFC 4648 section 5), '=' padded on output.
inline void base64_encode(std::string& out, const std::byte* data, std::size_t size) {
  static constexpr char chars[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

  out.reserve(out.size() + ((size + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= size; i += 3) {
    const std::uint32_t v = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                            (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                            std::to_integer<std::uint32_t>(data[i + 2]);
    out.push_back(chars[(v >> 18) & 0x3F]);
    out.push_back(chars[(v >> 12) & 0x3F]);
    out.push_back(chars[(v >> 6) & 0x3F]);
    out.push_back(chars[v & 0x3F]);
  }

  const std::size_t rest = size - i;
  if (rest == 1) {
    const std::uint32_t v = std::to_integer<std::uint32_t>(data[i]) << 16;
    out.push_back(chars[(v >> 18) & 0x3F]);
    out.push_back(chars[(v >> 12) & 0x3F]);
    out.append("==", 2);
  } else if (rest == 2) {
    const std::uint32_t v = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                            (std::to_integer<std::uint32_t>(data[i + 1]) << 8);
    out.push_back(chars[(v >> 18) & 0x3F]);
    out.push_back(chars[(v >> 12) & 0x3F]);
    out.push_back(chars[(v >> 6) & 0x3F]);
    out.push_back('=');
  }
}

inline int base64_val(char c) noexcept {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return 26 + (c - 'a');
  if (c >= '0' && c <= '9') return 52 + (c - '0');
  if (c == '-') return 62;
  if (c == '_') return 63;
  return -1;
}

// Accepts padded or unpadded input. Rejects foreign characters, impossible lengths and
// non-zero trailing bits.
inline bool base64_decode(std::string_view in, std::vector<std::byte>& out) {
  std::size_t n = in.size();
  std::size_t pad = 0;
  while (n > 0 && in[n - 1] == '=' && pad < 2) {
    --n;
    ++pad;
  }
  if (n % 4 == 1) return false;
  if (pad != 0 && (n + pad) % 4 != 0) return false;

  out.clear();
  out.reserve((n / 4) * 3 + 2);

  std::uint32_t buf = 0; // rolling buffer of decoded 6-bit groups
  int bits = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const int v = base64_val(in[i]);
    if (v < 0) return false;
    buf = (buf << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::byte>((buf >> bits) & 0xFFu));
      buf &= (1u << bits) - 1u;
    }
  }
  return buf == 0;
}

inline bool is_float_char(char c) noexcept {
  return is_digit(c) || c == '-' || c == '.' || c == 'e' || c == 'E' || c == '+';
}

template <class T>
struct is_int128 : std::false_type {};

template <class T>
struct is_signed_int128 : std::false_type {};

#if WJSON_HAS_INT128
template <>
struct is_int128<int128_t> : std::true_type {};
template <>
struct is_int128<uint128_t> : std::true_type {};
template <>
struct is_signed_int128<int128_t> : std::true_type {};
#endif

template <class T>
struct is_char_type
    : std::integral_constant<bool, std::is_same<T, char>::value || std::is_same<T, wchar_t>::value ||
                                       std::is_same<T, char16_t>::value || std::is_same<T, char32_t>::value> {};

// Integers that travel as numbers. bool and the character types have their own encodings.
template <class T>
struct is_wire_integer
    : std::integral_constant<bool, (std::is_integral<T>::value && !std::is_same<T, bool>::value &&
                                    !is_char_type<T>::value) ||
                                       is_int128<T>::value> {};

// 64-bit and wider integers are quoted on the wire.
template <class T>
struct is_wide_integer : std::integral_constant<bool, is_wire_integer<T>::value && (sizeof(T) >= 8)> {};

template <class T>
struct is_signed_integer
    : std::integral_constant<bool, std::is_signed<T>::value || is_signed_int128<T>::value> {};

template <class T>
inline bool parse_integer(std::string_view token, T& out, std::errc& ec) noexcept {
  const char* first = token.data();
  const char* last = first + token.size();
  T v{};
  const auto r = std::from_chars(first, last, v);
  if (r.ec != std::errc{}) {
    ec = r.ec;
    return false;
  }
  if (r.ptr != last) {
    ec = std::errc::invalid_argument;
    return false;
  }
  out = v;
  return true;
}

template <class T>
inline bool parse_floating(std::string_view token, T& out, std::errc& ec) noexcept {
  const char* first = token.data();
  const char* last = first + token.size();
  T v{};
  const auto r = std::from_chars(first, last, v, std::chars_format::general);
  if (r.ec != std::errc{}) {
    ec = r.ec;
    return false;
  }
  if (r.ptr != last) {
    ec = std::errc::invalid_argument;
    return false;
  }
  out = v;
  return true;
}

template <class T>
inline void append_integer(std::string& out, T v) {
  char buf[32];
  const auto r = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

#if WJSON_HAS_INT128
inline bool parse_u128(std::string_view token, uint128_t& out, std::errc& ec) noexcept {
  if (token.empty()) {
    ec = std::errc::invalid_argument;
    return false;
  }
  const uint128_t max = ~static_cast<uint128_t>(0);
  uint128_t acc = 0;
  for (const char c : token) {
    if (!is_digit(c)) {
      ec = std::errc::invalid_argument;
      return false;
    }
    const unsigned d = static_cast<unsigned>(c - '0');
    if (acc > (max - d) / 10u) {
      ec = std::errc::result_out_of_range;
      return false;
    }
    acc = acc * 10u + d;
  }
  out = acc;
  return true;
}

inline bool parse_integer(std::string_view token, uint128_t& out, std::errc& ec) noexcept {
  return parse_u128(token, out, ec);
}

inline bool parse_integer(std::string_view token, int128_t& out, std::errc& ec) noexcept {
  const bool neg = !token.empty() && token[0] == '-';
  uint128_t mag = 0;
  if (!parse_u128(neg ? token.substr(1) : token, mag, ec)) return false;

  const uint128_t limit = (static_cast<uint128_t>(1) << 127);
  if (neg) {
    if (mag > limit) {
      ec = std::errc::result_out_of_range;
      return false;
    }
    out = (mag == limit) ? static_cast<int128_t>(limit) : -static_cast<int128_t>(mag);
    return true;
  }
  if (mag >= limit) {
    ec = std::errc::result_out_of_range;
    return false;
  }
  out = static_cast<int128_t>(mag);
  return true;
}

inline void format_u128(std::string& out, uint128_t v) {
  char buf[40];
  std::size_t n = 0;
  do {
    buf[n++] = static_cast<char>('0' + static_cast<unsigned>(v % 10u));
    v /= 10u;
  } while (v != 0);
  while (n > 0) out.push_back(buf[--n]);
}

inline void append_integer(std::string& out, uint128_t v) {
  format_u128(out, v);
}

inline void append_integer(std::string& out, int128_t v) {
  if (v < 0) {
    out.push_back('-');
    // Two's complement negation in the unsigned domain keeps INT128_MIN intact.
    format_u128(out, ~static_cast<uint128_t>(v) + 1u);
    return;
  }
  format_u128(out, static_cast<uint128_t>(v));
}
#endif

} // namespace detail

inline std::string describe(const error& e) {
  std::string out = to_string(e.code);
  switch (e.code) {
    case error_code::unexpected_token: {
      out += " '";
      if (detail::is_scalar_value(static_cast<std::uint32_t>(e.token))) {
        detail::append_utf8(out, static_cast<std::uint32_t>(e.token));
      } else {
        out += '?';
      }
      out += '\'';
      break;
    }
    case error_code::unexpected_unicode_escape: {
      static constexpr char hex[] = "0123456789ABCDEF";
      out += " U+";
      for (int shift = 12; shift >= 0; shift -= 4) out.push_back(hex[(e.code_point >> shift) & 0xFu]);
      break;
    }
    case error_code::invalid_integer:
    case error_code::invalid_float:
      out += " : ";
      out += std::make_error_code(e.num_ec).message();
      break;
    case error_code::custom:
      out += " : ";
      out += e.message;
      break;
    default:
      break;
  }
  out += " at offset " + std::to_string(e.offset) + " (line " + std::to_string(e.line) + ", column " +
         std::to_string(e.column) + ")";
  return out;
}

class exception : public std::runtime_error {
public:
  explicit exception(error e) : std::runtime_error("wjson: " + describe(e)), err_(std::move(e)) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

// -----------------------------
// Dynamic value (decode target for "any")
// -----------------------------

class value {
public:
  using array = std::vector<value>;
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { null, boolean, number, string, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}

  static value number(double d) {
    value v;
    v.data_ = d;
    return v;
  }

  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::number;
      case 3: return kind::string;
      case 4: return kind::array;
      case 5: return kind::object;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  double as_double() const { return std::get<double>(data_); }

  const std::string& as_string() const { return std::get<std::string>(data_); }
  const array& as_array() const { return std::get<array>(data_); }
  const object& as_object() const { return std::get<object>(data_); }

  array& as_array() { return std::get<array>(data_); }
  object& as_object() { return std::get<object>(data_); }
  std::string& as_string() { return std::get<std::string>(data_); }

  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    const auto& o = std::get<object>(data_);
    for (const auto& kv : o) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  value* find(std::string_view key) noexcept {
    if (!is_object()) return nullptr;
    auto& o = std::get<object>(data_);
    for (auto& kv : o) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

private:
  // index: 0 null, 1 bool, 2 number, 3 string, 4 array, 5 object
  std::variant<std::monostate, bool, double, std::string, array, object> data_;
};

// A decoded string: a view into the input when no escape was present, an owned buffer otherwise.
class string_ref {
public:
  string_ref() = default;

  bool borrowed() const noexcept { return !owned_; }
  std::string_view view() const noexcept { return owned_ ? std::string_view(buf_) : view_; }
  std::string str() const { return std::string(view()); }

  void borrow(std::string_view s) noexcept {
    view_ = s;
    owned_ = false;
  }

  // Switches to owned storage and returns the (cleared) buffer.
  std::string& own() {
    buf_.clear();
    view_ = std::string_view{};
    owned_ = true;
    return buf_;
  }

private:
  std::string_view view_;
  std::string buf_;
  bool owned_{false};
};

// -----------------------------
// Traversal contract
// -----------------------------

class decoder;
class encoder;

// Specialize with `static bool encode(encoder&, const T&)`.
template <class T, class Enable = void>
struct serializer;

// Specialize with `static bool decode(decoder&, T&)`.
template <class T, class Enable = void>
struct deserializer;

template <class T>
struct is_string_like
    : std::integral_constant<bool, std::is_same<T, std::string>::value || std::is_same<T, std::string_view>::value ||
                                       std::is_same<T, string_ref>::value> {};


// -----------------------------
// Decoder
// -----------------------------

struct decode_options {
  std::size_t max_depth{WJSON_DEFAULT_MAX_DEPTH};
  bool require_eof{true};
};

// Cursor over one open '[' ... ']'. Emits no commas before the first element.
class seq_access {
public:
  explicit seq_access(decoder& d) noexcept : d_(&d) {}

  // Positions the decoder on the next element. `more` is false once ']' is next.
  bool next(bool& more);

  // Reads the next element into `out`; a sequence that ends early is a length error.
  template <class T>
  bool element(T& out);

  // Fails unless ']' is next. For fixed-length sequences.
  bool expect_end();

  std::size_t count() const noexcept { return count_; }
  decoder& de() noexcept { return *d_; }

private:
  decoder* d_;
  bool first_{true};
  std::size_t count_{0};
};

// Cursor over one open '{' ... '}': key, ':' then value, comma separated.
class map_access {
public:
  explicit map_access(decoder& d) noexcept : d_(&d) {}

  bool next_key(bool& more);
  bool next_value();

  decoder& de() noexcept { return *d_; }

private:
  decoder* d_;
  bool first_{true};
};

// Payload side of a tagged variant. `has_payload` is true for the {"Tag":payload} form.
class variant_access {
public:
  variant_access(decoder& d, bool has_payload) noexcept : d_(&d), has_payload_(has_payload) {}

  bool has_payload() const noexcept { return has_payload_; }

  bool unit();

  template <class T>
  bool newtype(T& out);

  template <class Fn>
  bool tuple(Fn&& fn);

  template <class Fn>
  bool struct_fields(Fn&& on_field);

private:
  decoder* d_;
  bool has_payload_;
};

class decoder {
public:
  explicit decoder(std::string_view input, decode_options opt = {}) noexcept : s_(input), opt_(opt) {}

  const error& err() const noexcept { return err_; }
  bool failed() const noexcept { return static_cast<bool>(err_); }
  std::size_t offset() const noexcept { return i_; }
  std::string_view input() const noexcept { return s_; }
  std::string_view remaining() const noexcept { return s_.substr(i_); }
  const decode_options& options() const noexcept { return opt_; }

  void skip_ws() noexcept { detail::skip_ws(s_.data(), s_.size(), i_); }

  // Accepts 1, 0, true, false.
  bool read_bool(bool& out);

  // Narrow integers are bare digits; 64-bit and wider are quoted.
  template <class T>
  bool read_integer(T& out);

  // `null` reads as NaN.
  template <class T>
  bool read_float(T& out);

  bool read_char(char32_t& out);
  bool read_str(string_ref& out);
  bool read_string(std::string& out);
  bool read_borrowed_str(std::string_view& out);
  bool read_bytes(std::vector<std::byte>& out);
  bool read_unit();
  bool peek_null(bool& is_null);

  template <class Fn>
  bool read_seq(Fn&& fn);

  template <class Fn>
  bool read_map(Fn&& fn);

  // Calls `on_field(name)` with the decoder positioned on each field's value.
  template <class Fn>
  bool read_struct(Fn&& on_field);

  // Calls `fn(tag, variant_access&)` for "Tag" and {"Tag":payload}.
  template <class Fn>
  bool read_variant(Fn&& fn);

  bool read_value(value& out);
  bool skip_value();

  template <class T>
  bool read(T& out) {
    return deserializer<T>::decode(*this, out);
  }

  template <class K>
  bool read_key(K& out);

  // End-of-document check (require_eof).
  bool finish();

  bool fail(error_code code) { return fail_at(code, i_); }
  bool fail_at(error_code code, std::size_t at);
  bool fail_token();
  bool fail_custom(std::string message);
  bool fail_custom_at(std::string message, std::size_t at);
  bool fail_missing_field(std::string_view name);
  bool fail_unknown_field(std::string_view name);
  bool fail_unknown_variant(std::string_view tag);

private:
  friend class seq_access;
  friend class map_access;
  friend class variant_access;

  bool at_end() const noexcept { return i_ >= s_.size(); }
  bool expect(char c);
  bool enter();
  void leave() noexcept { --depth_; }

  bool parse_string(string_ref& out);
  bool parse_escape(std::string& out);
  bool parse_hex4(std::uint32_t& cp);
  bool fail_unicode(std::uint32_t cp, std::size_t at);
  bool fail_number(error_code code, std::errc ec, std::size_t at);

  template <class T>
  bool parse_run_integer(T& out, bool allow_minus);

  template <class T>
  bool parse_quoted_integer(T& out);

  std::string_view s_;
  std::size_t i_{0};
  std::size_t depth_{0};
  decode_options opt_;
  error err_;
};

inline bool decoder::fail_at(error_code code, std::size_t at) {
  // First error wins.
  if (err_) return false;
  err_.code = code;
  err_.offset = at;
  detail::update_line_col(s_, at, err_.line, err_.column);
  return false;
}

inline bool decoder::fail_token() {
  if (at_end()) return fail(error_code::unexpected_eof);
  if (err_) return false;
  char32_t cp = 0;
  if (detail::decode_utf8_at(s_.data(), s_.size(), i_, cp) == 0) {
    cp = static_cast<unsigned char>(s_[i_]);
  }
  fail(error_code::unexpected_token);
  err_.token = cp;
  return false;
}

inline bool decoder::fail_custom(std::string message) {
  return fail_custom_at(std::move(message), i_);
}

inline bool decoder::fail_custom_at(std::string message, std::size_t at) {
  if (err_) return false;
  fail_at(error_code::custom, at);
  err_.message = std::move(message);
  return false;
}

inline bool decoder::fail_missing_field(std::string_view name) {
  return fail_custom("missing field `" + std::string(name) + "`");
}

inline bool decoder::fail_unknown_field(std::string_view name) {
  return fail_custom("unknown field `" + std::string(name) + "`");
}

inline bool decoder::fail_unknown_variant(std::string_view tag) {
  return fail_custom("unknown variant `" + std::string(tag) + "`");
}

inline bool decoder::fail_unicode(std::uint32_t cp, std::size_t at) {
  if (err_) return false;
  fail_at(error_code::unexpected_unicode_escape, at);
  err_.code_point = cp;
  return false;
}

inline bool decoder::fail_number(error_code code, std::errc ec, std::size_t at) {
  if (err_) return false;
  fail_at(code, at);
  err_.num_ec = ec;
  return false;
}

inline bool decoder::expect(char c) {
  if (at_end()) return fail(error_code::unexpected_eof);
  if (s_[i_] != c) return fail_token();
  ++i_;
  return true;
}

inline bool decoder::enter() {
  if (depth_ >= opt_.max_depth) return fail(error_code::nesting_too_deep);
  ++depth_;
  return true;
}

inline bool decoder::finish() {
  if (err_) return false;
  if (!opt_.require_eof) return true;
  skip_ws();
  if (!at_end()) return fail(error_code::trailing_characters);
  return true;
}

inline bool decoder::read_bool(bool& out) {
  skip_ws();
  static constexpr std::string_view lits[] = {"1", "0", "true", "false"};
  const std::string_view rest = s_.substr(i_);
  for (std::size_t k = 0; k < 4; ++k) {
    if (rest.substr(0, lits[k].size()) == lits[k]) {
      i_ += lits[k].size();
      out = (k & 1u) == 0;
      return true;
    }
  }
  return fail_token();
}

template <class T>
bool decoder::parse_run_integer(T& out, bool allow_minus) {
  const std::size_t start = i_;
  std::size_t end = start;
  while (end < s_.size() && (detail::is_digit(s_[end]) || (allow_minus && s_[end] == '-'))) ++end;

  std::errc ec{};
  if (!detail::parse_integer(s_.substr(start, end - start), out, ec)) {
    return fail_number(error_code::invalid_integer, ec, start);
  }
  i_ = end;
  return true;
}

template <class T>
bool decoder::parse_quoted_integer(T& out) {
  const std::size_t start = i_;
  string_ref text;
  if (!parse_string(text)) return false;
  std::errc ec{};
  if (!detail::parse_integer(text.view(), out, ec)) {
    return fail_number(error_code::invalid_integer, ec, start);
  }
  return true;
}

template <class T>
bool decoder::read_integer(T& out) {
  static_assert(detail::is_wire_integer<T>::value, "wjson: read_integer needs an integer type");
  skip_ws();
  if constexpr (detail::is_wide_integer<T>::value) {
    return parse_quoted_integer(out);
  } else {
    return parse_run_integer(out, detail::is_signed_integer<T>::value);
  }
}

template <class T>
bool decoder::read_float(T& out) {
  static_assert(std::is_floating_point<T>::value, "wjson: read_float needs a floating-point type");
  skip_ws();
  if (s_.compare(i_, 4, "null") == 0) {
    i_ += 4;
    out = std::numeric_limits<T>::quiet_NaN();
    return true;
  }

  const std::size_t start = i_;
  std::size_t end = start;
  while (end < s_.size() && detail::is_float_char(s_[end])) ++end;

  std::errc ec{};
  if (!detail::parse_floating(s_.substr(start, end - start), out, ec)) {
    return fail_number(error_code::invalid_float, ec, start);
  }
  i_ = end;
  return true;
}

inline bool decoder::parse_hex4(std::uint32_t& cp) {
  if (i_ + 4 > s_.size()) {
    i_ = s_.size();
    return fail(error_code::unexpected_eof);
  }
  std::uint32_t v = 0;
  for (std::size_t k = 0; k < 4; ++k) {
    const int h = detail::hex_val(s_[i_ + k]);
    if (h < 0) return fail_at(error_code::invalid_unicode_escape, i_ + k);
    v = (v << 4) | static_cast<std::uint32_t>(h);
  }
  i_ += 4;
  cp = v;
  return true;
}

// `i_` is on the backslash.
inline bool decoder::parse_escape(std::string& out) {
  const std::size_t esc_pos = i_;
  ++i_;
  if (at_end()) return fail(error_code::unexpected_eof);

  const char esc = s_[i_];
  switch (esc) {
    case '"':
    case '\\':
    case '/': out.push_back(esc); break;
    case 'b': out.push_back('\b'); break;
    case 'f': out.push_back('\f'); break;
    case 'n': out.push_back('\n'); break;
    case 'r': out.push_back('\r'); break;
    case 't': out.push_back('\t'); break;
    case 'u': {
      ++i_;
      std::uint32_t cp = 0;
      if (!parse_hex4(cp)) return false;
      if (cp >= 0xD800u && cp <= 0xDBFFu) {
        // Only a directly following low surrogate completes the pair.
        if (s_.compare(i_, 2, "\\u") != 0) return fail_unicode(cp, esc_pos);
        i_ += 2;
        std::uint32_t low = 0;
        if (!parse_hex4(low)) return false;
        if (low < 0xDC00u || low > 0xDFFFu) return fail_unicode(cp, esc_pos);
        cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
      } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
        return fail_unicode(cp, esc_pos);
      }
      detail::append_utf8(out, cp);
      return true;
    }
    default:
      return fail_token();
  }
  ++i_;
  return true;
}

inline bool decoder::parse_string(string_ref& out) {
  if (at_end()) return fail(error_code::unexpected_eof);
  if (s_[i_] != '"') return fail_token();
  ++i_;

  const char* base = s_.data();
  const std::size_t n = s_.size();
  std::size_t chunk_begin = i_;
  std::string* buf = nullptr;

  while (true) {
    i_ = detail::find_quote_or_backslash(base, n, i_);
    if (i_ >= n) return fail(error_code::unexpected_eof);

    if (base[i_] == '"') {
      if (buf == nullptr) {
        out.borrow(std::string_view(base + chunk_begin, i_ - chunk_begin));
      } else if (i_ > chunk_begin) {
        buf->append(base + chunk_begin, i_ - chunk_begin);
      }
      ++i_;
      return true;
    }

    // First escape: switch to an owned buffer seeded with the literal prefix.
    if (buf == nullptr) buf = &out.own();
    if (i_ > chunk_begin) buf->append(base + chunk_begin, i_ - chunk_begin);
    if (!parse_escape(*buf)) return false;
    chunk_begin = i_;
  }
}

inline bool decoder::read_str(string_ref& out) {
  skip_ws();
  return parse_string(out);
}

inline bool decoder::read_string(std::string& out) {
  string_ref s;
  if (!read_str(s)) return false;
  out.assign(s.view().data(), s.view().size());
  return true;
}

inline bool decoder::read_borrowed_str(std::string_view& out) {
  skip_ws();
  const std::size_t start = i_;
  string_ref s;
  if (!parse_string(s)) return false;
  if (!s.borrowed()) {
    return fail_custom_at("invalid type: escaped string, expected a borrowed string", start);
  }
  out = s.view();
  return true;
}

inline bool decoder::read_char(char32_t& out) {
  skip_ws();
  const std::size_t start = i_;
  string_ref s;
  if (!parse_string(s)) return false;
  const std::string_view v = s.view();
  if (v.empty() || detail::decode_utf8_at(v.data(), v.size(), 0, out) == 0) {
    if (err_) return false;
    fail_at(error_code::unexpected_token, start);
    err_.token = U'"';
    return false;
  }
  return true;
}

inline bool decoder::read_bytes(std::vector<std::byte>& out) {
  skip_ws();
  const std::size_t start = i_;
  string_ref s;
  if (!parse_string(s)) return false;
  if (!detail::base64_decode(s.view(), out)) return fail_at(error_code::invalid_base64, start);
  return true;
}

inline bool decoder::read_unit() {
  skip_ws();
  if (s_.compare(i_, 4, "null") == 0) {
    i_ += 4;
    return true;
  }
  return fail_token();
}

inline bool decoder::peek_null(bool& is_null) {
  skip_ws();
  if (at_end()) return fail(error_code::unexpected_eof);
  is_null = s_[i_] == 'n';
  return true;
}

template <class Fn>
bool decoder::read_seq(Fn&& fn) {
  skip_ws();
  if (at_end()) return fail(error_code::unexpected_eof);
  if (s_[i_] != '[') return fail_token();
  if (!enter()) return false;
  ++i_;

  seq_access seq(*this);
  if (!fn(seq)) return false;
  leave();

  skip_ws();
  return expect(']');
}

template <class Fn>
bool decoder::read_map(Fn&& fn) {
  skip_ws();
  if (at_end()) return fail(error_code::unexpected_eof);
  if (s_[i_] != '{') return fail_token();
  if (!enter()) return false;
  ++i_;

  map_access map(*this);
  if (!fn(map)) return false;
  leave();

  skip_ws();
  return expect('}');
}

template <class Fn>
bool decoder::read_struct(Fn&& on_field) {
  return read_map([&](map_access& map) {
    while (true) {
      bool more = false;
      if (!map.next_key(more)) return false;
      if (!more) return true;
      string_ref key;
      if (!read_str(key)) return false;
      if (!map.next_value()) return false;
      if (!on_field(key.view())) return false;
    }
  });
}

template <class Fn>
bool decoder::read_variant(Fn&& fn) {
  skip_ws();
  if (at_end()) return fail(error_code::unexpected_eof);

  if (s_[i_] == '"') {
    string_ref tag;
    if (!parse_string(tag)) return false;
    variant_access access(*this, false);
    return fn(tag.view(), access);
  }
  if (s_[i_] != '{') return fail_token();
  if (!enter()) return false;
  ++i_;

  string_ref tag;
  if (!read_str(tag)) return false;
  skip_ws();
  if (!expect(':')) return false;

  variant_access access(*this, true);
  if (!fn(tag.view(), access)) return false;
  leave();

  skip_ws();
  return expect('}');
}

template <class K>
bool decoder::read_key(K& out) {
  if constexpr (is_string_like<K>::value) {
    return read(out);
  } else if constexpr (detail::is_wire_integer<K>::value) {
    // Integral keys are quoted regardless of width.
    skip_ws();
    return parse_quoted_integer(out);
  } else {
    return fail_custom("map key must be a string");
  }
}

inline bool decoder::read_value(value& out) {
  skip_ws();
  if (at_end()) return fail(error_code::unexpected_eof);

  const char c = s_[i_];
  switch (c) {
    case 'n':
      out = value();
      return read_unit();
    case 't':
    case 'f': {
      bool b = false;
      if (!read_bool(b)) return false;
      out = value(b);
      return true;
    }
    case '"': {
      string_ref s;
      if (!parse_string(s)) return false;
      out = value(s.str());
      return true;
    }
    case '[': {
      value::array a;
      const bool ok = read_seq([&](seq_access& seq) {
        while (true) {
          bool more = false;
          if (!seq.next(more)) return false;
          if (!more) return true;
          value elem;
          if (!read_value(elem)) return false;
          a.emplace_back(std::move(elem));
        }
      });
      if (!ok) return false;
      out = value(std::move(a));
      return true;
    }
    case '{': {
      value::object o;
      const bool ok = read_map([&](map_access& map) {
        while (true) {
          bool more = false;
          if (!map.next_key(more)) return false;
          if (!more) return true;
          string_ref key;
          if (!read_str(key)) return false;
          if (!map.next_value()) return false;
          value v;
          if (!read_value(v)) return false;
          o.emplace_back(key.str(), std::move(v));
        }
      });
      if (!ok) return false;
      out = value(std::move(o));
      return true;
    }
    default: {
      if (c == '-' || detail::is_digit(c)) {
        double d = 0.0;
        if (!read_float(d)) return false;
        out = value::number(d);
        return true;
      }
      return fail_token();
    }
  }
}

// Consumes exactly one value of any kind without building it.
inline bool decoder::skip_value() {
  skip_ws();
  if (at_end()) return fail(error_code::unexpected_eof);

  const char c = s_[i_];
  switch (c) {
    case 'n': return read_unit();
    case 't':
    case 'f': {
      bool b = false;
      return read_bool(b);
    }
    case '"': {
      string_ref s;
      return parse_string(s);
    }
    case '[':
      return read_seq([&](seq_access& seq) {
        while (true) {
          bool more = false;
          if (!seq.next(more)) return false;
          if (!more) return true;
          if (!skip_value()) return false;
        }
      });
    case '{':
      return read_map([&](map_access& map) {
        while (true) {
          bool more = false;
          if (!map.next_key(more)) return false;
          if (!more) return true;
          string_ref key;
          if (!read_str(key)) return false;
          if (!map.next_value()) return false;
          if (!skip_value()) return false;
        }
      });
    default: {
      if (c == '-' || detail::is_digit(c)) {
        double d = 0.0;
        return read_float(d);
      }
      return fail_token();
    }
  }
}

inline bool seq_access::next(bool& more) {
  decoder& d = *d_;
  d.skip_ws();
  if (d.at_end()) return d.fail(error_code::unexpected_eof);
  if (d.s_[d.i_] == ']') {
    more = false;
    return true;
  }
  if (!first_ && !d.expect(',')) return false;
  first_ = false;
  ++count_;
  more = true;
  return true;
}

template <class T>
bool seq_access::element(T& out) {
  bool more = false;
  if (!next(more)) return false;
  if (!more) {
    return d_->fail_custom("invalid length " + std::to_string(count_) + ", expected more elements");
  }
  return d_->read(out);
}

inline bool seq_access::expect_end() {
  bool more = false;
  if (!next(more)) return false;
  if (more) {
    return d_->fail_custom("invalid length " + std::to_string(count_) + ", expected " + std::to_string(count_ - 1) +
                           " elements");
  }
  return true;
}

inline bool map_access::next_key(bool& more) {
  decoder& d = *d_;
  d.skip_ws();
  if (d.at_end()) return d.fail(error_code::unexpected_eof);
  if (d.s_[d.i_] == '}') {
    more = false;
    return true;
  }
  if (!first_ && !d.expect(',')) return false;
  first_ = false;
  more = true;
  return true;
}

inline bool map_access::next_value() {
  d_->skip_ws();
  return d_->expect(':');
}

inline bool variant_access::unit() {
  if (!has_payload_) return true;
  // A unit variant never carries a payload.
  d_->skip_ws();
  return d_->fail_token();
}

template <class T>
bool variant_access::newtype(T& out) {
  if (!has_payload_) return d_->fail_custom("invalid type: unit variant, expected newtype variant");
  return d_->read(out);
}

template <class Fn>
bool variant_access::tuple(Fn&& fn) {
  if (!has_payload_) return d_->fail_custom("invalid type: unit variant, expected tuple variant");
  return d_->read_seq(std::forward<Fn>(fn));
}

template <class Fn>
bool variant_access::struct_fields(Fn&& on_field) {
  if (!has_payload_) return d_->fail_custom("invalid type: unit variant, expected struct variant");
  return d_->read_struct(std::forward<Fn>(on_field));
}

// -----------------------------
// Encoder
// -----------------------------

class compound;

class encoder {
public:
  explicit encoder(std::string& out) noexcept : out_(&out) {}

  const error& err() const noexcept { return err_; }
  bool failed() const noexcept { return static_cast<bool>(err_); }
  std::string& out() noexcept { return *out_; }

  bool write_bool(bool b) {
    out_->push_back(b ? '1' : '0');
    return true;
  }

  template <class T>
  bool write_integer(T v) {
    static_assert(detail::is_wire_integer<T>::value, "wjson: write_integer needs an integer type");
    if constexpr (detail::is_wide_integer<T>::value) {
      out_->push_back('"');
      detail::append_integer(*out_, v);
      out_->push_back('"');
    } else {
      detail::append_integer(*out_, v);
    }
    return true;
  }

  // Shortest round-trip form. NaN and infinities have no encoding.
  template <class T>
  bool write_float(T v) {
    static_assert(std::is_floating_point<T>::value, "wjson: write_float needs a floating-point type");
    if (!std::isfinite(v)) return fail(error_code::not_a_number);
    char buf[64];
    const auto r = std::to_chars(buf, buf + sizeof(buf), v);
    if (r.ec != std::errc{}) return fail(error_code::not_a_number);
    out_->append(buf, static_cast<std::size_t>(r.ptr - buf));
    return true;
  }

  bool write_char(char32_t c) {
    if (!detail::is_scalar_value(static_cast<std::uint32_t>(c))) {
      return fail_custom("invalid value: character is not a unicode scalar value");
    }
    std::string tmp;
    detail::append_utf8(tmp, static_cast<std::uint32_t>(c));
    return write_str(tmp);
  }

  bool write_str(std::string_view s) {
    detail::write_escaped(*out_, s);
    return true;
  }

  bool write_bytes(const std::byte* data, std::size_t size) {
    out_->push_back('"');
    detail::base64_encode(*out_, data, size);
    out_->push_back('"');
    return true;
  }

  bool write_bytes(const std::vector<std::byte>& bytes) { return write_bytes(bytes.data(), bytes.size()); }

  bool write_unit() {
    out_->append("null", 4);
    return true;
  }

  bool write_none() { return write_unit(); }

  template <class K>
  bool write_key(const K& key);

  template <class T>
  bool write(const T& v) {
    return serializer<T>::encode(*this, v);
  }

  compound begin_seq();
  compound begin_map();
  compound begin_struct();

  bool write_unit_variant(std::string_view tag) { return write_str(tag); }

  template <class T>
  bool write_newtype_variant(std::string_view tag, const T& payload) {
    out_->push_back('{');
    write_str(tag);
    out_->push_back(':');
    if (!write(payload)) return false;
    out_->push_back('}');
    return true;
  }

  compound begin_tuple_variant(std::string_view tag);
  compound begin_struct_variant(std::string_view tag);

  // Position is the output size at the time of failure.
  bool fail(error_code code) {
    if (err_) return false;
    err_.code = code;
    err_.offset = out_->size();
    detail::update_line_col(*out_, err_.offset, err_.line, err_.column);
    return false;
  }

  bool fail_custom(std::string message) {
    if (err_) return false;
    fail(error_code::custom);
    err_.message = std::move(message);
    return false;
  }

private:
  std::string* out_;
  error err_;
};

// One open bracket on the encode side. Writes ',' before every item but the first.
class compound {
public:
  compound(encoder& e, const char* close) noexcept : e_(&e), close_(close) {}

  template <class T>
  bool element(const T& v) {
    comma();
    return e_->write(v);
  }

  template <class K, class V>
  bool entry(const K& key, const V& v) {
    comma();
    if (!e_->write_key(key)) return false;
    e_->out().push_back(':');
    return e_->write(v);
  }

  template <class T>
  bool field(std::string_view name, const T& v) {
    comma();
    e_->write_str(name);
    e_->out().push_back(':');
    return e_->write(v);
  }

  bool end() {
    if (e_->failed()) return false;
    e_->out().append(close_);
    return true;
  }

private:
  void comma() {
    if (!first_) e_->out().push_back(',');
    first_ = false;
  }

  encoder* e_;
  const char* close_;
  bool first_{true};
};

inline compound encoder::begin_seq() {
  out_->push_back('[');
  return compound(*this, "]");
}

inline compound encoder::begin_map() {
  out_->push_back('{');
  return compound(*this, "}");
}

inline compound encoder::begin_struct() { return begin_map(); }

inline compound encoder::begin_tuple_variant(std::string_view tag) {
  out_->push_back('{');
  write_str(tag);
  out_->append(":[", 2);
  return compound(*this, "]}");
}

inline compound encoder::begin_struct_variant(std::string_view tag) {
  out_->push_back('{');
  write_str(tag);
  out_->append(":{", 2);
  return compound(*this, "}}");
}

template <class K>
bool encoder::write_key(const K& key) {
  if constexpr (is_string_like<K>::value) {
    return write(key);
  } else if constexpr (detail::is_wire_integer<K>::value) {
    out_->push_back('"');
    detail::append_integer(*out_, key);
    out_->push_back('"');
    return true;
  } else {
    return fail_custom("key must be a string");
  }
}

// -----------------------------
// Built-in traversal contracts
// -----------------------------

template <>
struct serializer<bool> {
  static bool encode(encoder& e, bool v) { return e.write_bool(v); }
};

template <>
struct deserializer<bool> {
  static bool decode(decoder& d, bool& v) { return d.read_bool(v); }
};

template <class T>
struct serializer<T, typename std::enable_if<detail::is_wire_integer<T>::value>::type> {
  static bool encode(encoder& e, T v) { return e.write_integer(v); }
};

template <class T>
struct deserializer<T, typename std::enable_if<detail::is_wire_integer<T>::value>::type> {
  static bool decode(decoder& d, T& v) { return d.read_integer(v); }
};

template <class T>
struct serializer<T, typename std::enable_if<std::is_floating_point<T>::value>::type> {
  static bool encode(encoder& e, T v) { return e.write_float(v); }
};

template <class T>
struct deserializer<T, typename std::enable_if<std::is_floating_point<T>::value>::type> {
  static bool decode(decoder& d, T& v) { return d.read_float(v); }
};

template <>
struct serializer<char32_t> {
  static bool encode(encoder& e, char32_t c) { return e.write_char(c); }
};

template <>
struct deserializer<char32_t> {
  static bool decode(decoder& d, char32_t& c) { return d.read_char(c); }
};

template <>
struct serializer<std::string> {
  static bool encode(encoder& e, const std::string& s) { return e.write_str(s); }
};

template <>
struct deserializer<std::string> {
  static bool decode(decoder& d, std::string& s) { return d.read_string(s); }
};

template <>
struct serializer<std::string_view> {
  static bool encode(encoder& e, std::string_view s) { return e.write_str(s); }
};

// The view points into the decoder's input.
template <>
struct deserializer<std::string_view> {
  static bool decode(decoder& d, std::string_view& s) { return d.read_borrowed_str(s); }
};

template <>
struct serializer<string_ref> {
  static bool encode(encoder& e, const string_ref& s) { return e.write_str(s.view()); }
};

template <>
struct deserializer<string_ref> {
  static bool decode(decoder& d, string_ref& s) { return d.read_str(s); }
};

template <>
struct serializer<const char*> {
  static bool encode(encoder& e, const char* s) { return e.write_str(s == nullptr ? std::string_view{} : s); }
};

template <std::size_t N>
struct serializer<char[N]> {
  static bool encode(encoder& e, const char (&s)[N]) { return e.write_str(std::string_view(s, N ? N - 1 : 0)); }
};

template <>
struct serializer<std::vector<std::byte>> {
  static bool encode(encoder& e, const std::vector<std::byte>& b) { return e.write_bytes(b); }
};

template <>
struct deserializer<std::vector<std::byte>> {
  static bool decode(decoder& d, std::vector<std::byte>& b) { return d.read_bytes(b); }
};

template <>
struct serializer<std::monostate> {
  static bool encode(encoder& e, std::monostate) { return e.write_unit(); }
};

template <>
struct deserializer<std::monostate> {
  static bool decode(decoder& d, std::monostate&) { return d.read_unit(); }
};

template <>
struct serializer<std::nullptr_t> {
  static bool encode(encoder& e, std::nullptr_t) { return e.write_unit(); }
};

template <>
struct deserializer<std::nullptr_t> {
  static bool decode(decoder& d, std::nullptr_t&) { return d.read_unit(); }
};

// Some(v) is v itself; None is null.
template <class T>
struct serializer<std::optional<T>> {
  static bool encode(encoder& e, const std::optional<T>& v) {
    if (!v) return e.write_none();
    return e.write(*v);
  }
};

template <class T>
struct deserializer<std::optional<T>> {
  static bool decode(decoder& d, std::optional<T>& v) {
    bool is_null = false;
    if (!d.peek_null(is_null)) return false;
    if (is_null) {
      v.reset();
      return d.read_unit();
    }
    T inner{};
    if (!d.read(inner)) return false;
    v = std::move(inner);
    return true;
  }
};

template <class T, class A>
struct serializer<std::vector<T, A>, typename std::enable_if<!std::is_same<T, std::byte>::value>::type> {
  static bool encode(encoder& e, const std::vector<T, A>& v) {
    compound seq = e.begin_seq();
    for (const auto& x : v) {
      if (!seq.element(x)) return false;
    }
    return seq.end();
  }
};

template <class T, class A>
struct deserializer<std::vector<T, A>, typename std::enable_if<!std::is_same<T, std::byte>::value>::type> {
  static bool decode(decoder& d, std::vector<T, A>& v) {
    v.clear();
    return d.read_seq([&](seq_access& seq) {
      while (true) {
        bool more = false;
        if (!seq.next(more)) return false;
        if (!more) return true;
        T x{};
        if (!d.read(x)) return false;
        v.emplace_back(std::move(x));
      }
    });
  }
};

template <class T, std::size_t N>
struct serializer<std::array<T, N>> {
  static bool encode(encoder& e, const std::array<T, N>& a) {
    compound seq = e.begin_seq();
    for (const auto& x : a) {
      if (!seq.element(x)) return false;
    }
    return seq.end();
  }
};

template <class T, std::size_t N>
struct deserializer<std::array<T, N>> {
  static bool decode(decoder& d, std::array<T, N>& a) {
    return d.read_seq([&](seq_access& seq) {
      for (auto& x : a) {
        if (!seq.element(x)) return false;
      }
      return seq.expect_end();
    });
  }
};

template <class A, class B>
struct serializer<std::pair<A, B>> {
  static bool encode(encoder& e, const std::pair<A, B>& p) {
    compound seq = e.begin_seq();
    if (!seq.element(p.first) || !seq.element(p.second)) return false;
    return seq.end();
  }
};

template <class A, class B>
struct deserializer<std::pair<A, B>> {
  static bool decode(decoder& d, std::pair<A, B>& p) {
    return d.read_seq([&](seq_access& seq) {
      if (!seq.element(p.first) || !seq.element(p.second)) return false;
      return seq.expect_end();
    });
  }
};

template <class... Ts>
struct serializer<std::tuple<Ts...>> {
  static bool encode(encoder& e, const std::tuple<Ts...>& t) {
    compound seq = e.begin_seq();
    const bool ok = std::apply([&](const auto&... xs) { return (seq.element(xs) && ...); }, t);
    if (!ok) return false;
    return seq.end();
  }
};

template <class... Ts>
struct deserializer<std::tuple<Ts...>> {
  static bool decode(decoder& d, std::tuple<Ts...>& t) {
    return d.read_seq([&](seq_access& seq) {
      const bool ok = std::apply([&](auto&... xs) { return (seq.element(xs) && ...); }, t);
      if (!ok) return false;
      return seq.expect_end();
    });
  }
};

namespace detail {

template <class M>
inline bool encode_map(encoder& e, const M& m) {
  compound map = e.begin_map();
  for (const auto& kv : m) {
    if (!map.entry(kv.first, kv.second)) return false;
  }
  return map.end();
}

// Later duplicates replace earlier ones.
template <class M>
inline bool decode_map(decoder& d, M& m) {
  using key_type = typename M::key_type;
  using mapped_type = typename M::mapped_type;
  m.clear();
  return d.read_map([&](map_access& map) {
    while (true) {
      bool more = false;
      if (!map.next_key(more)) return false;
      if (!more) return true;
      key_type k{};
      if (!d.read_key(k)) return false;
      if (!map.next_value()) return false;
      mapped_type v{};
      if (!d.read(v)) return false;
      m.insert_or_assign(std::move(k), std::move(v));
    }
  });
}

} // namespace detail

template <class K, class V, class C, class A>
struct serializer<std::map<K, V, C, A>> {
  static bool encode(encoder& e, const std::map<K, V, C, A>& m) { return detail::encode_map(e, m); }
};

template <class K, class V, class C, class A>
struct deserializer<std::map<K, V, C, A>> {
  static bool decode(decoder& d, std::map<K, V, C, A>& m) { return detail::decode_map(d, m); }
};

template <class K, class V, class H, class E, class A>
struct serializer<std::unordered_map<K, V, H, E, A>> {
  static bool encode(encoder& e, const std::unordered_map<K, V, H, E, A>& m) { return detail::encode_map(e, m); }
};

template <class K, class V, class H, class E, class A>
struct deserializer<std::unordered_map<K, V, H, E, A>> {
  static bool decode(decoder& d, std::unordered_map<K, V, H, E, A>& m) { return detail::decode_map(d, m); }
};

template <>
struct serializer<value> {
  static bool encode(encoder& e, const value& v) {
    switch (v.type()) {
      case value::kind::null: return e.write_unit();
      case value::kind::boolean: return e.write_bool(v.as_bool());
      case value::kind::number: return e.write_float(v.as_double());
      case value::kind::string: return e.write_str(v.as_string());
      case value::kind::array: {
        compound seq = e.begin_seq();
        for (const auto& x : v.as_array()) {
          if (!seq.element(x)) return false;
        }
        return seq.end();
      }
      case value::kind::object: {
        compound map = e.begin_map();
        for (const auto& kv : v.as_object()) {
          if (!map.entry(kv.first, kv.second)) return false;
        }
        return map.end();
      }
    }
    return e.fail_custom("invalid value kind");
  }
};

template <>
struct deserializer<value> {
  static bool decode(decoder& d, value& v) { return d.read_value(v); }
};

// -----------------------------
// Top-level API
// -----------------------------

template <class T>
struct decode_result {
  T val{};
  error err{};
};

struct encode_result {
  std::string out{};
  error err{};
};

template <class T>
inline error decode_into(T& out, std::string_view text, const decode_options& opt = {}) {
  decoder d(text, opt);
  if (!d.read(out)) {
    // A contract returned false without reporting why.
    if (!d.failed()) d.fail_custom("deserializer failed without an error");
    return d.err();
  }
  if (!d.finish()) return d.err();
  return error{};
}

template <class T>
inline decode_result<T> decode(std::string_view text, const decode_options& opt = {}) {
  decode_result<T> r;
  r.err = decode_into(r.val, text, opt);
  return r;
}

// Validates UTF-8 before decoding raw bytes.
template <class T>
inline decode_result<T> decode_utf8(const void* data, std::size_t size, const decode_options& opt = {}) {
  decode_result<T> r;
  const char* p = static_cast<const char*>(data);
  std::size_t bad_at = 0;
  if (!detail::validate_utf8(p, size, bad_at)) {
    r.err.code = error_code::invalid_utf8;
    r.err.offset = bad_at;
    detail::update_line_col(std::string_view(p, size), bad_at, r.err.line, r.err.column);
    return r;
  }
  r.err = decode_into(r.val, std::string_view(p, size), opt);
  return r;
}

template <class T>
inline T decode_or_throw(std::string_view text, const decode_options& opt = {}) {
  auto r = decode<T>(text, opt);
  if (r.err) throw exception(r.err);
  return std::move(r.val);
}

// Appends to `out`. On failure `out` holds a truncated document.
template <class T>
inline error encode_to(std::string& out, const T& v) {
  encoder e(out);
  if (!e.write(v) && !e.failed()) e.fail_custom("serializer failed without an error");
  return e.err();
}

template <class T>
inline encode_result encode(const T& v) {
  static thread_local std::size_t reserve_hint = 256;
  encode_result r;
  r.out.reserve(reserve_hint);
  r.err = encode_to(r.out, v);
  if (!r.err) {
    reserve_hint = std::max<std::size_t>(256, std::min<std::size_t>(r.out.size() + r.out.size() / 4, 1u << 20));
  }
  return r;
}

template <class T>
inline std::string encode_or_throw(const T& v) {
  auto r = encode(v);
  if (r.err) throw exception(r.err);
  return std::move(r.out);
}

} // namespace wjson
