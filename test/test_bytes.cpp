#include "test_common.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

using namespace wjson;

static std::vector<std::byte> to_bytes(std::string_view s) {
  std::vector<std::byte> out;
  for (const char c : s) out.push_back(static_cast<std::byte>(static_cast<unsigned char>(c)));
  return out;
}

static void test_url_safe_base64() {
  const auto b = to_bytes("bytes test");
  {
    auto e = encode(b);
    WJSON_CHECK_OK(e.err);
    WJSON_CHECK(e.out == R"("Ynl0ZXMgdGVzdA==")");
  }
  {
    // '-' and '_' replace '+' and '/'.
    const std::vector<std::byte> raw{std::byte{0xFB}, std::byte{0xFF}, std::byte{0xFE}};
    auto e = encode(raw);
    WJSON_CHECK(e.out == R"("-__-")");
    auto r = decode<std::vector<std::byte>>(e.out);
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val == raw);
  }
  WJSON_CHECK(encode(std::vector<std::byte>{}).out == R"("")");
}

static void test_padding_is_optional_on_decode() {
  const auto expected = to_bytes("bytes test");
  for (const char* s : {R"("Ynl0ZXMgdGVzdA==")", R"("Ynl0ZXMgdGVzdA")"}) {
    auto r = decode<std::vector<std::byte>>(s);
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val == expected);
  }
  {
    auto r = decode<std::vector<std::byte>>(R"("aQ==")");
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val == to_bytes("i"));
  }
  {
    auto r = decode<std::vector<std::byte>>(R"("")");
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val.empty());
  }
}

static void test_malformed_base64() {
  const char* bad[] = {
      R"("+/8=")",   // standard alphabet
      R"("a")",      // impossible length
      R"("ab=")",    // short padding
      R"("ab")",     // non-zero trailing bits
      R"("Yn l0")",  // foreign character
      R"("Ynl0===")",
  };
  for (const char* s : bad) {
    auto r = decode<std::vector<std::byte>>(s);
    wjson_test::check_err(r.err, error_code::invalid_base64);
  }
  {
    auto r = decode<std::vector<std::byte>>(R"(  "a")");
    wjson_test::check_err(r.err, error_code::invalid_base64);
    WJSON_CHECK(r.err.offset == 2);
  }
  // Still a string first.
  wjson_test::check_err(decode<std::vector<std::byte>>("[1,2]").err, error_code::unexpected_token);
}

static void test_bytes_inside_structures() {
  std::map<std::string, std::vector<std::byte>> m;
  m["b"] = to_bytes("bytes test");
  auto e = encode(m);
  WJSON_CHECK_OK(e.err);
  WJSON_CHECK(e.out == R"({"b":"Ynl0ZXMgdGVzdA=="})");

  auto r = decode<std::map<std::string, std::vector<std::byte>>>(e.out);
  WJSON_CHECK_OK(r.err);
  WJSON_CHECK(r.val == m);

  // Byte strings are distinct from sequences of small integers.
  WJSON_CHECK(encode(std::vector<std::uint8_t>{1, 2}).out == "[1,2]");
}

static void test_every_tail_length() {
  std::vector<std::byte> b;
  for (unsigned i = 0; i < 7; ++i) {
    auto e = encode(b);
    WJSON_CHECK_OK(e.err);
    WJSON_CHECK((e.out.size() - 2) % 4 == 0);
    auto r = decode<std::vector<std::byte>>(e.out);
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val == b);
    b.push_back(static_cast<std::byte>(0xA0u + i * 7u));
  }
}

void test_bytes() {
  test_url_safe_base64();
  test_padding_is_optional_on_decode();
  test_malformed_base64();
  test_bytes_inside_structures();
  test_every_tail_length();
}
