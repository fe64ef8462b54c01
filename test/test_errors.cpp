#include "test_types.hpp"

#include <string>
#include <vector>

using namespace wjson;
using wjson_test::record;

static void test_common_syntax_errors() {
  {
    auto r = decode<record>(R"({"int":1,})");
    wjson_test::check_err(r.err, error_code::unexpected_token);
    WJSON_CHECK(r.err.token == U'}');
    WJSON_CHECK(r.err.offset == 9);
  }
  {
    auto r = decode<record>(R"({"int":1,"seq":["a","b"])");
    wjson_test::check_err(r.err, error_code::unexpected_eof);
  }
  {
    auto r = decode<std::vector<int>>("[1 2]");
    wjson_test::check_err(r.err, error_code::unexpected_token);
    WJSON_CHECK(r.err.token == U'2');
  }
  {
    auto r = decode<std::string>("\"unterminated");
    wjson_test::check_err(r.err, error_code::unexpected_eof);
  }
  {
    auto r = decode<std::vector<int>>("");
    wjson_test::check_err(r.err, error_code::unexpected_eof);
    WJSON_CHECK(r.err.offset == 0);
  }
  {
    // Multi-byte offending characters are reported whole.
    auto r = decode<std::vector<int>>("\xC3\xA9");
    wjson_test::check_err(r.err, error_code::unexpected_token);
    WJSON_CHECK(r.err.token == U'é');
  }
}

static void test_error_line_column_tracking() {
  const char* text = "{\n  \"int\": 1,\n  \"seq\": [\"a\", 2]\n}";
  auto r = decode<record>(text);
  wjson_test::check_err(r.err, error_code::unexpected_token);
  WJSON_CHECK(r.err.offset < std::strlen(text));
  WJSON_CHECK(r.err.line == 3);
  WJSON_CHECK(r.err.column == 16);
}

static void test_unicode_escape_errors() {
  {
    auto r = decode<std::string>(R"("\u12G4")");
    wjson_test::check_err(r.err, error_code::invalid_unicode_escape);
    WJSON_CHECK(r.err.offset == 5);
  }
  {
    auto r = decode<std::string>(R"("\u12")");
    WJSON_CHECK(r.err);
  }
  {
    auto r = decode<std::string>(R"("\uDC00")");
    wjson_test::check_err(r.err, error_code::unexpected_unicode_escape);
    WJSON_CHECK(r.err.code_point == 0xDC00u);
    WJSON_CHECK(r.err.offset == 1);
  }
  {
    auto r = decode<std::string>(R"("\uD800x")");
    wjson_test::check_err(r.err, error_code::unexpected_unicode_escape);
    WJSON_CHECK(r.err.code_point == 0xD800u);
  }
  {
    auto r = decode<std::string>(R"("\uD800A")");
    wjson_test::check_err(r.err, error_code::unexpected_unicode_escape);
    WJSON_CHECK(r.err.code_point == 0xD800u);
  }
  {
    auto r = decode<std::string>(R"("\q")");
    wjson_test::check_err(r.err, error_code::unexpected_token);
    WJSON_CHECK(r.err.token == U'q');
  }
}

static void test_numeric_errors() {
  {
    auto r = decode<int>("abc");
    wjson_test::check_err(r.err, error_code::invalid_integer);
    WJSON_CHECK(r.err.num_ec == std::errc::invalid_argument);
  }
  {
    auto r = decode<std::uint8_t>("300");
    wjson_test::check_err(r.err, error_code::invalid_integer);
    WJSON_CHECK(r.err.num_ec == std::errc::result_out_of_range);
  }
  {
    auto r = decode<std::uint32_t>("-1");
    wjson_test::check_err(r.err, error_code::invalid_integer);
  }
  {
    auto r = decode<std::uint64_t>(R"("18446744073709551616")");
    wjson_test::check_err(r.err, error_code::invalid_integer);
    WJSON_CHECK(r.err.num_ec == std::errc::result_out_of_range);
    WJSON_CHECK(r.err.offset == 0);
  }
  {
    auto r = decode<double>("1.2.3");
    wjson_test::check_err(r.err, error_code::invalid_float);
    WJSON_CHECK(r.err.num_ec == std::errc::invalid_argument);
  }
  {
    auto r = decode<float>("true");
    wjson_test::check_err(r.err, error_code::invalid_float);
  }
}

static void test_encode_errors() {
  {
    auto r = encode(std::numeric_limits<double>::quiet_NaN());
    wjson_test::check_err(r.err, error_code::not_a_number);
    WJSON_CHECK(r.err.offset == 0);
  }
  {
    auto r = encode(std::vector<double>{1.0, -std::numeric_limits<double>::infinity()});
    wjson_test::check_err(r.err, error_code::not_a_number);
    WJSON_CHECK(r.err.offset == 3);
  }
  {
    auto r = encode(std::numeric_limits<float>::infinity());
    wjson_test::check_err(r.err, error_code::not_a_number);
  }
  {
    auto r = encode(static_cast<char32_t>(0xD800));
    wjson_test::check_err(r.err, error_code::custom);
  }
  {
    std::map<double, int> m{{1.5, 1}};
    auto r = encode(m);
    wjson_test::check_err(r.err, error_code::custom);
    WJSON_CHECK(r.err.message == "key must be a string");
  }
}

static void test_limits_and_trailing_input() {
  {
    const std::string deep(200, '[');
    auto r = decode<value>(deep);
    wjson_test::check_err(r.err, error_code::nesting_too_deep);
    WJSON_CHECK(r.err.offset == WJSON_DEFAULT_MAX_DEPTH);
  }
  {
    decode_options opt;
    opt.max_depth = 2;
    WJSON_CHECK_OK(decode<value>("[[1]]", opt).err);
    wjson_test::check_err(decode<value>("[[[1]]]", opt).err, error_code::nesting_too_deep);
    wjson_test::check_err(decode<value>(R"({"a":{"b":{}}})", opt).err, error_code::nesting_too_deep);
  }
  {
    auto r = decode<int>("1 x");
    wjson_test::check_err(r.err, error_code::trailing_characters);
    WJSON_CHECK(r.err.offset == 2);
  }
  {
    decode_options opt;
    opt.require_eof = false;
    auto r = decode<int>("1 x", opt);
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val == 1);
  }
}

static void test_utf8_validation() {
  const char bad[] = "\"a\xFF\"";
  auto r = decode_utf8<std::string>(bad, sizeof(bad) - 1);
  wjson_test::check_err(r.err, error_code::invalid_utf8);
  WJSON_CHECK(r.err.offset == 2);

  const char good[] = "\"\xE2\x82\xAC\"";
  auto g = decode_utf8<std::string>(good, sizeof(good) - 1);
  WJSON_CHECK_OK(g.err);
  WJSON_CHECK(g.val == "\xE2\x82\xAC");
}

static void test_custom_errors_and_describe() {
  {
    auto r = decode<record>(R"({"seq":[]})");
    wjson_test::check_err(r.err, error_code::custom);
    WJSON_CHECK(r.err.message == "missing field `int`");
  }
  {
    auto r = decode<std::vector<int>>("[1 2]");
    WJSON_CHECK(describe(r.err) == "unexpected token '2' at offset 3 (line 1, column 4)");
  }
  {
    auto r = decode<std::string>(R"("\uDFFF")");
    WJSON_CHECK(describe(r.err) == "unexpected unicode escape sequence U+DFFF at offset 1 (line 1, column 2)");
  }
  WJSON_CHECK(std::string(to_string(error_code::invalid_base64)) == "base64 decode error");
  WJSON_CHECK(std::string(to_string(error_code::ok)) == "ok");
}

static void test_first_error_wins() {
  decoder d("[1,2]");
  WJSON_CHECK(!d.failed());
  WJSON_CHECK(!d.fail(error_code::unexpected_eof));
  WJSON_CHECK(!d.fail_custom("later"));
  WJSON_CHECK(d.err().code == error_code::unexpected_eof);
  WJSON_CHECK(d.err().message.empty());

  std::string out;
  encoder e(out);
  WJSON_CHECK(!e.write_float(std::numeric_limits<double>::infinity()));
  WJSON_CHECK(!e.fail_custom("later"));
  WJSON_CHECK(e.err().code == error_code::not_a_number);
}

void test_errors() {
  test_common_syntax_errors();
  test_error_line_column_tracking();
  test_unicode_escape_errors();
  test_numeric_errors();
  test_encode_errors();
  test_limits_and_trailing_input();
  test_utf8_validation();
  test_custom_errors_and_describe();
  test_first_error_wins();
}
