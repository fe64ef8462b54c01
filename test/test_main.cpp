#include "test_types.hpp"

#include <iostream>
#include <string>

void test_errors();
void test_numbers();
void test_strings();
void test_structure();
void test_variants();
void test_bytes();
void test_value();
void test_random();

using namespace wjson;
using wjson_test::record;
using wjson_test::shape;

static void test_record_roundtrip() {
  const record expected{1, {"a", "b"}};

  auto r = decode<record>(R"({"int":1,"seq":["a","b"]})");
  WJSON_CHECK_OK(r.err);
  WJSON_CHECK(r.val == expected);

  auto out = encode(expected);
  WJSON_CHECK_OK(out.err);
  WJSON_CHECK(out.out == R"({"int":1,"seq":["a","b"]})");
}

static void test_shape_smoke() {
  {
    auto r = decode<shape>(R"("Unit")");
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val == shape::unit());
  }
  {
    auto r = decode<shape>(R"({"Tuple":[1,2]})");
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val == shape::tuple(1, 2));
  }
  WJSON_CHECK(encode_or_throw(shape::newtype(1)) == R"({"Newtype":1})");
}

static void test_throwing_helpers() {
  WJSON_CHECK(decode_or_throw<bool>("1") == true);
  WJSON_EXPECT_THROW(decode_or_throw<bool>("2"));
  WJSON_EXPECT_THROW(encode_or_throw(std::numeric_limits<double>::infinity()));

  try {
    (void)decode_or_throw<record>(R"({"int":1})");
    WJSON_CHECK(false);
  } catch (const wjson::exception& e) {
    WJSON_CHECK(e.err().code == error_code::custom);
    WJSON_CHECK(e.err().message == "missing field `seq`");
    WJSON_CHECK(std::string(e.what()).find("missing field `seq`") != std::string::npos);
  }
}

int main() {
  test_record_roundtrip();
  test_shape_smoke();
  test_throwing_helpers();

  test_errors();
  test_numbers();
  test_strings();
  test_structure();
  test_variants();
  test_bytes();
  test_value();
  test_random();

  std::cout << "wjson tests passed\n";
  return 0;
}
