#include "test_common.hpp"

#include <string>

using namespace wjson;

static void test_polymorphic_dispatch() {
  const char* text = R"(
  {
    "a": [1, -2.5, 3e2],
    "b": {"x": true, "y": null, "z": false},
    "s": "ok\n"
  }
  )";

  auto r = decode<value>(text);
  WJSON_CHECK_OK(r.err);
  WJSON_CHECK(r.val.is_object());
  WJSON_CHECK(r.val.type() == value::kind::object);

  const value* a = r.val.find("a");
  WJSON_CHECK(a && a->is_array());
  WJSON_CHECK(a->as_array().size() == 3);
  WJSON_CHECK(a->as_array()[0].as_double() == 1.0);
  WJSON_CHECK(a->as_array()[1].as_double() == -2.5);
  WJSON_CHECK(a->as_array()[2].as_double() == 300.0);

  const value* b = r.val.find("b");
  WJSON_CHECK(b && b->is_object());
  const value* x = b->find("x");
  const value* y = b->find("y");
  const value* z = b->find("z");
  WJSON_CHECK(x && x->is_bool() && x->as_bool() == true);
  WJSON_CHECK(y && y->is_null());
  WJSON_CHECK(z && z->is_bool() && z->as_bool() == false);
  WJSON_CHECK(b->find("missing") == nullptr);

  const value* s = r.val.find("s");
  WJSON_CHECK(s && s->is_string() && s->as_string() == "ok\n");
}

static void test_encode_follows_wire_table() {
  value::object o;
  o.emplace_back("t", value(true));
  o.emplace_back("n", value::number(0.5));
  o.emplace_back("s", value("q\""));
  o.emplace_back("nil", value());
  o.emplace_back("arr", value(value::array{value(false), value::number(-1)}));
  const value v(std::move(o));

  auto e = encode(v);
  WJSON_CHECK_OK(e.err);
  // Insertion order is kept and booleans become 1/0.
  WJSON_CHECK(e.out == R"({"t":1,"n":0.5,"s":"q\"","nil":null,"arr":[0,-1]})");
}

static void test_boolean_asymmetry() {
  // 1/0 are numbers to the polymorphic reader; only true/false dispatch as booleans.
  auto e = encode(value(true));
  WJSON_CHECK(e.out == "1");
  auto r = decode<value>(e.out);
  WJSON_CHECK_OK(r.err);
  WJSON_CHECK(r.val.is_number() && r.val.as_double() == 1.0);
}

static void test_duplicate_keys_find_first() {
  auto r = decode<value>(R"({"k":1,"k":2})");
  WJSON_CHECK_OK(r.err);
  WJSON_CHECK(r.val.as_object().size() == 2);
  const value* k = r.val.find("k");
  WJSON_CHECK(k && k->as_double() == 1.0);
}

static void test_value_errors() {
  wjson_test::check_err(encode(value::number(std::numeric_limits<double>::quiet_NaN())).err,
                        error_code::not_a_number);
  wjson_test::check_err(decode<value>("nope").err, error_code::unexpected_token);
  wjson_test::check_err(decode<value>("]").err, error_code::unexpected_token);
  wjson_test::check_err(decode<value>("[1,]").err, error_code::unexpected_token);
  wjson_test::check_err(decode<value>("").err, error_code::unexpected_eof);
  wjson_test::check_err(decode<value>("+1").err, error_code::unexpected_token);
  {
    // null into a float is NaN, but into a dynamic value it is null.
    auto r = decode<value>("null");
    WJSON_CHECK_OK(r.err);
    WJSON_CHECK(r.val.is_null());
  }
}

static void test_mutation() {
  auto r = decode<value>(R"({"a":[]})");
  WJSON_CHECK_OK(r.err);
  value* a = r.val.find("a");
  WJSON_CHECK(a != nullptr);
  a->as_array().push_back(value("x"));
  r.val.as_object().emplace_back("b", value::number(2));
  WJSON_CHECK(encode(r.val).out == R"({"a":["x"],"b":2})");
}

void test_value() {
  test_polymorphic_dispatch();
  test_encode_follows_wire_table();
  test_boolean_asymmetry();
  test_duplicate_keys_find_first();
  test_value_errors();
  test_mutation();
}
