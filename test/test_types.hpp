#pragma once

#include "test_common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wjson_test {

// {"int":1,"seq":["a","b"]}
struct record {
  std::uint32_t num{0};
  std::vector<std::string> seq;

  bool operator==(const record& o) const { return num == o.num && seq == o.seq; }
};

// "Unit" | {"Newtype":a} | {"Tuple":[a,b]} | {"Struct":{"a":a}}
struct shape {
  enum class kind { unit, newtype, tuple, fields };

  kind k{kind::unit};
  std::uint32_t a{0};
  std::uint32_t b{0};

  static shape unit() { return shape{}; }
  static shape newtype(std::uint32_t a) { return shape{kind::newtype, a, 0}; }
  static shape tuple(std::uint32_t a, std::uint32_t b) { return shape{kind::tuple, a, b}; }
  static shape fields(std::uint32_t a) { return shape{kind::fields, a, 0}; }

  bool operator==(const shape& o) const { return k == o.k && a == o.a && b == o.b; }
};

// Optional field, borrowed name.
struct profile {
  std::string_view name;
  std::optional<std::uint64_t> id;
  double score{0.0};
};

} // namespace wjson_test

namespace wjson {

template <>
struct serializer<wjson_test::record> {
  static bool encode(encoder& e, const wjson_test::record& r) {
    compound s = e.begin_struct();
    if (!s.field("int", r.num) || !s.field("seq", r.seq)) return false;
    return s.end();
  }
};

template <>
struct deserializer<wjson_test::record> {
  static bool decode(decoder& d, wjson_test::record& r) {
    bool has_int = false;
    bool has_seq = false;
    const bool ok = d.read_struct([&](std::string_view key) {
      if (key == "int") {
        has_int = true;
        return d.read(r.num);
      }
      if (key == "seq") {
        has_seq = true;
        return d.read(r.seq);
      }
      return d.skip_value();
    });
    if (!ok) return false;
    if (!has_int) return d.fail_missing_field("int");
    if (!has_seq) return d.fail_missing_field("seq");
    return true;
  }
};

template <>
struct serializer<wjson_test::shape> {
  static bool encode(encoder& e, const wjson_test::shape& s) {
    using kind = wjson_test::shape::kind;
    switch (s.k) {
      case kind::unit: return e.write_unit_variant("Unit");
      case kind::newtype: return e.write_newtype_variant("Newtype", s.a);
      case kind::tuple: {
        compound t = e.begin_tuple_variant("Tuple");
        if (!t.element(s.a) || !t.element(s.b)) return false;
        return t.end();
      }
      case kind::fields: {
        compound f = e.begin_struct_variant("Struct");
        if (!f.field("a", s.a)) return false;
        return f.end();
      }
    }
    return e.fail_custom("bad shape");
  }
};

template <>
struct deserializer<wjson_test::shape> {
  static bool decode(decoder& d, wjson_test::shape& s) {
    using kind = wjson_test::shape::kind;
    return d.read_variant([&](std::string_view tag, variant_access& v) {
      if (tag == "Unit") {
        s = wjson_test::shape::unit();
        return v.unit();
      }
      if (tag == "Newtype") {
        s.k = kind::newtype;
        return v.newtype(s.a);
      }
      if (tag == "Tuple") {
        s.k = kind::tuple;
        return v.tuple([&](seq_access& seq) { return seq.element(s.a) && seq.element(s.b) && seq.expect_end(); });
      }
      if (tag == "Struct") {
        s.k = kind::fields;
        bool has_a = false;
        const bool ok = v.struct_fields([&](std::string_view key) {
          if (key == "a") {
            has_a = true;
            return d.read(s.a);
          }
          return d.skip_value();
        });
        if (!ok) return false;
        return has_a || d.fail_missing_field("a");
      }
      return d.fail_unknown_variant(tag);
    });
  }
};

template <>
struct serializer<wjson_test::profile> {
  static bool encode(encoder& e, const wjson_test::profile& p) {
    compound s = e.begin_struct();
    if (!s.field("name", p.name) || !s.field("id", p.id) || !s.field("score", p.score)) return false;
    return s.end();
  }
};

template <>
struct deserializer<wjson_test::profile> {
  static bool decode(decoder& d, wjson_test::profile& p) {
    return d.read_struct([&](std::string_view key) {
      if (key == "name") return d.read(p.name);
      if (key == "id") return d.read(p.id);
      if (key == "score") return d.read(p.score);
      return d.fail_unknown_field(key);
    });
  }
};

} // namespace wjson
