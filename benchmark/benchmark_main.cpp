#include <wjson/wjson.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

using clock_type = std::chrono::high_resolution_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

struct item {
  std::uint64_t id{0};
  bool ok{false};
  std::string name;
  double val{0.0};
  std::vector<std::byte> blob;
};

// Same fields, with the name borrowed from the input.
struct item_view {
  std::uint64_t id{0};
  bool ok{false};
  wjson::string_ref name;
  double val{0.0};
  std::vector<std::byte> blob;
};

template <class Item>
bool decode_item(wjson::decoder& d, Item& it) {
  return d.read_struct([&](std::string_view key) {
    if (key == "id") return d.read(it.id);
    if (key == "ok") return d.read(it.ok);
    if (key == "name") return d.read(it.name);
    if (key == "val") return d.read(it.val);
    if (key == "blob") return d.read(it.blob);
    return d.skip_value();
  });
}

} // namespace

namespace wjson {

template <>
struct serializer<item> {
  static bool encode(encoder& e, const item& it) {
    compound s = e.begin_struct();
    if (!s.field("id", it.id) || !s.field("ok", it.ok) || !s.field("name", it.name) || !s.field("val", it.val) ||
        !s.field("blob", it.blob)) {
      return false;
    }
    return s.end();
  }
};

template <>
struct deserializer<item> {
  static bool decode(decoder& d, item& it) { return decode_item(d, it); }
};

template <>
struct deserializer<item_view> {
  static bool decode(decoder& d, item_view& it) { return decode_item(d, it); }
};

} // namespace wjson

namespace {

std::vector<item> make_items(std::size_t n_items, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::vector<item> items(n_items);
  for (std::size_t i = 0; i < n_items; ++i) {
    item& it = items[i];
    it.id = static_cast<std::uint64_t>(i) * 2654435761u;
    it.ok = (i % 2) == 0;
    for (std::size_t k = 0; k < str_len; ++k) {
      // Mostly plain ASCII so the borrowed path dominates.
      it.name.push_back(static_cast<char>(ch(rng)));
    }
    if ((i % 16) == 0) it.name += "\n\xE4\xBD\xA0\"";
    it.val = (i % 3 == 0) ? 3.141592653589793 : 1e-10 * static_cast<double>(i);
    it.blob.resize(i % 24);
    for (auto& b : it.blob) b = static_cast<std::byte>(rng() & 0xFFu);
  }
  return items;
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<double> secs;
  secs.reserve(runs);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < runs; ++r) {
    const auto br = fn();
    secs.push_back(br.seconds);
    bytes = br.bytes;
  }
  std::nth_element(secs.begin(), secs.begin() + (secs.size() / 2), secs.end());
  return {secs[secs.size() / 2], bytes};
}

bench_result bench_encode(const std::vector<item>& items, std::size_t iters) {
  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = wjson::encode(items);
    bytes += r.out.size();
    do_not_optimize(r.out.size());
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, bytes};
}

template <class T>
bench_result bench_decode(std::string_view text, std::size_t iters) {
  const auto t0 = clock_type::now();
  for (std::size_t i = 0; i < iters; ++i) {
    auto r = wjson::decode<T>(text);
    do_not_optimize(r.err.code);
  }
  const auto t1 = clock_type::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();
  return {sec, text.size() * iters};
}

void print_mbps(const char* name, const bench_result& r) {
  const double mb = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mbps = (r.seconds > 0.0) ? (mb / r.seconds) : 0.0;
  std::cout << name << ": " << mbps << " MiB/s (" << r.seconds << " s)" << "\n";
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_items = 2000;
  std::size_t str_len = 24;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_items = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::vector<item> items = make_items(n_items, str_len);
  auto encoded = wjson::encode(items);
  if (encoded.err) {
    std::cerr << "payload encode failed: " << wjson::describe(encoded.err) << "\n";
    return 1;
  }
  const std::string& payload = encoded.out;
  std::cout << "payload bytes: " << payload.size() << "\n";

  // Warm-up and sanity check.
  {
    auto r = wjson::decode<std::vector<item>>(payload);
    if (r.err || r.val.size() != items.size()) {
      std::cerr << "payload decode failed: " << wjson::describe(r.err) << "\n";
      return 1;
    }
  }

  print_mbps("encode(typed)", run_median(runs, [&] { return bench_encode(items, iters); }));
  print_mbps("decode(typed)", run_median(runs, [&] { return bench_decode<std::vector<item>>(payload, iters); }));
  print_mbps("decode(borrowed)", run_median(runs, [&] { return bench_decode<std::vector<item_view>>(payload, iters); }));
  print_mbps("decode(value)", run_median(runs, [&] { return bench_decode<wjson::value>(payload, iters); }));

  return 0;
}
