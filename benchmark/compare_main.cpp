#include <wjson/wjson.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <algorithm>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// nlohmann/json
#include <nlohmann/json.hpp>

// jsoncpp
#include <json/json.h>

// RapidJSON
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

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

// Every field stays in the part of the wire format that is also plain JSON:
// narrow integers, 1/0 booleans, strings and finite floats.
struct row {
  std::uint32_t id{0};
  bool ok{false};
  std::string name;
  double val{0.0};
};

} // namespace

namespace wjson {

template <>
struct serializer<row> {
  static bool encode(encoder& e, const row& r) {
    compound s = e.begin_struct();
    if (!s.field("id", r.id) || !s.field("ok", r.ok) || !s.field("name", r.name) || !s.field("val", r.val)) {
      return false;
    }
    return s.end();
  }
};

template <>
struct deserializer<row> {
  static bool decode(decoder& d, row& r) {
    return d.read_struct([&](std::string_view key) {
      if (key == "id") return d.read(r.id);
      if (key == "ok") return d.read(r.ok);
      if (key == "name") return d.read(r.name);
      if (key == "val") return d.read(r.val);
      return d.skip_value();
    });
  }
};

} // namespace wjson

namespace {

std::string encode_or_die(const wjson::encode_result& r) {
  if (r.err) {
    std::cerr << "payload encode failed: " << wjson::describe(r.err) << "\n";
    std::exit(1);
  }
  return r.out;
}

std::string make_rows_payload(std::size_t n_rows, std::size_t str_len) {
  std::mt19937_64 rng(1234567);
  std::uniform_int_distribution<int> ch('a', 'z');

  std::vector<row> rows(n_rows);
  for (std::size_t i = 0; i < n_rows; ++i) {
    row& r = rows[i];
    r.id = static_cast<std::uint32_t>(i);
    r.ok = (i % 2) == 0;
    for (std::size_t k = 0; k < str_len; ++k) r.name.push_back(static_cast<char>(ch(rng)));
    if ((i % 16) == 0) r.name += "\n\xE4\xBD\xA0\xE5\xA5\xBD";
    r.val = (i % 3 == 0) ? 3.141592653589793 : 1e-10;
  }
  return encode_or_die(wjson::encode(rows));
}

std::string make_numbers_payload(std::size_t n_numbers) {
  static constexpr double pool[] = {3.141592653589793, -0.000000000123456789, 1.234567890123456e-200,
                                    2.2250738585072014e-308};
  std::vector<double> v(n_numbers);
  for (std::size_t i = 0; i < n_numbers; ++i) v[i] = pool[i & 3u];
  return encode_or_die(wjson::encode(v));
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

// `body` runs one iteration and returns the bytes it processed.
template <class Fn>
bench_result time_iters(std::size_t iters, Fn&& body) {
  const auto t0 = clock_type::now();
  std::size_t bytes = 0;
  for (std::size_t i = 0; i < iters; ++i) bytes += body();
  const auto t1 = clock_type::now();
  return {std::chrono::duration<double>(t1 - t0).count(), bytes};
}

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

void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  const double mibps = (r.seconds > 0.0) ? (mib / r.seconds) : 0.0;
  std::cout << name << ": " << mibps << " MiB/s (" << r.seconds << " s)" << "\n";
}

struct competitors {
  nlohmann::json nlohmann_doc;
  Json::Value jsoncpp_doc;
  rapidjson::Document rapidjson_doc;
};

std::unique_ptr<Json::CharReader> strict_jsoncpp_reader() {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = true;
  return std::unique_ptr<Json::CharReader>(builder.newCharReader());
}

bool jsoncpp_parse(std::string_view text, Json::Value& root) {
  std::string errs;
  const auto reader = strict_jsoncpp_reader();
  return reader->parse(text.data(), text.data() + text.size(), &root, &errs);
}

// Loads `text` into every competitor once; doubles as the warm-up.
bool load_competitors(std::string_view text, competitors& c) {
  c.nlohmann_doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/false);
  if (c.nlohmann_doc.is_discarded()) {
    std::cerr << "nlohmann: input parse failed\n";
    return false;
  }
  if (!jsoncpp_parse(text, c.jsoncpp_doc)) {
    std::cerr << "jsoncpp: input parse failed\n";
    return false;
  }
  c.rapidjson_doc.Parse(text.data(), text.size());
  if (c.rapidjson_doc.HasParseError()) {
    std::cerr << "rapidjson: input parse failed\n";
    return false;
  }
  return true;
}

void run_decode_suite(std::string_view text, std::size_t iters, std::size_t runs) {
  print_mbps("wjson decode(typed)", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 auto r = wjson::decode<std::vector<row>>(text);
                 do_not_optimize(r.err.code);
                 return text.size();
               });
             }));
  print_mbps("wjson decode(value)", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 auto r = wjson::decode<wjson::value>(text);
                 do_not_optimize(r.err.code);
                 return text.size();
               });
             }));
  print_mbps("nlohmann parse", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 auto j = nlohmann::json::parse(text, nullptr, false, false);
                 do_not_optimize(j.type());
                 return text.size();
               });
             }));
  print_mbps("jsoncpp parse", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 Json::Value root;
                 const bool ok = jsoncpp_parse(text, root);
                 do_not_optimize(ok);
                 return text.size();
               });
             }));
  print_mbps("rapidjson parse", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 rapidjson::Document d;
                 d.Parse(text.data(), text.size());
                 do_not_optimize(d.GetType());
                 return text.size();
               });
             }));
}

void run_sum_suite(std::string_view text, std::size_t iters, std::size_t runs) {
  print_mbps("wjson vector<double> +sum", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 auto r = wjson::decode<std::vector<double>>(text);
                 double sum = 0.0;
                 for (const double d : r.val) sum += d;
                 do_not_optimize(sum);
                 return text.size();
               });
             }));
  print_mbps("rapidjson +sum", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 rapidjson::Document d;
                 d.Parse(text.data(), text.size());
                 double sum = 0.0;
                 if (d.IsArray()) {
                   for (auto& v : d.GetArray()) sum += v.GetDouble();
                 }
                 do_not_optimize(sum);
                 return text.size();
               });
             }));
}

void run_encode_suite(const wjson::value& doc, const competitors& c, std::size_t iters, std::size_t runs) {
  print_mbps("wjson encode(value)", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 auto r = wjson::encode(doc);
                 return r.out.size();
               });
             }));
  print_mbps("nlohmann dump", run_median(runs, [&] {
               return time_iters(iters, [&] { return c.nlohmann_doc.dump().size(); });
             }));

  Json::StreamWriterBuilder wb;
  wb["indentation"] = "";
  wb["emitUTF8"] = true;
  wb["precision"] = 17;
  wb["precisionType"] = "significant";
  print_mbps("jsoncpp dump", run_median(runs, [&] {
               return time_iters(iters, [&] { return Json::writeString(wb, c.jsoncpp_doc).size(); });
             }));

  print_mbps("rapidjson dump", run_median(runs, [&] {
               return time_iters(iters, [&] {
                 rapidjson::StringBuffer sb;
                 rapidjson::Writer<rapidjson::StringBuffer> w(sb);
                 c.rapidjson_doc.Accept(w);
                 return sb.GetSize();
               });
             }));
}

} // namespace

int main(int argc, char** argv) {
  std::size_t n_rows = 2000;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) n_rows = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  std::cout << "sizeof(wjson::value): " << sizeof(wjson::value) << "\n";
  std::cout << "sizeof(rapidjson::Value): " << sizeof(rapidjson::Value) << "\n";

  const std::string payload = make_rows_payload(n_rows, 24);
  const std::string numbers = make_numbers_payload(std::max<std::size_t>(1, n_rows * 64));
  // Same total bytes per run for both payloads.
  const std::size_t numbers_iters =
      std::max<std::size_t>(1, iters * payload.size() / std::max<std::size_t>(1, numbers.size()));
  std::cout << "payload bytes: " << payload.size() << "\n";
  std::cout << "numbers payload bytes: " << numbers.size() << " (iters=" << numbers_iters << ")\n";

  auto doc = wjson::decode<wjson::value>(payload);
  if (doc.err) {
    std::cerr << "wjson: payload decode failed: " << wjson::describe(doc.err) << "\n";
    return 1;
  }
  competitors c;
  if (!load_competitors(payload, c)) return 1;

  std::cout << "\n== Decode ==\n";
  run_decode_suite(payload, iters, runs);

  std::cout << "\n== Decode+sum (numbers) ==\n";
  run_sum_suite(numbers, numbers_iters, runs);

  std::cout << "\n== Encode ==\n";
  run_encode_suite(doc.val, c, iters, runs);

  return 0;
}
