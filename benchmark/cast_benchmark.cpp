#include "castor/core/cast.hpp"
#include "castor/core/json.hpp"
#include "castor/core/openapi_loader.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

struct benchmark_result {
    std::string name;
    double throughput;
    double latency_p50;
    double latency_p99;
    double latency_p999;
    uint64_t operations;
    uint64_t duration_ms;
    uint64_t errors;
};

void print_result(const benchmark_result& result) {
    std::cout << "\n=== " << result.name << " ===\n";
    std::cout << "Operations: " << result.operations << "\n";
    std::cout << "Duration: " << result.duration_ms << " ms\n";
    std::cout << "Throughput: " << std::fixed << std::setprecision(2) << result.throughput
              << " ops/sec\n";
    std::cout << "Errors: " << result.errors << "\n";
    if (result.latency_p50 > 0.0) {
        std::cout << "Latency p50: " << std::fixed << std::setprecision(3) << result.latency_p50
                  << " us\n";
        std::cout << "Latency p99: " << std::fixed << std::setprecision(3) << result.latency_p99
                  << " us\n";
        std::cout << "Latency p999: " << std::fixed << std::setprecision(3) << result.latency_p999
                  << " us\n";
    }
}

constexpr std::string_view PETSTORE_SPEC = R"(
{
  "openapi": "3.0.3",
  "info": {"title": "Pet Store", "version": "1.0.0"},
  "components": {
    "schemas": {
      "Tag": {
        "type": "object",
        "required": ["name"],
        "properties": {
          "name": {"type": "string", "minLength": 1, "maxLength": 32},
          "color": {"type": "string", "enum": ["red", "green", "blue"]}
        }
      },
      "Dog": {
        "type": "object",
        "required": ["pet_type", "bark"],
        "properties": {
          "pet_type": {"type": "string"},
          "bark": {"type": "boolean"}
        }
      },
      "Cat": {
        "type": "object",
        "required": ["pet_type", "meow"],
        "properties": {
          "pet_type": {"type": "string"},
          "meow": {"type": "boolean"}
        }
      },
      "Pet": {
        "oneOf": [{"$ref": "#/components/schemas/Dog"}, {"$ref": "#/components/schemas/Cat"}],
        "discriminator": {
          "propertyName": "pet_type",
          "mapping": {"dog": "Dog", "cat": "Cat"}
        }
      },
      "Owner": {
        "type": "object",
        "required": ["id", "name", "born"],
        "additionalProperties": false,
        "properties": {
          "id": {"type": "integer", "format": "int64", "minimum": 1},
          "name": {"type": "string", "pattern": "^[A-Za-z ]+$"},
          "email": {"type": "string", "format": "email"},
          "born": {"type": "string", "format": "date"},
          "pets": {"type": "array", "items": {"$ref": "#/components/schemas/Pet"}, "maxItems": 64},
          "tags": {"type": "array", "items": {"$ref": "#/components/schemas/Tag"}, "uniqueItems": true}
        }
      }
    }
  }
}
)";

constexpr std::string_view VALID_OWNER = R"({
  "id": 42, "name": "Ada Lovelace", "email": "ada@example.com", "born": "1815-12-10",
  "pets": [{"pet_type": "dog", "bark": true}, {"pet_type": "cat", "meow": false}],
  "tags": [{"name": "vip", "color": "red"}, {"name": "early"}]
})";

constexpr std::string_view INVALID_OWNER = R"({
  "id": 0, "name": "Ada 1815", "email": "nope", "born": "1815-13-10",
  "pets": [{"pet_type": "fish"}, {"pet_type": "cat"}],
  "tags": [{"name": ""}, {"name": ""}],
  "extra": true
})";

template <typename Fn>
benchmark_result run_benchmark(const std::string& name, uint64_t iterations, Fn&& fn) {
    std::vector<double> latencies;
    latencies.reserve(iterations);

    uint64_t errors = 0;
    auto start = std::chrono::steady_clock::now();

    for (uint64_t i = 0; i < iterations; ++i) {
        auto iter_start = std::chrono::steady_clock::now();
        const bool ok = fn();
        auto iter_end = std::chrono::steady_clock::now();

        if (!ok) {
            ++errors;
        }

        auto latency_ns =
            std::chrono::duration_cast<std::chrono::nanoseconds>(iter_end - iter_start).count();
        latencies.push_back(static_cast<double>(latency_ns) / 1000.0);
    }

    auto end = std::chrono::steady_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

    std::sort(latencies.begin(), latencies.end());

    benchmark_result result;
    result.name = name;
    result.operations = iterations;
    result.errors = errors;
    result.duration_ms = static_cast<uint64_t>(duration_ms);
    result.throughput = static_cast<double>(iterations) /
                        (static_cast<double>(std::max<int64_t>(duration_ms, 1)) / 1000.0);
    result.latency_p50 = latencies[latencies.size() / 2];
    result.latency_p99 = latencies[latencies.size() * 99 / 100];
    result.latency_p999 = latencies[latencies.size() * 999 / 1000];

    return result;
}

int main() {
    std::cout << "Schema Cast Benchmark\n";
    std::cout << "=====================\n";

    const uint64_t iterations = 20000;

    print_result(run_benchmark("Load document (5 schemas, refs, discriminator)", iterations / 10, [] {
        return castor::openapi::load_from_string(PETSTORE_SPEC).has_value();
    }));

    auto doc = castor::openapi::load_from_string(PETSTORE_SPEC);
    auto valid = castor::parse_json(VALID_OWNER);
    auto invalid = castor::parse_json(INVALID_OWNER);
    if (!doc || !valid || !invalid) {
        std::cerr << "[bench] fixture setup failed\n";
        return 1;
    }
    const auto* owner = doc->schemas.resolve("Owner");
    const auto& reg = doc->schemas;

    print_result(run_benchmark("Parse JSON payload", iterations, [] {
        return castor::parse_json(VALID_OWNER).has_value();
    }));

    print_result(run_benchmark("Cast valid payload (formats, oneOf+discriminator)", iterations, [&] {
        return castor::cast(*valid, *owner, reg).has_value();
    }));

    // This payload never casts; "Errors" counts iterations where it did.
    print_result(run_benchmark("Cast invalid payload (collect all errors)", iterations, [&] {
        auto r = castor::cast(*invalid, *owner, reg);
        return !r && r.error().size() > 1;
    }));

    print_result(run_benchmark("Render 422 errors", iterations, [&] {
        auto r = castor::cast(*invalid, *owner, reg);
        return !r && !castor::to_json(castor::render_errors(r.error())).empty();
    }));

    std::cout << "\n";
    return 0;
}
