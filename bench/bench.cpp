/**
 * @file bench.cpp
 * @brief Performance benchmarks for msgunpack decoding.
 *
 * Measures decode throughput over synthetic documents for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/msgunpack_bench          # Run with default 100 iterations
 *   ./build/msgunpack_bench 1000     # Run with custom iteration count
 */

#include <msgunpack/msgunpack.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace msgunpack;

static constexpr int DEFAULT_ITERATIONS = 100;

static void put(Map& map, Value key, Value value) {
    auto status = map.insert(std::move(key), std::move(value));
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: cannot build benchmark document: %s\n", error_string(status));
        std::exit(1);
    }
}

// Records resembling telemetry rows: small maps of mixed scalars
static Value make_records(std::size_t count) {
    Array records;
    for (std::size_t i = 0; i < count; ++i) {
        Map record;
        put(record, "id", Value(i));
        put(record, "name", "sensor-" + std::to_string(i % 97));
        put(record, "temperature", Value(20.0 + static_cast<double>(i % 13) * 0.25));
        put(record, "offset", Value(-static_cast<std::int64_t>(i % 1000)));
        put(record, "ok", Value((i % 7) != 0));
        put(record, "raw", Value(Binary(16, static_cast<std::uint8_t>(i))));
        records.push_back(std::move(record));
    }
    return records;
}

// Deeply nested arrays exercising recursion
static Value make_nested(std::size_t depth) {
    Value inner = Value(Array());
    for (std::size_t i = 0; i < depth; ++i) {
        Array level;
        level.push_back(Value(i));
        level.push_back(std::move(inner));
        inner = Value(std::move(level));
    }
    return inner;
}

// Large string and binary payloads
static Value make_blobs(std::size_t count, std::size_t size) {
    Array blobs;
    for (std::size_t i = 0; i < count; ++i) {
        blobs.push_back(std::string(size, static_cast<char>('a' + (i % 26))));
        blobs.push_back(Binary(size, static_cast<std::uint8_t>(i)));
    }
    return blobs;
}

static void bench_unpack(const char* name, const Value& document, const UnpackOptions& options,
                         int iterations) {
    std::vector<std::uint8_t> encoded;
    if (packb(document, encoded) != Error::Ok) {
        std::printf("%-20s SKIP (encode failed)\n", name);
        return;
    }

    // Warmup run
    Value out;
    if (unpackb(encoded.data(), encoded.size(), out, options) != Error::Ok) {
        std::printf("%-20s SKIP (decode failed)\n", name);
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        Value value;
        (void)unpackb(encoded.data(), encoded.size(), value, options);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(encoded.size()) / per_iter_us;

    std::printf("%-20s %10.2f µs/iter  %8.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, encoded.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("msgunpack Benchmarks\n");
    std::printf("====================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %16s  %13s  %s\n", "Test", "Time", "Throughput", "Size");
    std::printf("%-20s %16s  %13s  %s\n", "----", "----", "----------", "----");

    UnpackOptions defaults;
    UnpackOptions tuples;
    tuples.use_tuple = true;
    UnpackOptions ordered;
    ordered.use_ordered_dict = true;

    Value records = make_records(1000);
    Value nested = make_nested(256);
    Value blobs = make_blobs(64, 4096);

    bench_unpack("records", records, defaults, iterations);
    bench_unpack("records/ordered", records, ordered, iterations);
    bench_unpack("nested", nested, defaults, iterations);
    bench_unpack("nested/tuple", nested, tuples, iterations);
    bench_unpack("blobs", blobs, defaults, iterations);

    return 0;
}
