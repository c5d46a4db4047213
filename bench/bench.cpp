/**
 * @file bench.cpp
 * @brief Encode/decode throughput benchmarks for msgpacklite.
 *
 * Builds synthetic documents in memory and measures how fast they are
 * packed and unpacked. Use for relative comparisons between builds.
 *
 * Usage:
 *   ./build/msgpacklite_bench          # Run with default 1000 iterations
 *   ./build/msgpacklite_bench 10000    # Run with custom iteration count
 */

#include <msgpacklite/msgpacklite.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace msgpacklite;

static constexpr int DEFAULT_ITERATIONS = 1000;

/**
 * @brief Telemetry-like document: an array of records with mixed field kinds.
 */
static Value make_records(std::size_t count) {
    Array records;
    records.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        Map record;
        record.insert("id", static_cast<std::int64_t>(i));
        record.insert("name", "sensor-" + std::to_string(i % 64));
        record.insert("value", static_cast<double>(i) * 0.125);
        record.insert("delta", -static_cast<std::int64_t>(i * 37));
        record.insert("ok", (i % 3) != 0);
        record.insert("raw", Binary(16, static_cast<std::uint8_t>(i)));
        records.push_back(Value(std::move(record)));
    }
    return Value(std::move(records));
}

static Value make_integers(std::size_t count) {
    Array values;
    values.reserve(count);
    std::int64_t v = 1;
    for (std::size_t i = 0; i < count; ++i) {
        values.push_back(Value((i % 2 == 0) ? v : -v));
        v = (v * 7 + 3) % 5000000000LL;
    }
    return Value(std::move(values));
}

static Value make_blob(std::size_t size) {
    return Value(Binary(size, 0x5A));
}

static void report(const char* name, double total_us, int iterations, std::size_t bytes) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(bytes) / per_iter_us;
    std::printf("%-20s %10.2f us/iter  %10.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, bytes);
}

static void bench_encode(const char* name, const Value& document, int iterations) {
    std::vector<std::uint8_t> output;

    // Warmup run
    if (pack(document, output) != Error::Ok) {
        std::printf("%-20s FAIL (encode)\n", name);
        return;
    }
    std::size_t size = output.size();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        output.clear();
        if (pack(document, output) != Error::Ok) {
            std::printf("%-20s FAIL (encode)\n", name);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           size);
}

static void bench_decode(const char* name, const Value& document, int iterations) {
    std::vector<std::uint8_t> encoded;
    if (pack(document, encoded) != Error::Ok) {
        std::printf("%-20s FAIL (encode)\n", name);
        return;
    }

    // Warmup run and verification
    Value output;
    auto result = unpack(encoded.data(), encoded.size(), output);
    if (result != Error::Ok || output != document) {
        std::printf("%-20s FAIL (%s)\n", name, error_string(result));
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (unpack(encoded.data(), encoded.size(), output) != Error::Ok) {
            std::printf("%-20s FAIL (decode)\n", name);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           encoded.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("msgpacklite Benchmarks (version %s)\n", version());
    std::printf("===================================\n");
    std::printf("Iterations: %d\n\n", iterations);

    std::printf("%-20s %17s  %15s  %s\n", "Test", "Time", "Throughput", "Size");
    std::printf("%-20s %17s  %15s  %s\n", "----", "----", "----------", "----");

    Value records = make_records(1000);
    Value integers = make_integers(10000);
    Value blob = make_blob(1U << 20U);

    std::printf("\nEncode:\n");
    bench_encode("records", records, iterations);
    bench_encode("integers", integers, iterations);
    bench_encode("blob", blob, iterations);

    std::printf("\nDecode:\n");
    bench_decode("records", records, iterations);
    bench_decode("integers", integers, iterations);
    bench_decode("blob", blob, iterations);

    return 0;
}
