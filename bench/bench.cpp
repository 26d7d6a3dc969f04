/**
 * @file bench.cpp
 * @brief Decoding throughput benchmarks.
 *
 * Measures decode time over generated documents for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/shapecheck_bench          # Run with default 100 iterations
 *   ./build/shapecheck_bench 1000     # Run with custom iteration count
 */

#include <shapecheck/shapecheck.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace shapecheck;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr int RECORD_COUNT = 1000;

static Value make_orders(bool with_errors) {
    Value orders = Value::array();
    for (int i = 0; i < RECORD_COUNT; ++i) {
        Value order = Value::object();
        order["id"] = i;
        order["kind"] = (i % 2 == 0) ? "retail" : "wholesale";
        order["customer"] = {{"name", "customer-" + std::to_string(i)}, {"vip", i % 7 == 0}};
        order["lines"] = Value::array({Value::array({"sku-1", 2}), Value::array({"sku-2", 1})});
        if (i % 2 != 0) {
            order["discount"] = 0.1;
        }
        if (with_errors && i % 10 == 0) {
            order["id"] = 0.5;
        }
        orders.push_back(std::move(order));
    }
    return orders;
}

static Decoder<Value> order_decoder() {
    auto customer = intersection({type({{"name", string()}}), partial({{"vip", boolean()}})});
    auto line = tuple(string(), integer());
    auto base = type({{"id", integer()}, {"customer", customer}, {"lines", array(line)}});

    return sum("kind", {{"retail", base},
                        {"wholesale", intersection({base, type({{"discount", number()}})})}});
}

static void bench_decode(const char* name, const Value& input, int iterations) {
    auto decoder = array(order_decoder());

    // Warmup run
    auto warmup = decoder.decode(input);
    std::size_t failures = warmup.ok() ? 0 : warmup.error().errors().size();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        auto result = decoder.decode(input);
        if (result.ok() != warmup.ok()) {
            std::fprintf(stderr, "Error: %s decoded differently on iteration %d\n", name, i);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double total_ms = std::chrono::duration<double, std::milli>(end - start).count();
    double per_doc_us = (total_ms * 1000.0) / iterations;
    double per_record_ns = (per_doc_us * 1000.0) / RECORD_COUNT;

    std::printf("%-20s %8.2f us/doc  %8.1f ns/record  (%zu failing records)\n", name, per_doc_us,
                per_record_ns, failures);
}

static void bench_draw(const Value& input, int iterations) {
    auto result = array(order_decoder()).decode(input);
    if (result.ok()) {
        std::printf("%-20s SKIP (no failure to draw)\n", "draw report");
        return;
    }

    std::size_t bytes = 0;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; i++) {
        bytes = draw(result.error()).size();
    }
    auto end = std::chrono::high_resolution_clock::now();

    double per_report_us =
        std::chrono::duration<double, std::micro>(end - start).count() / iterations;
    std::printf("%-20s %8.2f us/report (%zu bytes)\n", "draw report", per_report_us, bytes);
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            std::fprintf(stderr, "Error: iterations must be positive\n");
            return 1;
        }
    }

    std::printf("shapecheck %s benchmark (%d iterations, %d records)\n", version(), iterations,
                RECORD_COUNT);
    std::printf("=================================================\n");

    const Value valid = make_orders(false);
    const Value invalid = make_orders(true);

    bench_decode("valid orders", valid, iterations);
    bench_decode("invalid orders", invalid, iterations);
    bench_draw(invalid, iterations);

    return 0;
}
