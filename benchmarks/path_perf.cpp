// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "jnav.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

namespace bench
{

using Clock = std::chrono::high_resolution_clock;

struct Stats
{
    double min_ns;
    double max_ns;
    double mean_ns;
    double median_ns;
    double stddev_ns;
};

struct BenchConfig
{
    std::size_t warmup_runs = 1;
    std::size_t measure_runs = 5;
    double scale = 1.0;
    std::string filter;
    bool list_only = false;
};

struct BenchCase
{
    std::string name;
    std::size_t inner_iterations;
    std::size_t bytes_per_iteration;
    std::function<void()> body;
};

static volatile std::uint64_t g_sink = 0;

template <class T>
inline void DoNotOptimize(const T& value)
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : "g"(value) : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void Ensure(bool condition, const std::string& message)
{
    if (!condition) {
        std::fprintf(stderr, "error: %s\n", message.c_str());
        std::exit(1);
    }
}

inline Stats
ComputeStats(std::vector<double> samples)
{
    Ensure(!samples.empty(), "ComputeStats called with empty samples");
    Stats stats;
    stats.min_ns = *std::min_element(samples.begin(), samples.end());
    stats.max_ns = *std::max_element(samples.begin(), samples.end());
    const double sum = std::accumulate(samples.begin(), samples.end(), 0.0);
    stats.mean_ns = sum / samples.size();
    double variance = 0.0;
    for (double sample : samples)
        variance += (sample - stats.mean_ns) * (sample - stats.mean_ns);
    stats.stddev_ns = std::sqrt(variance / samples.size());
    std::sort(samples.begin(), samples.end());
    std::size_t mid = samples.size() / 2;
    if (samples.size() % 2 == 0)
        stats.median_ns = (samples[mid - 1] + samples[mid]) * 0.5;
    else
        stats.median_ns = samples[mid];
    return stats;
}

class Runner
{
  public:
    explicit Runner(const BenchConfig& cfg) : config_(cfg)
    {
    }

    void run(const BenchCase& bench_case)
    {
        if (!config_.filter.empty() &&
            bench_case.name.find(config_.filter) == std::string::npos)
            return;
        if (config_.list_only) {
            std::printf("%s\n", bench_case.name.c_str());
            return;
        }
        std::size_t inner = static_cast<std::size_t>(
          std::max(1.0, bench_case.inner_iterations * config_.scale));

        for (std::size_t w = 0; w < config_.warmup_runs; ++w)
            for (std::size_t i = 0; i < inner; ++i)
                bench_case.body();

        std::vector<double> samples;
        for (std::size_t run = 0; run < config_.measure_runs; ++run) {
            Clock::time_point start = Clock::now();
            for (std::size_t i = 0; i < inner; ++i)
                bench_case.body();
            Clock::time_point end = Clock::now();
            samples.push_back(
              static_cast<double>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(end - start)
                  .count()) /
              inner);
        }

        Stats stats = ComputeStats(samples);
        std::printf("%-32s %10.2f ns/op  (median %.2f | min %.2f | max %.2f | "
                    "stddev %.2f)  inner=%-6zu",
                    bench_case.name.c_str(),
                    stats.mean_ns,
                    stats.median_ns,
                    stats.min_ns,
                    stats.max_ns,
                    stats.stddev_ns,
                    inner);
        if (bench_case.bytes_per_iteration > 0 && stats.median_ns > 0.0)
            std::printf("  throughput=%.2f MB/s",
                        bench_case.bytes_per_iteration * 1e3 / stats.median_ns);
        std::printf("\n");
    }

  private:
    BenchConfig config_;
};

inline BenchConfig
ParseArgs(int argc, char** argv)
{
    BenchConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::printf("path_perf options:\n");
            std::printf("  --warmup N       Number of warmup runs (default 1)\n");
            std::printf("  --runs N         Number of measured runs (default 5)\n");
            std::printf("  --scale X        Scale inner iteration counts by X\n");
            std::printf("  --filter STR     Only run benchmarks containing STR\n");
            std::printf("  --list           List benchmark names\n");
            std::exit(0);
        } else if (arg == "--warmup") {
            Ensure(i + 1 < argc, "--warmup requires an argument");
            config.warmup_runs = std::strtoul(argv[++i], NULL, 10);
        } else if (arg == "--runs") {
            Ensure(i + 1 < argc, "--runs requires an argument");
            config.measure_runs = std::strtoul(argv[++i], NULL, 10);
        } else if (arg == "--scale") {
            Ensure(i + 1 < argc, "--scale requires an argument");
            config.scale = std::atof(argv[++i]);
        } else if (arg == "--filter") {
            Ensure(i + 1 < argc, "--filter requires an argument");
            config.filter = argv[++i];
        } else if (arg == "--list") {
            config.list_only = true;
        } else {
            Ensure(false, std::string("unknown argument: ") + arg);
        }
    }
    if (config.measure_runs == 0)
        config.measure_runs = 1;
    return config;
}

// An array of `count` order records with the field types the
// coercion benchmarks read.
inline std::string
MakeOrders(int count)
{
    std::string s = "{\"orders\": [";
    char buf[512];
    for (int i = 0; i < count; ++i) {
        snprintf(buf,
                 sizeof(buf),
                 "%s{\"id\": \"a0B5g00000XyZ%02d\", \"amount\": \"%d.%02d\", "
                 "\"quantity\": %d, \"rate\": %d.25, \"paid\": %s, "
                 "\"placed\": \"2024-%02d-%02dT10:%02d:00Z\", "
                 "\"shipped\": %lld, \"note\": null}",
                 i ? ", " : "",
                 i % 100,
                 i * 7,
                 i % 100,
                 i % 13,
                 i % 50,
                 i % 2 ? "true" : "false",
                 i % 12 + 1,
                 i % 28 + 1,
                 i % 60,
                 1700000000000LL + i * 60000LL);
        s += buf;
    }
    s += "]}";
    return s;
}

} // namespace bench

int
main(int argc, char** argv)
{
    using namespace bench;

    BenchConfig config = ParseArgs(argc, argv);
    Runner runner(config);

    const std::string small_orders = MakeOrders(10);
    const std::string large_orders = MakeOrders(2000);
    const jn::Node orders = jn::Node::parse(large_orders);
    const jn::Node first = orders.get("orders.[0]");
    const jn::Path deep = jn::Path::parse("orders.[1999].placed");

    runner.run({ "decode/small", 2000, small_orders.size(), [&] {
                    g_sink = g_sink + jn::Node::parse(small_orders).size();
                } });
    runner.run({ "decode/large", 20, large_orders.size(), [&] {
                    g_sink = g_sink + jn::Node::parse(large_orders).size();
                } });
    runner.run({ "path/parse", 200000, 0, [&] {
                    jn::Path p = jn::Path::parse("orders.[1999].placed");
                    g_sink = g_sink + p.size();
                } });
    runner.run({ "resolve/cached_string", 200000, 0, [&] {
                    jn::Node n = orders.get("orders.[1999].placed");
                    DoNotOptimize(n);
                } });
    runner.run({ "resolve/parsed_path", 200000, 0, [&] {
                    jn::Node n = jn::resolve(orders, deep);
                    DoNotOptimize(n);
                } });
    runner.run({ "resolve/uncached", 200000, 0, [&] {
                    jn::Node n =
                      jn::resolve(orders, jn::Path::parse("orders.[1999].placed"));
                    DoNotOptimize(n);
                } });
    runner.run({ "iterate/as_list", 200, 0, [&] {
                    for (const jn::Node& order : orders.get("orders").asList())
                        g_sink = g_sink + order.size();
                } });
    runner.run({ "coerce/decimal", 200000, 0, [&] {
                    g_sink = g_sink +
                             first.get("amount").getDecimalValue()->scale();
                } });
    runner.run({ "coerce/integer", 200000, 0, [&] {
                    g_sink = g_sink + *first.get("quantity").getIntegerValue();
                } });
    runner.run({ "coerce/double_to_string", 200000, 0, [&] {
                    g_sink = g_sink + first.get("rate").getStringValue()->size();
                } });
    runner.run({ "coerce/datetime", 200000, 0, [&] {
                    g_sink = g_sink + first.get("placed")
                                        .getDateTimeValue()
                                        ->epochMillis();
                } });
    runner.run({ "coerce/epoch_date", 200000, 0, [&] {
                    g_sink = g_sink + first.get("shipped").getDateValue()->day();
                } });
    runner.run({ "coerce/id", 200000, 0, [&] {
                    g_sink = g_sink + first.get("id").getIdValue()->size();
                } });
    return 0;
}
