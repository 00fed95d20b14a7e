// bench/bench_check_digits.cpp - Benchmarks for the pure and hybrid check digit paths.

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <benchmark/benchmark.h>

#include <iso7064/iso7064.hpp>
#include <iso7064/util/random.hpp>

namespace {

std::vector<std::string> make_identifiers(std::string_view alphabet, std::size_t length,
                                          std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<std::string> values;
    values.reserve(64);
    for (int index = 0; index < 64; ++index) {
        values.push_back(iso7064::util::random_identifier(rng, alphabet, length));
    }
    return values;
}

static void BM_HybridNumeric(benchmark::State& state) {
    const auto values =
        make_identifiers(iso7064::charset::NUMERIC, static_cast<std::size_t>(state.range(0)), 0x5eed);
    std::size_t cursor = 0;
    for (auto _ : state) {
        auto result = iso7064::core::calculate_hybrid_system(values[cursor++ % values.size()],
                                                             iso7064::charset::NUMERIC);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_HybridNumeric)->Arg(8)->Arg(32)->Arg(256);

static void BM_PureMod97(benchmark::State& state) {
    const auto values =
        make_identifiers(iso7064::charset::NUMERIC, static_cast<std::size_t>(state.range(0)), 0x97);
    std::size_t cursor = 0;
    for (auto _ : state) {
        auto result = iso7064::core::calculate_pure_system(values[cursor++ % values.size()], 10, 97,
                                                           iso7064::charset::NUMERIC, true);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_PureMod97)->Arg(8)->Arg(32)->Arg(256);

static void BM_DispatchAlphanumeric(benchmark::State& state) {
    const bool double_digit = state.range(0) != 0;
    const auto values = make_identifiers(iso7064::charset::ALPHANUMERIC, 24, 0x1271);
    std::size_t cursor = 0;
    for (auto _ : state) {
        auto result = iso7064::calculate_alphanumeric_check_digit(values[cursor++ % values.size()],
                                                                  double_digit);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchAlphanumeric)->Arg(0)->Arg(1);

static void BM_VerifyNumeric(benchmark::State& state) {
    const bool double_digit = state.range(0) != 0;
    std::vector<std::string> checked;
    for (const auto& value : make_identifiers(iso7064::charset::NUMERIC, 18, 0x7064)) {
        checked.push_back(*iso7064::calculate_numeric_check_digit(value, double_digit));
    }
    std::size_t cursor = 0;
    for (auto _ : state) {
        const bool valid =
            iso7064::verify_numeric_check_digit(checked[cursor++ % checked.size()], double_digit);
        benchmark::DoNotOptimize(valid);
    }
}
BENCHMARK(BM_VerifyNumeric)->Arg(0)->Arg(1);

static void BM_ResolveParameters(benchmark::State& state) {
    for (auto _ : state) {
        auto params = iso7064::resolve_parameters(iso7064::charset::ALPHANUMERIC, true);
        benchmark::DoNotOptimize(params);
    }
}
BENCHMARK(BM_ResolveParameters);

} // namespace

BENCHMARK_MAIN();
