// SPDX-License-Identifier: MIT
/**
 * @file root_finding_benchmark.cc
 * @brief Compare the solvers on shared test problems
 *
 * Each benchmark reports the iteration count of the last solve as a counter,
 * so time per solve and convergence speed can be read side by side.
 */

#include <benchmark/benchmark.h>
#include "rootfind/math/bisection.hpp"
#include "rootfind/math/false_position.hpp"
#include "rootfind/math/halley.hpp"
#include "rootfind/math/newton_raphson.hpp"
#include "rootfind/math/root_scan.hpp"
#include <cmath>

using namespace rootfind;

namespace {

// x^3 - 2x - 5 on [2, 3], root 2.0945514815423265
auto wallis() {
    return make_evaluator([](double x) { return x * x * x - 2.0 * x - 5.0; },
                          [](double x) { return 3.0 * x * x - 2.0; },
                          [](double x) { return 6.0 * x; });
}

// exp(x) - 4x^2 on [4, 4.5], root 4.3065847282206992983
auto exp_quadratic() {
    return make_evaluator([](double x) { return std::exp(x) - 4.0 * x * x; },
                          [](double x) { return std::exp(x) - 8.0 * x; },
                          [](double x) { return std::exp(x) - 8.0; });
}

auto policy() {
    return both(StepTolerance{.epsilon = 1e-10}, FunctionTolerance{.epsilon = 1e-10});
}

template<typename Solve>
void run_solver(benchmark::State& state, Solve solve) {
    size_t iterations = 0;
    for (auto _ : state) {
        auto result = solve();
        benchmark::DoNotOptimize(result);
        if (result.has_value()) {
            iterations = result->iterations;
        }
    }
    state.counters["iterations"] = static_cast<double>(iterations);
}

}  // namespace

static void BM_Bisection_Wallis(benchmark::State& state) {
    auto f = wallis();
    auto bracket = Bracket::create(f, 2.0, 3.0).value();
    run_solver(state, [&] { return bisection(f, bracket, 200, policy()); });
}
BENCHMARK(BM_Bisection_Wallis);

static void BM_FalsePosition_Wallis(benchmark::State& state) {
    auto f = wallis();
    auto bracket = Bracket::create(f, 2.0, 3.0).value();
    run_solver(state, [&] { return false_position(f, bracket, 200, policy()); });
}
BENCHMARK(BM_FalsePosition_Wallis);

static void BM_Illinois_Wallis(benchmark::State& state) {
    auto f = wallis();
    auto bracket = Bracket::create(f, 2.0, 3.0).value();
    run_solver(state, [&] { return false_position_illinois(f, bracket, 200, policy()); });
}
BENCHMARK(BM_Illinois_Wallis);

static void BM_Newton_Wallis(benchmark::State& state) {
    auto f = wallis();
    run_solver(state, [&] { return newton_raphson_naive(f, 2.0, 100, policy()); });
}
BENCHMARK(BM_Newton_Wallis);

static void BM_Halley_Wallis(benchmark::State& state) {
    auto f = wallis();
    run_solver(state, [&] { return halley_naive(f, 2.0, 100, policy()); });
}
BENCHMARK(BM_Halley_Wallis);

static void BM_Bisection_ExpQuadratic(benchmark::State& state) {
    auto f = exp_quadratic();
    auto bracket = Bracket::create(f, 4.0, 4.5).value();
    run_solver(state, [&] { return bisection(f, bracket, 200, policy()); });
}
BENCHMARK(BM_Bisection_ExpQuadratic);

static void BM_Illinois_ExpQuadratic(benchmark::State& state) {
    auto f = exp_quadratic();
    auto bracket = Bracket::create(f, 4.0, 4.5).value();
    run_solver(state, [&] { return false_position_illinois(f, bracket, 200, policy()); });
}
BENCHMARK(BM_Illinois_ExpQuadratic);

static void BM_Halley_ExpQuadratic(benchmark::State& state) {
    auto f = exp_quadratic();
    run_solver(state, [&] { return halley_naive(f, 4.5, 100, policy()); });
}
BENCHMARK(BM_Halley_ExpQuadratic);

// Full scan of sin(x) over [0, 10*pi] with a varying window
static void BM_FindRoots_Sine(benchmark::State& state) {
    auto f = make_evaluator([](double x) { return std::sin(x); });
    auto bounds = Bounds::create(-0.05, 10.0 * M_PI + 0.05).value();
    const double window = bounds.width() / static_cast<double>(state.range(0));

    size_t roots = 0;
    for (auto _ : state) {
        auto entries = find_roots(f, bounds, window);
        benchmark::DoNotOptimize(entries);
        roots = entries.has_value() ? entries->size() : 0;
    }
    state.counters["roots"] = static_cast<double>(roots);
}
BENCHMARK(BM_FindRoots_Sine)->Arg(100)->Arg(1000)->Arg(10000);
