// SPDX-License-Identifier: MIT
#pragma once

#include <concepts>
#include <utility>

namespace rootfind {

/// Concept for objective functions (scalar functions f: R -> R)
///
/// Works with any callable that takes a double and returns a double.
/// This includes lambdas, function objects, function pointers, and std::function.
template<typename F>
concept ObjectiveFunction = requires(const F& f, double x) {
    { f(x) } -> std::convertible_to<double>;
};

/// Evaluator capability: f(x)
///
/// Every solver requires this. Evaluators must be deterministic and free of
/// side effects: bracket validity and convergence guarantees depend on
/// re-evaluating the same x giving the same value.
template<typename E>
concept FunctionEvaluator = requires(const E& e, double x) {
    { e.eval(x) } -> std::convertible_to<double>;
};

/// Evaluator capability: f(x) and f'(x)
template<typename E>
concept FirstDerivativeEvaluator = FunctionEvaluator<E> && requires(const E& e, double x) {
    { e.eval_d1(x) } -> std::convertible_to<double>;
};

/// Evaluator capability: f(x), f'(x) and f''(x)
template<typename E>
concept SecondDerivativeEvaluator = FirstDerivativeEvaluator<E> && requires(const E& e, double x) {
    { e.eval_d2(x) } -> std::convertible_to<double>;
};

/// Wraps f to provide the Eval capability
template<ObjectiveFunction F>
class RealFunction {
public:
    explicit RealFunction(F f) : f_(std::move(f)) {}

    double eval(double x) const { return static_cast<double>(f_(x)); }

private:
    F f_;
};

/// Wraps f and f' to provide the Eval and EvalD1 capabilities
template<ObjectiveFunction F, ObjectiveFunction DF>
class RealFunctionWithDerivative {
public:
    RealFunctionWithDerivative(F f, DF df)
        : f_(std::move(f)), df_(std::move(df)) {}

    double eval(double x) const { return static_cast<double>(f_(x)); }
    double eval_d1(double x) const { return static_cast<double>(df_(x)); }

private:
    F f_;
    DF df_;
};

/// Wraps f, f' and f'' to provide all three capabilities
template<ObjectiveFunction F, ObjectiveFunction DF, ObjectiveFunction D2F>
class RealFunctionWithSecondDerivative {
public:
    RealFunctionWithSecondDerivative(F f, DF df, D2F d2f)
        : f_(std::move(f)), df_(std::move(df)), d2f_(std::move(d2f)) {}

    double eval(double x) const { return static_cast<double>(f_(x)); }
    double eval_d1(double x) const { return static_cast<double>(df_(x)); }
    double eval_d2(double x) const { return static_cast<double>(d2f_(x)); }

private:
    F f_;
    DF df_;
    D2F d2f_;
};

/// Build an evaluator from f alone
///
/// The result satisfies FunctionEvaluator only, so it can drive the
/// bracketing solvers but is rejected at compile time by
/// newton_raphson_naive() and halley_naive().
///
/// **Example:**
/// ```cpp
/// auto f = rootfind::make_evaluator([](double x) { return std::sin(x); });
/// auto df = rootfind::make_evaluator([](double x) { return std::sin(x); },
///                                    [](double x) { return std::cos(x); });
/// ```
template<ObjectiveFunction F>
auto make_evaluator(F f) {
    return RealFunction<F>(std::move(f));
}

/// Build an evaluator from f and f'
template<ObjectiveFunction F, ObjectiveFunction DF>
auto make_evaluator(F f, DF df) {
    return RealFunctionWithDerivative<F, DF>(std::move(f), std::move(df));
}

/// Build an evaluator from f, f' and f''
template<ObjectiveFunction F, ObjectiveFunction DF, ObjectiveFunction D2F>
auto make_evaluator(F f, DF df, D2F d2f) {
    return RealFunctionWithSecondDerivative<F, DF, D2F>(
        std::move(f), std::move(df), std::move(d2f));
}

}  // namespace rootfind
