// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "rootfind/math/false_position.hpp"

#include <cmath>
#include <limits>
#include <vector>

namespace rootfind {
namespace {

class FalsePositionTest : public ::testing::Test {
protected:
    static constexpr size_t max_iter = 200;

    static auto tight_policy() {
        return both(StepTolerance{.epsilon = 1e-10}, FunctionTolerance{.epsilon = 1e-10});
    }
};

// ===========================================================================
// Illinois
// ===========================================================================

TEST_F(FalsePositionTest, IllinoisSquareRootOfTwo) {
    auto f = make_evaluator([](double x) { return x * x - 2.0; });
    auto bracket = Bracket::create(f, 0.0, 2.0).value();

    auto result = false_position_illinois(f, bracket, max_iter, tight_policy());

    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_NEAR(result->root, std::sqrt(2.0), 1e-9);
    EXPECT_LE(result->residual, 1e-10);
}

TEST_F(FalsePositionTest, IllinoisConvergesOnCubeWherePlainStalls) {
    // x^3 is convex on (0, 10]: plain regula falsi keeps the upper end forever
    auto f = make_evaluator([](double x) { return x * x * x; });
    auto bracket = Bracket::create(f, -1.0, 10.0).value();
    StepTolerance policy{.epsilon = 1e-9};

    auto illinois = false_position_illinois(f, bracket, 1000, policy);
    ASSERT_TRUE(illinois.has_value()) << illinois.error();
    EXPECT_NEAR(illinois->root, 0.0, 1e-6);
    EXPECT_LT(illinois->iterations, 100u);

    auto plain = false_position(f, bracket, 1000, policy);
    ASSERT_FALSE(plain.has_value());
    EXPECT_EQ(plain.error().code, RootFindingErrorCode::MaxIterationsExceeded);
    EXPECT_EQ(plain.error().iterations, 1000u);
}

TEST_F(FalsePositionTest, IllinoisNeedsFewerIterationsThanBisectionRate) {
    auto f = make_evaluator([](double x) { return std::exp(x) - 4.0 * x * x; });
    auto bracket = Bracket::create(f, 4.0, 4.5).value();

    auto result = false_position_illinois(f, bracket, max_iter, tight_policy());

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->root, 4.3065847282206992983, 1e-9);
    // Bisection needs ~33 halvings for the same width
    EXPECT_LT(result->iterations, 15u);
}

TEST_F(FalsePositionTest, IteratesStayInsideBracket) {
    auto f = make_evaluator([](double x) { return std::cos(x) - x * x * x; });
    auto bracket = Bracket::create(f, 0.0, 1.0).value();

    std::vector<double> iterates;
    auto record = make_policy([&iterates](double, double cur, double f_cur, size_t) {
        iterates.push_back(cur);
        return std::abs(f_cur) <= 1e-12;
    });

    auto result = false_position_illinois(f, bracket, max_iter, record);

    ASSERT_TRUE(result.has_value());
    ASSERT_FALSE(iterates.empty());
    for (double x : iterates) {
        EXPECT_GT(x, 0.0);
        EXPECT_LT(x, 1.0);
    }
}

TEST_F(FalsePositionTest, IllinoisSignInvariantHoldsAfterEveryNarrowing) {
    auto wallis = make_evaluator([](double x) { return x * x * x - 2.0 * x - 5.0; });
    auto exp_quadratic = make_evaluator([](double x) { return std::exp(x) - 4.0 * x * x; });

    auto check = [](const auto& f, double a, double b) {
        auto bracket = Bracket::create(f, a, b).value();
        double lo = bracket.lo();
        double hi = bracket.hi();
        size_t narrowings = 0;

        // Re-derive the bracket from each reported iterate
        auto replay = make_policy([&](double prev, double cur, double f_cur, size_t) {
            EXPECT_GT(cur, lo);
            EXPECT_LT(cur, hi);
            if (opposite_signs(f.eval(lo), f_cur)) {
                hi = cur;
            } else {
                lo = cur;
            }
            EXPECT_LE(f.eval(lo) * f.eval(hi), 0.0) << "[" << lo << ", " << hi << "]";
            ++narrowings;
            return std::abs(cur - prev) <= 1e-12;
        });

        auto result = false_position_illinois(f, bracket, max_iter, replay);
        ASSERT_TRUE(result.has_value()) << result.error();
        EXPECT_EQ(narrowings, result->iterations);
        EXPECT_GT(narrowings, 2u);
    };

    check(wallis, 2.0, 3.0);
    check(exp_quadratic, 4.0, 4.5);
}

TEST_F(FalsePositionTest, FirstStepIsMeasuredFromFartherEndpoint) {
    // Secant through (0, -1) and (4, 63) lands at x = 0.0625
    auto f = make_evaluator([](double x) { return x * x * x - 1.0; });
    auto bracket = Bracket::create(f, 0.0, 4.0).value();

    double first_prev = std::numeric_limits<double>::quiet_NaN();
    double first_cur = std::numeric_limits<double>::quiet_NaN();
    auto record = make_policy([&](double prev, double cur, double, size_t iter) {
        if (iter == 1) {
            first_prev = prev;
            first_cur = cur;
        }
        return true;
    });

    auto result = false_position(f, bracket, max_iter, record);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->iterations, 1u);
    EXPECT_DOUBLE_EQ(first_cur, 0.0625);
    EXPECT_DOUBLE_EQ(first_prev, 4.0);
}

// ===========================================================================
// Plain false position
// ===========================================================================

TEST_F(FalsePositionTest, PlainSolvesLinearInOneStep) {
    auto f = make_evaluator([](double x) { return 2.0 * x - 1.0; });
    auto bracket = Bracket::create(f, -3.0, 5.0).value();

    auto result = false_position(f, bracket, max_iter, tight_policy());

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->root, 0.5, 1e-15);
    EXPECT_EQ(result->iterations, 1u);
}

TEST_F(FalsePositionTest, PlainConvergesOnMildProblem) {
    auto f = make_evaluator([](double x) { return x * x * x - x - 2.0; });
    auto bracket = Bracket::create(f, 1.0, 2.0).value();

    auto result = false_position(f, bracket, max_iter, tight_policy());

    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->root, 1.52137970680457, 1e-9);
}

// ===========================================================================
// Shared failure taxonomy
// ===========================================================================

TEST_F(FalsePositionTest, EndpointRootNeedsNoIterations) {
    auto f = make_evaluator([](double x) { return x * (x - 3.0); });
    auto bracket = Bracket::create(f, 0.0, 1.0).value();

    auto plain = false_position(f, bracket, max_iter, tight_policy());
    auto illinois = false_position_illinois(f, bracket, max_iter, tight_policy());

    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(illinois.has_value());
    EXPECT_DOUBLE_EQ(plain->root, 0.0);
    EXPECT_DOUBLE_EQ(illinois->root, 0.0);
    EXPECT_EQ(plain->iterations, 0u);
    EXPECT_EQ(illinois->iterations, 0u);
}

TEST_F(FalsePositionTest, NotABracket) {
    auto f = make_evaluator([](double x) { return x; });
    auto g = make_evaluator([](double x) { return std::exp(x); });
    auto bracket = Bracket::create(f, -1.0, 1.0).value();

    auto result = false_position_illinois(g, bracket, max_iter, tight_policy());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RootFindingErrorCode::NotABracket);
    EXPECT_EQ(result.error().iterations, 0u);
}

TEST_F(FalsePositionTest, NonFiniteEndpointValue) {
    auto f = make_evaluator([](double x) { return x; });
    auto g = make_evaluator([](double x) { return x > 0.5 ? std::numeric_limits<double>::infinity() : x; });
    auto bracket = Bracket::create(f, -1.0, 1.0).value();

    auto result = false_position(g, bracket, max_iter, tight_policy());

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RootFindingErrorCode::NonFinite);
    EXPECT_EQ(result.error().iterations, 0u);
}

TEST_F(FalsePositionTest, MaxIterationsExceeded) {
    auto f = make_evaluator([](double x) { return x * x - 2.0; });
    auto bracket = Bracket::create(f, 0.0, 2.0).value();

    auto result = false_position_illinois(f, bracket, 3, StepTolerance{.epsilon = 1e-14});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, RootFindingErrorCode::MaxIterationsExceeded);
    EXPECT_EQ(result.error().iterations, 3u);
    ASSERT_TRUE(result.error().last_value.has_value());
    EXPECT_GT(*result.error().last_value, 0.0);
    EXPECT_LT(*result.error().last_value, 2.0);
}

TEST_F(FalsePositionTest, WideBracketDoesNotOverflow) {
    auto f = make_evaluator([](double x) { return x - 1.0; });
    auto bracket = Bracket::create(f, -1e308, 1e308).value();

    auto illinois = false_position_illinois(f, bracket, 2000, StepTolerance{.epsilon = 1e-9});
    ASSERT_TRUE(illinois.has_value()) << illinois.error();
    EXPECT_NEAR(illinois->root, 1.0, 1e-9);

    auto plain = false_position(f, bracket, 2000, StepTolerance{.epsilon = 1e-9});
    ASSERT_TRUE(plain.has_value()) << plain.error();
    EXPECT_NEAR(plain->root, 1.0, 1e-9);
}

TEST_F(FalsePositionTest, Idempotent) {
    auto f = make_evaluator([](double x) { return std::log(x) - 1.0; });
    auto bracket = Bracket::create(f, 1.0, 10.0).value();

    auto first = false_position_illinois(f, bracket, max_iter, tight_policy());
    auto second = false_position_illinois(f, bracket, max_iter, tight_policy());

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->root, second->root);
    EXPECT_EQ(first->iterations, second->iterations);
    EXPECT_NEAR(first->root, std::exp(1.0), 1e-9);
}

}  // namespace
}  // namespace rootfind
