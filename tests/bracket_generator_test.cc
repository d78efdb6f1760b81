// SPDX-License-Identifier: MIT
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "rootfind/math/bracket_generator.hpp"

#include <cmath>
#include <iterator>
#include <limits>

namespace rootfind {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;

MATCHER_P2(IsBracket, lo, hi, "") {
    return std::abs(arg.lo() - lo) < 1e-12 && std::abs(arg.hi() - hi) < 1e-12;
}

static_assert(std::input_iterator<BracketGenerator<RealFunction<double (*)(double)>>::iterator>);

// ===========================================================================
// Construction
// ===========================================================================

TEST(BracketGeneratorTest, RejectsInvalidWindow) {
    auto f = make_evaluator([](double x) { return x; });
    auto bounds = Bounds::create(-1.0, 1.0).value();

    for (double window : {0.0, -0.1, 2.5, std::numeric_limits<double>::infinity(),
                          std::numeric_limits<double>::quiet_NaN()}) {
        auto gen = make_bracket_generator(f, bounds, window);
        ASSERT_FALSE(gen.has_value()) << "window=" << window;
        EXPECT_EQ(gen.error().code, RootFindingErrorCode::InvalidWindow);
    }
}

TEST(BracketGeneratorTest, WindowEqualToWidthIsOneWindow) {
    auto f = make_evaluator([](double x) { return x; });
    auto bounds = Bounds::create(-1.0, 1.0).value();
    auto gen = make_bracket_generator(f, bounds, 2.0);
    ASSERT_TRUE(gen.has_value());
    EXPECT_THAT(gen->collect(), ElementsAre(IsBracket(-1.0, 1.0)));
}

TEST(BracketGeneratorTest, ExposesConfiguration) {
    auto f = make_evaluator([](double x) { return x; });
    auto bounds = Bounds::create(0.0, 4.0).value();
    auto gen = BracketGenerator<decltype(f)>::create(f, bounds, 0.5).value();
    EXPECT_EQ(gen.bounds(), bounds);
    EXPECT_DOUBLE_EQ(gen.window_size(), 0.5);
}

// ===========================================================================
// Scanning
// ===========================================================================

TEST(BracketGeneratorTest, SineOverTwoPeriods) {
    auto f = make_evaluator([](double x) { return std::sin(x); });
    auto bounds = Bounds::create(-0.1, 6.3).value();
    auto gen = make_bracket_generator(f, bounds, 0.1).value();

    // sin(0) is hit exactly on a window boundary
    EXPECT_THAT(gen.collect(), ElementsAre(IsBracket(0.0, 0.0),
                                           IsBracket(3.1, 3.2),
                                           IsBracket(6.2, 6.3)));
}

TEST(BracketGeneratorTest, EveryBracketHoldsASignChange) {
    auto f = make_evaluator([](double x) { return std::cos(x); });
    auto bounds = Bounds::create(0.0, 10.0).value();
    auto gen = make_bracket_generator(f, bounds, 1.0).value();

    auto brackets = gen.collect();
    EXPECT_THAT(brackets, ElementsAre(IsBracket(1.0, 2.0),
                                      IsBracket(4.0, 5.0),
                                      IsBracket(7.0, 8.0)));
    for (const Bracket& b : brackets) {
        EXPECT_TRUE(opposite_signs(f.eval(b.lo()), f.eval(b.hi()))) << b;
        EXPECT_NEAR(b.width(), 1.0, 1e-12);
    }
}

TEST(BracketGeneratorTest, NoSignChangeYieldsNothing) {
    auto f = make_evaluator([](double x) { return x * x + 1.0; });
    auto gen = make_bracket_generator(f, Bounds::create(-5.0, 5.0).value(), 0.5).value();
    EXPECT_THAT(gen.collect(), IsEmpty());
    EXPECT_TRUE(gen.begin() == gen.end());
}

TEST(BracketGeneratorTest, TouchingRootIsNotReported) {
    auto f = make_evaluator([](double x) { return (x - 0.05) * (x - 0.05); });
    auto gen = make_bracket_generator(f, Bounds::create(-1.0, 1.0).value(), 0.3).value();
    EXPECT_THAT(gen.collect(), IsEmpty());
}

TEST(BracketGeneratorTest, TwoSignChangesInOneWindowAreMissed) {
    // Roots at 0.04 and 0.06 share the window [-0.1, 0.2]
    auto f = make_evaluator([](double x) { return (x - 0.05) * (x - 0.05) - 1e-4; });
    auto gen = make_bracket_generator(f, Bounds::create(-1.0, 1.0).value(), 0.3).value();
    EXPECT_THAT(gen.collect(), IsEmpty());
}

TEST(BracketGeneratorTest, LastWindowIsClipped) {
    auto f = make_evaluator([](double x) { return x - 0.7; });
    auto gen = make_bracket_generator(f, Bounds::create(0.0, 1.0).value(), 0.3).value();
    auto brackets = gen.collect();
    ASSERT_THAT(brackets, SizeIs(1));
    EXPECT_NEAR(brackets[0].lo(), 0.6, 1e-12);
    EXPECT_NEAR(brackets[0].hi(), 0.9, 1e-12);
}

// ===========================================================================
// Exact zeros on window boundaries
// ===========================================================================

TEST(BracketGeneratorTest, ZeroAtLowerBoundIsDegenerate) {
    auto f = make_evaluator([](double x) { return x; });
    auto gen = make_bracket_generator(f, Bounds::create(0.0, 1.0).value(), 0.5).value();
    auto brackets = gen.collect();
    ASSERT_THAT(brackets, ElementsAre(IsBracket(0.0, 0.0)));
    EXPECT_TRUE(brackets[0].is_degenerate());
}

TEST(BracketGeneratorTest, ZeroAtUpperBoundIsDegenerate) {
    auto f = make_evaluator([](double x) { return x - 1.0; });
    auto gen = make_bracket_generator(f, Bounds::create(0.0, 1.0).value(), 0.3).value();
    EXPECT_THAT(gen.collect(), ElementsAre(IsBracket(1.0, 1.0)));
}

TEST(BracketGeneratorTest, InteriorZeroIsReportedOnce) {
    // Zeros at -0.5 and 0.5 land exactly on window boundaries
    auto f = make_evaluator([](double x) { return x * x - 0.25; });
    auto gen = make_bracket_generator(f, Bounds::create(-1.0, 1.0).value(), 0.5).value();
    EXPECT_THAT(gen.collect(), ElementsAre(IsBracket(-0.5, -0.5), IsBracket(0.5, 0.5)));
}

// ===========================================================================
// Laziness and restartability
// ===========================================================================

TEST(BracketGeneratorTest, EvaluatesOnlyAsFarAsNeeded) {
    int evaluations = 0;
    auto f = make_evaluator([&evaluations](double x) {
        ++evaluations;
        return std::sin(x);
    });
    auto gen = make_bracket_generator(f, Bounds::create(-0.1, 6.3).value(), 0.1).value();
    EXPECT_EQ(evaluations, 0);

    auto it = gen.begin();
    ASSERT_FALSE(it == gen.end());
    EXPECT_TRUE(it->is_degenerate());
    EXPECT_EQ(evaluations, 2);

    ++it;
    ASSERT_FALSE(it == gen.end());
    EXPECT_NEAR(it->lo(), 3.1, 1e-12);
    EXPECT_EQ(evaluations, 34);

    ++it;
    ASSERT_FALSE(it == gen.end());
    ++it;
    EXPECT_TRUE(it == gen.end());
    // One evaluation per window boundary, lo included
    EXPECT_EQ(evaluations, 65);
}

TEST(BracketGeneratorTest, EveryPassYieldsTheSameSequence) {
    auto f = make_evaluator([](double x) { return std::sin(3.0 * x); });
    auto gen = make_bracket_generator(f, Bounds::create(-2.0, 2.0).value(), 0.07).value();

    auto first = gen.collect();
    auto second = gen.collect();
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST(BracketGeneratorTest, IteratorComparesWithSentinel) {
    auto f = make_evaluator([](double x) { return std::cos(x); });
    auto gen = make_bracket_generator(f, Bounds::create(0.0, 10.0).value(), 1.0).value();

    size_t count = 0;
    for (auto it = gen.begin(); it != gen.end(); ++it) {
        ++count;
    }
    EXPECT_EQ(count, 3u);
}

}  // namespace
}  // namespace rootfind
