#include <gtest/gtest.h>

#include "ast/util.hpp"
#include "logics/logic.hpp"
#include "logics/encoding.hpp"

using namespace hpl;


static std::unique_ptr<Expression> Compare(ComparisonOperator op, const std::string& path, double value) {
    return std::make_unique<Comparison>(op, MakeFieldAccess("", path), std::make_unique<Literal>(value));
}

static std::unique_ptr<Expression> Equals(const std::string& path, const char* value) {
    return std::make_unique<Comparison>(ComparisonOperator::EQ, MakeFieldAccess("", path), std::make_unique<Literal>(value));
}

static std::unique_ptr<Expression> Call(const std::string& name, std::unique_ptr<Expression> argument) {
    std::deque<std::unique_ptr<Expression>> arguments;
    arguments.push_back(std::move(argument));
    return std::make_unique<FunctionCall>(name, std::move(arguments));
}


TEST(EncodingTest, SatisfiableButNotValid) {
    Encoding encoding;
    auto expression = Compare(ComparisonOperator::GT, "speed", 1);
    EXPECT_TRUE(encoding.IsSatisfiable(*expression));
    EXPECT_FALSE(encoding.IsValid(*expression));
}

TEST(EncodingTest, ContradictoryBounds) {
    Encoding encoding;
    auto expression = Conjoin(Compare(ComparisonOperator::GT, "speed", 1), Compare(ComparisonOperator::LT, "speed", -0.5));
    EXPECT_FALSE(encoding.IsSatisfiable(*expression));
}

TEST(EncodingTest, ExcludedMiddleIsValid) {
    Encoding encoding;
    auto expression = Disjoin(Compare(ComparisonOperator::GEQ, "a.b", 2.5),
                              Compare(ComparisonOperator::LT, "a.b", 2.5));
    EXPECT_TRUE(encoding.IsValid(*expression));
}

TEST(EncodingTest, NegatedComparisonsAreEquivalent) {
    Encoding encoding;
    auto lhs = Negate(Compare(ComparisonOperator::LT, "x", 10));
    auto rhs = Compare(ComparisonOperator::GEQ, "x", 10);
    auto other = Compare(ComparisonOperator::GT, "x", 10);
    EXPECT_TRUE(encoding.AreEquivalent(*lhs, *rhs));
    EXPECT_FALSE(encoding.AreEquivalent(*lhs, *other));
}

TEST(EncodingTest, ArithmeticIsInterpreted) {
    Encoding encoding;
    auto sum = std::make_unique<Arithmetic>(ArithmeticOperator::ADD, MakeFieldAccess("", "x"), std::make_unique<Literal>(1));
    auto expression = std::make_unique<Comparison>(ComparisonOperator::GT, std::move(sum), MakeFieldAccess("", "x"));
    EXPECT_TRUE(encoding.IsValid(*expression));
}

TEST(EncodingTest, StringsAreDistinct) {
    Encoding encoding;
    auto expression = Conjoin(Equals("mode", "auto"), Equals("mode", "manual"));
    EXPECT_FALSE(encoding.IsSatisfiable(*expression));
    EXPECT_TRUE(encoding.IsSatisfiable(*Equals("mode", "auto")));
}

TEST(EncodingTest, RangeMembership) {
    Encoding encoding;
    auto range = std::make_unique<RangeValue>(std::make_unique<Literal>(0), std::make_unique<Literal>(1));
    auto member = std::make_unique<Comparison>(ComparisonOperator::IN, MakeFieldAccess("", "ratio"), std::move(range));
    auto expression = Conjoin(std::move(member), Compare(ComparisonOperator::GT, "ratio", 2));
    EXPECT_FALSE(encoding.IsSatisfiable(*expression));
}

TEST(EncodingTest, SetMembership) {
    Encoding encoding;
    std::deque<std::unique_ptr<Expression>> values;
    values.push_back(std::make_unique<Literal>(1));
    values.push_back(std::make_unique<Literal>(2));
    auto member = std::make_unique<Comparison>(ComparisonOperator::IN, MakeFieldAccess("", "gear"),
                                               std::make_unique<SetValue>(std::move(values)));
    auto expression = Implies(std::move(member), Compare(ComparisonOperator::LEQ, "gear", 2));
    EXPECT_TRUE(encoding.IsValid(*expression));
}

TEST(EncodingTest, FunctionCallsAreUninterpreted) {
    Encoding encoding;
    auto nonNegative = std::make_unique<Comparison>(ComparisonOperator::GEQ, Call("abs", MakeFieldAccess("", "x")),
                                                    std::make_unique<Literal>(0));
    EXPECT_FALSE(encoding.IsValid(*nonNegative));

    auto contradiction = Conjoin(
            std::make_unique<Comparison>(ComparisonOperator::GT, Call("abs", MakeFieldAccess("", "x")), std::make_unique<Literal>(1)),
            std::make_unique<Comparison>(ComparisonOperator::LT, Call("abs", MakeFieldAccess("", "x")), std::make_unique<Literal>(0)));
    EXPECT_FALSE(encoding.IsSatisfiable(*contradiction));
}

TEST(EncodingTest, UnknownValuesAreIndependent) {
    Encoding encoding;
    LogicValue unknown(Truth::UNKNOWN);
    EXPECT_TRUE(encoding.IsSatisfiable(unknown));
    EXPECT_FALSE(encoding.IsValid(unknown));

    auto both = Conjoin(std::make_unique<LogicValue>(Truth::UNKNOWN), Negate(std::make_unique<LogicValue>(Truth::UNKNOWN)));
    EXPECT_TRUE(encoding.IsSatisfiable(*both));
}

TEST(EncodingTest, EncodedExpressionsCompose) {
    Encoding encoding;
    auto a = encoding.Encode(*Compare(ComparisonOperator::GT, "x", 0));
    auto b = encoding.Encode(*Compare(ComparisonOperator::LEQ, "x", 0));
    EXPECT_TRUE(encoding.IsValid(a == !b));
    EXPECT_FALSE(encoding.IsValid(a == b));
    EXPECT_FALSE(encoding.IsSatisfiable(a == b));
}

TEST(EncodingTest, PredicatesEncodeTheirCondition) {
    Encoding encoding;
    Predicate predicate(Compare(ComparisonOperator::LT, "x", 0));
    auto encoded = encoding.Encode(predicate);
    EXPECT_TRUE(encoding.IsSatisfiable(encoded));
    EXPECT_FALSE(encoding.IsValid(encoded));
    EXPECT_TRUE(encoding.IsValid(encoded == encoding.Encode(*Compare(ComparisonOperator::LT, "x", 0))));
}
