#include <gtest/gtest.h>

#include "ast/util.hpp"
#include "functions/registry.hpp"
#include "validation/validate.hpp"

using namespace hpl;


static std::unique_ptr<FunctionCall> Call(const std::string& name, std::deque<std::unique_ptr<Expression>> arguments) {
    return std::make_unique<FunctionCall>(name, std::move(arguments));
}

static std::deque<std::unique_ptr<Expression>> Numbers(std::initializer_list<double> values) {
    std::deque<std::unique_ptr<Expression>> result;
    for (auto value : values) result.push_back(std::make_unique<Literal>(value));
    return result;
}

class FunctionsTest : public ::testing::Test {
protected:
    FunctionRegistry registry;

    void SetUp() override { RegisterBuiltins(registry); }
};


TEST_F(FunctionsTest, BuiltinsAreRegistered) {
    for (const auto& name : { "abs", "len", "sqrt", "atan2", "max", "min", "roll", "pitch", "yaw", "x", "y", "z" }) {
        EXPECT_NE(registry.Lookup(name), nullptr) << name;
    }
    EXPECT_EQ(registry.Lookup("frobnicate"), nullptr);
}

TEST_F(FunctionsTest, MatchingCallHasNoDiagnostics) {
    auto call = Call("atan2", Numbers({ 1, 2 }));
    EXPECT_TRUE(TypeCheck(*call, registry).empty());
}

TEST_F(FunctionsTest, ArityMismatch) {
    auto call = Call("atan2", Numbers({ 1 }));
    auto diagnostics = TypeCheck(*call, registry);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.front().kind, DiagnosticKind::FUNCTION_ARITY_MISMATCH);
    EXPECT_EQ(diagnostics.front().subject, "atan2");
    EXPECT_EQ(diagnostics.front().node, call->Id());
    EXPECT_EQ(diagnostics.front().severity, Severity::ERROR);
}

TEST_F(FunctionsTest, ArgumentTypeMismatchReportsPosition) {
    auto arguments = Numbers({ 1 });
    arguments.push_back(std::make_unique<Literal>("north"));
    auto call = Call("atan2", std::move(arguments));
    auto diagnostics = TypeCheck(*call, registry);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.front().kind, DiagnosticKind::FUNCTION_ARG_TYPE_MISMATCH);
    EXPECT_EQ(diagnostics.front().position, std::optional<std::size_t>(1));
}

TEST_F(FunctionsTest, UnknownFunction) {
    auto call = Call("frobnicate", Numbers({ 1 }));
    auto diagnostics = TypeCheck(*call, registry);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.front().kind, DiagnosticKind::UNKNOWN_FUNCTION);
    EXPECT_EQ(diagnostics.front().subject, "frobnicate");
}

TEST_F(FunctionsTest, NestedCallsAreChecked) {
    std::deque<std::unique_ptr<Expression>> arguments;
    arguments.push_back(Call("sqrt", Numbers({ 1, 2 })));
    auto call = Call("abs", std::move(arguments));
    auto diagnostics = TypeCheck(*call, registry);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.front().kind, DiagnosticKind::FUNCTION_ARITY_MISMATCH);
    EXPECT_EQ(diagnostics.front().subject, "sqrt");
}

TEST_F(FunctionsTest, VariadicOverloads) {
    EXPECT_TRUE(TypeCheck(*Call("max", Numbers({ 1, 2, 3, 4 })), registry).empty());

    auto set = std::make_unique<SetValue>(Numbers({ 1, 2 }));
    std::deque<std::unique_ptr<Expression>> arguments;
    arguments.push_back(std::move(set));
    EXPECT_TRUE(TypeCheck(*Call("max", std::move(arguments)), registry).empty());

    auto diagnostics = TypeCheck(*Call("max", std::deque<std::unique_ptr<Expression>>()), registry);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.front().kind, DiagnosticKind::FUNCTION_ARITY_MISMATCH);
}

TEST_F(FunctionsTest, OrientationAcceptsMessageOrComponents) {
    std::deque<std::unique_ptr<Expression>> message;
    message.push_back(MakeFieldAccess("", "orientation"));
    EXPECT_TRUE(TypeCheck(*Call("yaw", std::move(message)), registry).empty());
    EXPECT_TRUE(TypeCheck(*Call("yaw", Numbers({ 0, 0, 0, 1 })), registry).empty());
    EXPECT_EQ(TypeCheck(*Call("yaw", Numbers({ 0, 0 })), registry).size(), 1u);
}

TEST_F(FunctionsTest, ResolvePicksFirstMatchingOverload) {
    const auto& signature = *registry.Lookup("max");
    auto resolution = Resolve(signature, { TypeSet::Number(), TypeSet::Number() });
    EXPECT_EQ(resolution.status, CallStatus::OK);
    EXPECT_EQ(resolution.overload, &signature.overloads.at(1));

    resolution = Resolve(signature, { TypeSet::Number(), TypeSet::String() });
    EXPECT_EQ(resolution.status, CallStatus::ARGUMENT_TYPE_MISMATCH);
    EXPECT_EQ(resolution.position, 1u);
    EXPECT_EQ(resolution.expected, TypeSet::Number());
}

TEST_F(FunctionsTest, RegistrationReplacesExisting) {
    registry.Register("abs", FunctionSignature(TypeSet::String(), TypeSet::String()));
    EXPECT_EQ(registry.Lookup("abs")->result, TypeSet::String());
}

TEST_F(FunctionsTest, FrozenRegistryRejectsRegistration) {
    registry.Freeze();
    EXPECT_TRUE(registry.IsFrozen());
    EXPECT_THROW(registry.Register("clamp", FunctionSignature(TypeSet::Number(), TypeSet::Number())), RegistryFrozenError);
    EXPECT_EQ(registry.Lookup("clamp"), nullptr);
    EXPECT_NE(registry.Lookup("abs"), nullptr);
}

TEST(GlobalRegistryTest, ContainsBuiltins) {
    auto& global = FunctionRegistry::Global();
    EXPECT_EQ(&global, &FunctionRegistry::Global());
    EXPECT_NE(global.Lookup("atan2"), nullptr);
}
