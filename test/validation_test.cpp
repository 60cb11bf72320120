#include <gtest/gtest.h>

#include "ast/util.hpp"
#include "logics/logic.hpp"
#include "validation/validate.hpp"

using namespace hpl;


//
// Builders
//

static std::unique_ptr<Expression> Number(double value) {
    return std::make_unique<Literal>(value);
}

static std::unique_ptr<Expression> Compare(ComparisonOperator op, std::unique_ptr<Expression> lhs,
                                           std::unique_ptr<Expression> rhs) {
    return std::make_unique<Comparison>(op, std::move(lhs), std::move(rhs));
}

// 'alias.path > value', or 'path > value' on the event's own message if 'alias' is empty
static std::unique_ptr<Expression> Above(const std::string& alias, const std::string& path, double value) {
    return Compare(ComparisonOperator::GT, MakeFieldAccess(alias, path), Number(value));
}

static std::unique_ptr<Predicate> Holds(std::unique_ptr<Expression> condition) {
    return std::make_unique<Predicate>(std::move(condition));
}

static std::unique_ptr<Event> On(const std::string& channel, std::unique_ptr<Predicate> predicate = nullptr,
                                 std::optional<std::string> alias = std::nullopt) {
    return std::make_unique<AtomicEvent>(channel, std::move(predicate), std::move(alias));
}

static std::unique_ptr<Property> Globally(std::unique_ptr<Pattern> pattern) {
    return std::make_unique<Property>(Scope::Global(), std::move(pattern));
}

static std::unique_ptr<Expression> Range(double low, double high) {
    return std::make_unique<RangeValue>(Number(low), Number(high));
}

static std::unique_ptr<Expression> Forall(const std::string& variable, std::unique_ptr<Expression> domain,
                                          std::unique_ptr<Expression> condition) {
    return std::make_unique<Quantifier>(QuantifierKind::FORALL, variable, std::move(domain), std::move(condition));
}

static std::unique_ptr<Expression> Variable(const std::string& name) {
    return std::make_unique<VariableReference>(name);
}

class ValidationTest : public ::testing::Test {
protected:
    DefaultValidationConfig config;

    void SetUp() override { config.enableSmtChecks = false; }
};


//
// Alias binding
//

TEST_F(ValidationTest, RequirementTriggerReferencingUnknownAlias) {
    auto property = Globally(Pattern::Requirement(On("/a", nullptr, "x"), On("/b", Holds(Above("y", "value", 0)))));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().kind, DiagnosticKind::UNBOUND_ALIAS);
    EXPECT_EQ(report.errors.front().subject, "y");
    EXPECT_EQ(report.errors.front().node, property->pattern->trigger->Id());
    EXPECT_FALSE(report.IsAccepted());
}

TEST_F(ValidationTest, RequirementTriggerMayUseBehaviourAlias) {
    auto property = Globally(Pattern::Requirement(On("/a", nullptr, "x"), On("/b", Holds(Above("x", "value", 0)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_TRUE(report.IsAccepted());
    EXPECT_FALSE(report.Contains(DiagnosticKind::SUSPICIOUS_UNBOUND_RESPONSE));
}

TEST_F(ValidationTest, ResponseBehaviourMayUseTriggerAlias) {
    auto property = Globally(Pattern::Response(On("/cmd", Holds(Above("", "speed", 0)), "c"),
                                               On("/odom", Holds(Above("c", "speed", 0)))));
    EXPECT_TRUE(Validate(*property, config).errors.empty());
}

TEST_F(ValidationTest, ResponseTriggerMayNotUseBehaviourAlias) {
    auto property = Globally(Pattern::Response(On("/cmd", Holds(Above("o", "speed", 0))),
                                               On("/odom", Holds(Above("", "speed", 0)), "o")));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_TRUE(report.Contains(DiagnosticKind::UNBOUND_ALIAS, "o"));
}

TEST_F(ValidationTest, TerminatorSeesOnlyActivatorAliases) {
    auto scope = Scope::AfterUntil(On("/start", Holds(Above("", "level", 0)), "s"),
                                   On("/stop", Holds(Compare(ComparisonOperator::GT, MakeFieldAccess("s", "level"),
                                                             MakeFieldAccess("c", "level")))));
    auto pattern = Pattern::Response(On("/cmd", Holds(Above("s", "level", 0)), "c"), On("/ack", Holds(Above("c", "id", 0))));
    Property property(std::move(scope), std::move(pattern));
    auto report = Validate(property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_TRUE(report.Contains(DiagnosticKind::UNBOUND_ALIAS, "c"));
    EXPECT_EQ(report.errors.front().node, property.scope->terminator->Id());
}

TEST_F(ValidationTest, ActivatorSeesNoOtherAliases) {
    auto scope = Scope::After(On("/start", Holds(Above("c", "level", 0))));
    auto pattern = Pattern::Existence(On("/cmd", Holds(Above("", "level", 0)), "c"));
    Property property(std::move(scope), std::move(pattern));
    EXPECT_TRUE(Validate(property, config).Contains(DiagnosticKind::UNBOUND_ALIAS, "c"));
}

TEST_F(ValidationTest, OwnAliasIsAlwaysAvailable) {
    auto property = Globally(Pattern::Existence(On("/a", Holds(Above("me", "value", 0)), "me")));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.IsAccepted());
    EXPECT_FALSE(report.Contains(DiagnosticKind::PREDICATE_IGNORES_OWN_MESSAGE));
}

TEST_F(ValidationTest, DuplicateAlias) {
    auto property = Globally(Pattern::Response(On("/a", nullptr, "m"), On("/b", nullptr, "m")));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().kind, DiagnosticKind::DUPLICATE_ALIAS);
    EXPECT_EQ(report.errors.front().subject, "m");
}

TEST_F(ValidationTest, DisjunctionBindingAliasPartially) {
    auto trigger = std::make_unique<EventDisjunction>(On("/a", nullptr, "m"), On("/b"));
    auto property = Globally(Pattern::Response(std::move(trigger), On("/c", Holds(Above("m", "value", 0)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.IsAccepted());
    EXPECT_TRUE(report.Contains(DiagnosticKind::INCONSISTENT_DISJUNCTION_ALIAS, "m"));
}


//
// Pattern sanity
//

TEST_F(ValidationTest, SuspiciousUnboundResponse) {
    auto property = Globally(Pattern::Response(On("/cmd", Holds(Above("", "speed", 0)), "c"),
                                               On("/odom", Holds(Above("", "value", 0)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.errors.empty());
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings.front().kind, DiagnosticKind::SUSPICIOUS_UNBOUND_RESPONSE);
    EXPECT_EQ(report.warnings.front().subject, "c");
    EXPECT_EQ(report.warnings.front().severity, Severity::WARNING);
    EXPECT_EQ(report.warnings.front().node, property->pattern->behaviour->Id());
}

TEST_F(ValidationTest, SuspiciousUnboundRequirement) {
    auto property = Globally(Pattern::Requirement(On("/a", Holds(Above("", "value", 0)), "x"),
                                                  On("/b", Holds(Above("", "value", 0)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.IsAccepted());
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings.front().kind, DiagnosticKind::SUSPICIOUS_UNBOUND_RESPONSE);
    EXPECT_EQ(report.warnings.front().subject, "x");
    EXPECT_EQ(report.warnings.front().node, property->pattern->trigger->Id());
}

TEST_F(ValidationTest, ExistenceNeverFlagsUnboundResponse) {
    auto property = Globally(Pattern::Existence(On("/a", Holds(Above("", "value", 0)), "a")));
    EXPECT_EQ(Validate(*property, config).warnings.size(), 0u);
}

TEST_F(ValidationTest, PredicateIgnoringOwnMessage) {
    auto property = Globally(Pattern::Response(On("/cmd", Holds(Above("", "speed", 0)), "c"),
                                               On("/odom", Holds(Above("c", "speed", 0)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.IsAccepted());
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings.front().kind, DiagnosticKind::PREDICATE_IGNORES_OWN_MESSAGE);
    EXPECT_EQ(report.warnings.front().subject, "/odom");
}

TEST_F(ValidationTest, MissingTriggerAfterMutation) {
    auto property = Globally(Pattern::Response(On("/a"), On("/b")));
    property->pattern->trigger.reset();
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.Contains(DiagnosticKind::MISSING_TRIGGER, "response"));
}

TEST_F(ValidationTest, MissingActivatorAfterMutation) {
    Property property(Scope::After(On("/start")), Pattern::Existence(On("/a")));
    property.scope->activator.reset();
    auto report = Validate(property, config);
    EXPECT_TRUE(report.Contains(DiagnosticKind::MISSING_EVENT, "activator"));
}

TEST_F(ValidationTest, UnsatisfiableAndTautologicalPredicates) {
    config.enableSmtChecks = true;
    auto never = Conjoin(Above("", "value", 1), Compare(ComparisonOperator::LT, MakeFieldAccess("", "value"), Number(0)));
    auto always = Disjoin(Above("", "value", 1), Compare(ComparisonOperator::LEQ, MakeFieldAccess("", "value"), Number(1)));
    auto property = Globally(Pattern::Response(On("/a", Holds(std::move(never))), On("/b", Holds(std::move(always)))));

    auto report = Validate(*property, config);
    EXPECT_TRUE(report.IsAccepted());
    EXPECT_TRUE(report.Contains(DiagnosticKind::UNSATISFIABLE_PREDICATE, "/a"));
    EXPECT_TRUE(report.Contains(DiagnosticKind::TAUTOLOGICAL_PREDICATE, "/b"));
    EXPECT_EQ(report.warnings.size(), 2u);

    config.enableSmtChecks = false;
    EXPECT_TRUE(Validate(*property, config).warnings.empty());
}

TEST_F(ValidationTest, SatisfiablePredicatesPassSmtChecks) {
    config.enableSmtChecks = true;
    auto property = Globally(Pattern::Existence(On("/a", Holds(Above("", "value", 1)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_TRUE(report.warnings.empty());
}


TEST_F(ValidationTest, EmptiedConnectivesAreReported) {
    auto conjunction = std::make_unique<Conjunction>(Above("", "value", 1), Above("", "other", 2));
    auto disjunction = std::make_unique<Disjunction>(Above("", "value", 1), Above("", "other", 2));
    auto* emptyAnd = conjunction.get();
    auto* emptyOr = disjunction.get();
    auto property = Globally(Pattern::Response(On("/a", Holds(std::move(conjunction))), On("/b", Holds(std::move(disjunction)))));
    EXPECT_TRUE(Validate(*property, config).IsAccepted());

    emptyAnd->operands.clear();
    emptyOr->operands.clear();
    auto report = Validate(*property, config);
    EXPECT_FALSE(report.IsAccepted());
    EXPECT_EQ(report.Count(DiagnosticKind::EMPTY_CONNECTIVE), 2u);
    ASSERT_TRUE(report.Contains(DiagnosticKind::EMPTY_CONNECTIVE, "and"));
    ASSERT_TRUE(report.Contains(DiagnosticKind::EMPTY_CONNECTIVE, "or"));
    for (const auto& error : report.errors) {
        if (error.kind != DiagnosticKind::EMPTY_CONNECTIVE) continue;
        EXPECT_EQ(error.node, error.subject == "and" ? emptyAnd->Id() : emptyOr->Id());
    }
}

TEST(SolverConfigTest, DefaultQueriesHaveNoTimeout) {
    DefaultValidationConfig config;
    EXPECT_EQ(config.GetSolverTimeout(), 0u);
}

struct InconclusiveEncoding : public Encoding {
    using Encoding::IsSatisfiable;
    bool IsSatisfiable(const EExpr& /*expr*/) override { throw SolvingError("inconclusive"); }
};

struct InconclusiveSolverConfig : public DefaultValidationConfig {
    [[nodiscard]] std::unique_ptr<Encoding> MakeEncoding() const override {
        return std::make_unique<InconclusiveEncoding>();
    }
};

TEST(SolverConfigTest, UndecidedPredicateIsReported) {
    InconclusiveSolverConfig config;
    auto property = Globally(Pattern::Existence(On("/a", Holds(Above("", "value", 1)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.IsAccepted());
    ASSERT_EQ(report.warnings.size(), 1u);
    const auto& warning = report.warnings.front();
    EXPECT_EQ(warning.kind, DiagnosticKind::UNDECIDED_PREDICATE);
    EXPECT_EQ(warning.severity, Severity::WARNING);
    EXPECT_EQ(warning.subject, "/a");
    EXPECT_EQ(warning.node, dynamic_cast<const AtomicEvent&>(*property->pattern->behaviour).predicate->Id());
    EXPECT_EQ(Validate(*property, config), report);
}


//
// Types
//

TEST_F(ValidationTest, UnknownFunctionInPredicate) {
    std::deque<std::unique_ptr<Expression>> arguments;
    arguments.push_back(MakeFieldAccess("", "value"));
    auto call = std::make_unique<FunctionCall>("frobnicate", std::move(arguments));
    auto property = Globally(Pattern::Existence(On("/a", Holds(Compare(ComparisonOperator::GT, std::move(call), Number(0))))));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_TRUE(report.Contains(DiagnosticKind::UNKNOWN_FUNCTION, "frobnicate"));
}

TEST_F(ValidationTest, InconsistentReferenceType) {
    auto condition = Conjoin(Above("", "value", 1),
                             Compare(ComparisonOperator::EQ, MakeFieldAccess("", "value"), std::make_unique<Literal>("high")));
    auto property = Globally(Pattern::Existence(On("/a", Holds(std::move(condition)))));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().kind, DiagnosticKind::INCONSISTENT_REFERENCE_TYPE);
}

TEST_F(ValidationTest, ArithmeticOnStringLiteral) {
    auto sum = std::make_unique<Arithmetic>(ArithmeticOperator::ADD, MakeFieldAccess("", "value"),
                                            std::make_unique<Literal>("one"));
    auto property = Globally(Pattern::Existence(On("/a", Holds(Compare(ComparisonOperator::GT, std::move(sum), Number(0))))));
    EXPECT_TRUE(Validate(*property, config).Contains(DiagnosticKind::TYPE_MISMATCH));
}

TEST_F(ValidationTest, QuantifierVariableUnused) {
    auto condition = Forall("i", Range(0, 3), Above("", "value", 0));
    auto property = Globally(Pattern::Existence(On("/a", Holds(std::move(condition)))));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_TRUE(report.Contains(DiagnosticKind::UNUSED_QUANTIFIER_VARIABLE, "i"));
}

TEST_F(ValidationTest, QuantifierVariableUsed) {
    auto element = std::make_unique<ArrayAccess>(MakeFieldAccess("", "ranges"), Variable("i"));
    auto condition = Forall("i", Range(0, 3), Compare(ComparisonOperator::GT, std::move(element), Number(0)));
    auto property = Globally(Pattern::Existence(On("/a", Holds(std::move(condition)))));
    auto report = Validate(*property, config);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_TRUE(report.warnings.empty());
}

TEST_F(ValidationTest, QuantifierDomainReference) {
    auto domain = std::make_unique<RangeValue>(Number(0), Variable("i"));
    auto condition = Forall("i", std::move(domain), Compare(ComparisonOperator::GT, Variable("i"), Number(0)));
    auto property = Globally(Pattern::Existence(On("/a", Holds(std::move(condition)))));
    EXPECT_TRUE(Validate(*property, config).Contains(DiagnosticKind::QUANTIFIER_DOMAIN_REFERENCE, "i"));
}

TEST_F(ValidationTest, RedefinedQuantifierVariable) {
    auto inner = std::make_unique<Quantifier>(QuantifierKind::EXISTS, "i", Range(0, 2),
                                              Compare(ComparisonOperator::GT, Variable("i"), Number(0)));
    auto condition = Forall("i", Range(0, 3), std::move(inner));
    auto property = Globally(Pattern::Existence(On("/a", Holds(std::move(condition)))));
    EXPECT_TRUE(Validate(*property, config).Contains(DiagnosticKind::REDEFINED_QUANTIFIER_VARIABLE, "i"));
}


//
// Message schemas
//

class SchemaValidationTest : public ValidationTest {
protected:
    FieldType odometry{ "Odometry", FieldSort::MESSAGE };
    FieldType ranges{ "float64[3]", FieldType::Number(), 3 };

    void SetUp() override {
        ValidationTest::SetUp();
        odometry.AddField("speed", FieldType::Number());
        odometry.AddField("ranges", ranges);
        config.DeclareChannel("/odom", odometry);
    }
};

TEST_F(SchemaValidationTest, KnownFieldIsAccepted) {
    auto property = Globally(Pattern::Existence(On("/odom", Holds(Above("", "speed", 0)))));
    EXPECT_TRUE(Validate(*property, config).errors.empty());
}

TEST_F(SchemaValidationTest, UnknownField) {
    auto property = Globally(Pattern::Existence(On("/odom", Holds(Above("", "velocity", 0)))));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().kind, DiagnosticKind::UNKNOWN_FIELD);
    EXPECT_EQ(report.errors.front().subject, "velocity");
}

TEST_F(SchemaValidationTest, UnknownFieldThroughAlias) {
    auto property = Globally(Pattern::Response(On("/odom", nullptr, "o"), On("/cmd", Holds(Above("o", "sped", 0)))));
    EXPECT_TRUE(Validate(*property, config).Contains(DiagnosticKind::UNKNOWN_FIELD, "sped"));
}

TEST_F(SchemaValidationTest, FieldKindFromSchema) {
    auto condition = Compare(ComparisonOperator::EQ, MakeFieldAccess("", "speed"), std::make_unique<Literal>("fast"));
    auto property = Globally(Pattern::Existence(On("/odom", Holds(std::move(condition)))));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().kind, DiagnosticKind::TYPE_MISMATCH);
}

TEST_F(SchemaValidationTest, IndexOutOfBounds) {
    auto element = std::make_unique<ArrayAccess>(MakeFieldAccess("", "ranges"), Number(5));
    auto property = Globally(Pattern::Existence(On("/odom", Holds(Compare(ComparisonOperator::GT, std::move(element), Number(0))))));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors.front().kind, DiagnosticKind::INDEX_OUT_OF_BOUNDS);
}

TEST_F(SchemaValidationTest, UndeclaredChannel) {
    config.requireMessageTypes = true;
    auto property = Globally(Pattern::Response(On("/imu"), On("/odom")));
    auto report = Validate(*property, config);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_TRUE(report.Contains(DiagnosticKind::UNDECLARED_CHANNEL, "/imu"));
}


//
// Configuration
//

struct BehaviourFirstConfig : public DefaultValidationConfig {
    PatternCatalog catalog;

    BehaviourFirstConfig() {
        catalog.Set(PatternKind::RESPONSE, PatternRule{ "response", true, false, true });
        enableSmtChecks = false;
    }

    [[nodiscard]] const PatternCatalog& GetPatternCatalog() const override { return catalog; }
};

TEST(ValidationConfigTest, CatalogDecidesBindingOrder) {
    BehaviourFirstConfig config;
    auto property = Globally(Pattern::Response(On("/cmd", Holds(Above("o", "speed", 0))),
                                               On("/odom", Holds(Above("", "speed", 0)), "o")));
    EXPECT_TRUE(Validate(*property, config).errors.empty());

    auto existence = Globally(Pattern::Existence(On("/a", Holds(Above("", "value", 0)))));
    EXPECT_TRUE(Validate(*existence, config).IsAccepted());
}

TEST(ValidationConfigTest, BuiltinCatalog) {
    const auto& catalog = PatternCatalog::Builtin();
    EXPECT_TRUE(catalog.Get(PatternKind::RESPONSE).triggerBindsFirst);
    EXPECT_FALSE(catalog.Get(PatternKind::REQUIREMENT).triggerBindsFirst);
    EXPECT_FALSE(catalog.Get(PatternKind::ABSENCE).requiresTrigger);
    EXPECT_EQ(ToString(DiagnosticKind::UNBOUND_ALIAS), "UnboundAlias");
    EXPECT_EQ(DefaultSeverity(DiagnosticKind::UNBOUND_ALIAS), Severity::ERROR);
    EXPECT_EQ(DefaultSeverity(DiagnosticKind::SUSPICIOUS_UNBOUND_RESPONSE), Severity::WARNING);
}


//
// Whole specifications
//

static Specification MakeSpecification() {
    std::deque<std::unique_ptr<Property>> properties;
    properties.push_back(Globally(Pattern::Requirement(On("/a", nullptr, "x"), On("/b", Holds(Above("y", "value", 0))))));
    properties.push_back(Globally(Pattern::Response(On("/cmd", Holds(Above("", "speed", 0)), "c"),
                                                    On("/odom", Holds(Above("", "value", 0))))));
    properties.push_back(Globally(Pattern::Existence(On("/a", Holds(Forall("i", Range(0, 3), Above("", "value", 0)))))));
    properties.push_back(Globally(Pattern::Response(On("/a", nullptr, "m"), On("/b", nullptr, "m"))));
    properties.push_back(Globally(Pattern::Absence(On("/a", Holds(Conjoin(Above("", "v", 1), Above("", "v", 2)))))));
    return Specification(std::move(properties));
}

TEST_F(ValidationTest, ValidationIsDeterministic) {
    config.enableSmtChecks = true;
    auto specification = MakeSpecification();
    for (const auto& property : specification.properties) {
        EXPECT_EQ(Validate(*property, config), Validate(*property, config));
    }
}

TEST_F(ValidationTest, ValidationDoesNotModifyProperty) {
    auto specification = MakeSpecification();
    for (const auto& property : specification.properties) {
        auto copy = Copy(*property);
        Validate(*property, config);
        EXPECT_TRUE(SyntacticalEqual(*property, *copy));
    }
}

TEST_F(ValidationTest, SpecificationReportsFollowPropertyOrder) {
    auto specification = MakeSpecification();
    auto reports = Validate(specification, config);
    ASSERT_EQ(reports.size(), specification.properties.size());
    EXPECT_TRUE(reports.at(0).Contains(DiagnosticKind::UNBOUND_ALIAS, "y"));
    EXPECT_TRUE(reports.at(1).IsAccepted());
    EXPECT_TRUE(reports.at(2).Contains(DiagnosticKind::UNUSED_QUANTIFIER_VARIABLE, "i"));
    EXPECT_TRUE(reports.at(3).Contains(DiagnosticKind::DUPLICATE_ALIAS, "m"));
    EXPECT_TRUE(reports.at(4).IsAccepted());
}

TEST_F(ValidationTest, ParallelMatchesSequential) {
    config.enableSmtChecks = true;
    auto specification = MakeSpecification();
    auto sequential = Validate(specification, config);
    EXPECT_EQ(ValidateParallel(specification, config, 3), sequential);
    EXPECT_EQ(ValidateParallel(specification, config), sequential);
    EXPECT_EQ(ValidateParallel(specification, config, 64), sequential);
}

TEST_F(ValidationTest, ParallelOnEmptySpecification) {
    Specification specification;
    EXPECT_TRUE(ValidateParallel(specification, config, 4).empty());
}

TEST_F(ValidationTest, ValidationFreezesRegistry) {
    auto property = Globally(Pattern::Existence(On("/a")));
    Validate(*property, config);
    EXPECT_TRUE(config.GetFunctionRegistry().IsFrozen());
}
