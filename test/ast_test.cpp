#include <gtest/gtest.h>

#include <sstream>

#include "ast/ast.hpp"
#include "ast/error.hpp"
#include "ast/util.hpp"

using namespace hpl;


static std::unique_ptr<Expression> Number(double value) {
    return std::make_unique<Literal>(value);
}

static std::unique_ptr<Expression> Greater(std::unique_ptr<Expression> lhs, double value) {
    return std::make_unique<Comparison>(ComparisonOperator::GT, std::move(lhs), Number(value));
}

static std::unique_ptr<Predicate> FieldAbove(const std::string& alias, const std::string& path, double value) {
    return std::make_unique<Predicate>(Greater(MakeFieldAccess(alias, path), value));
}

static std::unique_ptr<Property> MakeResponse() {
    auto trigger = std::make_unique<AtomicEvent>("/cmd", FieldAbove("", "speed", 0), "c");
    auto behaviour = std::make_unique<AtomicEvent>("/odom", FieldAbove("c", "speed", 1));
    return std::make_unique<Property>(Scope::Global(), Pattern::Response(std::move(trigger), std::move(behaviour), 0, 5),
                                      std::map<std::string, std::string>{ { "id", "p1" } });
}

static ConstructionErrorKind KindOf(const std::function<void()>& action) {
    try {
        action();
    } catch (const ConstructionError& error) {
        return error.kind;
    }
    ADD_FAILURE() << "expected a construction error";
    return ConstructionErrorKind::EMPTY_NAME;
}


TEST(AstTest, NodeIdsAreUnique) {
    auto property = MakeResponse();
    std::set<NodeId> ids;
    auto nodes = Collect<AstObject>(*property);
    for (const auto* node : nodes) ids.insert(node->Id());
    EXPECT_EQ(ids.size(), nodes.size());
}

TEST(AstTest, CopyIsStructurallyEqualAndIndependent) {
    auto property = MakeResponse();
    auto copy = Copy(*property);
    ASSERT_TRUE(SyntacticalEqual(*property, *copy));
    EXPECT_NE(property->Id(), copy->Id());
    EXPECT_EQ(copy->Uid(), std::optional<std::string>("p1"));

    auto& behaviour = dynamic_cast<AtomicEvent&>(*copy->pattern->behaviour);
    behaviour.channel = "/imu";
    EXPECT_FALSE(SyntacticalEqual(*property, *copy));
    EXPECT_EQ(dynamic_cast<const AtomicEvent&>(*property->pattern->behaviour).channel, "/odom");
}

TEST(AstTest, SyntacticalEqualIgnoresIdentity) {
    auto lhs = Greater(MakeFieldAccess("", "a.b"), 3);
    auto rhs = Greater(MakeFieldAccess("", "a.b"), 3);
    auto other = Greater(MakeFieldAccess("", "a.c"), 3);
    EXPECT_TRUE(SyntacticalEqual(*lhs, *rhs));
    EXPECT_FALSE(SyntacticalEqual(*lhs, *other));
}

TEST(AstTest, CollectAppliesFilter) {
    auto property = MakeResponse();
    EXPECT_EQ(Collect<FieldAccess>(*property).size(), 2u);
    EXPECT_EQ(Collect<VariableReference>(*property).size(), 1u);

    auto viaAlias = Collect<FieldAccess>(*property, [](const FieldAccess& access) {
        return dynamic_cast<const VariableReference*>(access.message.get()) != nullptr;
    });
    ASSERT_EQ(viaAlias.size(), 1u);
    EXPECT_EQ(viaAlias.front()->field, "speed");

    for (auto* access : CollectMutable<FieldAccess>(*property)) access->field = "velocity";
    EXPECT_TRUE(Collect<FieldAccess>(*property, [](const FieldAccess& access) { return access.field == "speed"; }).empty());
}

TEST(AstTest, PrintMatchesToString) {
    auto property = MakeResponse();
    std::stringstream stream;
    Print(*property, stream);
    EXPECT_EQ(stream.str(), ToString(*property));
    EXPECT_NE(stream.str().find("/odom"), std::string::npos);
    EXPECT_NE(stream.str().find("speed"), std::string::npos);
}

TEST(AstTest, FieldAccessPath) {
    auto access = MakeFieldAccess("x", "pose.position.z");
    EXPECT_EQ(access->Path(), "pose.position.z");
    EXPECT_EQ(access->RootAlias(), std::optional<std::string>("x"));
    EXPECT_FALSE(access->IsSelfReference());

    auto own = MakeFieldAccess("", "data");
    EXPECT_FALSE(own->RootAlias().has_value());
    EXPECT_TRUE(own->IsSelfReference());
}

TEST(AstTest, ChildrenFollowSlotOrder) {
    auto property = MakeResponse();
    auto children = Children(*property->pattern);
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children.at(0), property->pattern->behaviour.get());
    EXPECT_EQ(children.at(1), property->pattern->trigger.get());
    EXPECT_EQ(FindNode(*property, property->pattern->trigger->Id()), property->pattern->trigger.get());
}

TEST(AstTest, ReplaceChildSwapsAndReturnsDetached) {
    auto comparison = std::make_unique<Comparison>(ComparisonOperator::LT, MakeFieldAccess("", "a"), Number(1));
    auto oldId = comparison->rhs->Id();
    auto detached = ReplaceChild(*comparison, oldId, std::make_unique<Literal>(2));
    ASSERT_NE(detached, nullptr);
    EXPECT_EQ(detached->Id(), oldId);
    EXPECT_EQ(std::get<double>(dynamic_cast<const Literal&>(*comparison->rhs).value), 2.0);
}

TEST(AstTest, ReplaceChildRejectsForeignNode) {
    auto comparison = std::make_unique<Comparison>(ComparisonOperator::LT, MakeFieldAccess("", "a"), Number(1));
    Literal stranger(5);
    EXPECT_EQ(KindOf([&]() { ReplaceChild(*comparison, stranger.Id(), Number(3)); }), ConstructionErrorKind::NOT_A_CHILD);
}

TEST(AstTest, ReplaceChildRejectsMisfit) {
    auto event = std::make_unique<AtomicEvent>("/a", FieldAbove("", "a", 0));
    auto predicateId = event->predicate->Id();
    EXPECT_EQ(KindOf([&]() { ReplaceChild(*event, predicateId, Number(3)); }), ConstructionErrorKind::INVALID_REPLACEMENT);
    EXPECT_EQ(event->predicate->Id(), predicateId);
}

TEST(AstTest, ReplaceChildKeepsQuantifierConditionBoolean) {
    auto domain = std::make_unique<RangeValue>(Number(0), Number(3));
    auto condition = Greater(std::make_unique<VariableReference>("v"), 0);
    Quantifier quantifier(QuantifierKind::FORALL, "v", std::move(domain), std::move(condition));
    auto conditionId = quantifier.condition->Id();

    EXPECT_EQ(KindOf([&]() { ReplaceChild(quantifier, conditionId, Number(3)); }),
              ConstructionErrorKind::NOT_A_BOOLEAN_EXPRESSION);
    EXPECT_EQ(quantifier.condition->Id(), conditionId);

    auto detached = ReplaceChild(quantifier, conditionId, std::make_unique<LogicValue>(true));
    ASSERT_NE(detached, nullptr);
    EXPECT_EQ(detached->Id(), conditionId);
    EXPECT_NE(dynamic_cast<const LogicValue*>(quantifier.condition.get()), nullptr);
}

TEST(AstTest, ReplaceChildKeepsDisjunctChannelsUnique) {
    auto disjunction = std::make_unique<EventDisjunction>(std::make_unique<AtomicEvent>("/a"),
                                                          std::make_unique<AtomicEvent>("/b"));
    auto second = disjunction->disjuncts.at(1)->Id();
    EXPECT_EQ(KindOf([&]() { ReplaceChild(*disjunction, second, std::make_unique<AtomicEvent>("/a")); }),
              ConstructionErrorKind::NON_UNIQUE_DISJUNCT_CHANNEL);
    EXPECT_EQ(disjunction->disjuncts.at(1)->Id(), second);
    EXPECT_EQ(disjunction->Channels(), (std::vector<std::string>{ "/a", "/b" }));
}

TEST(AstTest, ConstructionErrors) {
    EXPECT_EQ(KindOf([]() { std::make_unique<AtomicEvent>(""); }), ConstructionErrorKind::EMPTY_NAME);
    EXPECT_EQ(KindOf([]() { std::make_unique<AtomicEvent>("/a", nullptr, std::string()); }), ConstructionErrorKind::EMPTY_NAME);
    EXPECT_EQ(KindOf([]() { std::make_unique<VariableReference>(""); }), ConstructionErrorKind::EMPTY_NAME);
    EXPECT_EQ(KindOf([]() { std::make_unique<Conjunction>(std::deque<std::unique_ptr<Expression>>()); }),
              ConstructionErrorKind::EMPTY_OPERANDS);
    EXPECT_EQ(KindOf([]() { std::make_unique<Predicate>(Number(1)); }), ConstructionErrorKind::NOT_A_BOOLEAN_EXPRESSION);
    EXPECT_EQ(KindOf([]() { std::make_unique<Scope>(ScopeKind::AFTER); }), ConstructionErrorKind::INVALID_SCOPE);
    EXPECT_EQ(KindOf([]() { Scope::Until(nullptr); }), ConstructionErrorKind::INVALID_SCOPE);
    EXPECT_EQ(KindOf([]() { std::make_unique<Pattern>(PatternKind::RESPONSE, std::make_unique<AtomicEvent>("/a")); }),
              ConstructionErrorKind::INVALID_PATTERN);
    EXPECT_EQ(KindOf([]() { Pattern::Existence(std::make_unique<AtomicEvent>("/a"), 5, 1); }),
              ConstructionErrorKind::INVALID_TIME_BOUNDS);
    EXPECT_EQ(KindOf([]() { std::make_unique<EventDisjunction>(std::deque<std::unique_ptr<Event>>()); }),
              ConstructionErrorKind::INVALID_DISJUNCTION_ARITY);
}

TEST(AstTest, AtomicEventDefaultsToVacuousPredicate) {
    AtomicEvent event("/a");
    ASSERT_NE(event.predicate, nullptr);
    EXPECT_TRUE(event.predicate->IsVacuous());
}

TEST(AstTest, PatternClassification) {
    auto existence = Pattern::Existence(std::make_unique<AtomicEvent>("/a"));
    auto absence = Pattern::Absence(std::make_unique<AtomicEvent>("/a"), 0, 2);
    EXPECT_TRUE(existence->IsLiveness());
    EXPECT_FALSE(existence->HasTimeBounds());
    EXPECT_TRUE(absence->IsSafety());
    EXPECT_TRUE(absence->HasTimeBounds());
    EXPECT_FALSE(RequiresTrigger(PatternKind::ABSENCE));
    EXPECT_TRUE(RequiresTrigger(PatternKind::REQUIREMENT));
}

TEST(AstTest, PropertyEventsSkipAbsentSlots) {
    auto property = MakeResponse();
    auto events = property->Events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events.at(0), property->pattern->behaviour.get());
    EXPECT_EQ(events.at(1), property->pattern->trigger.get());
}

TEST(AstTest, ReferencedAliasesSkipQuantifiedVariables) {
    auto condition = std::make_unique<Quantifier>(
            QuantifierKind::FORALL, "i", std::make_unique<RangeValue>(Number(0), Number(3)),
            std::make_unique<Comparison>(ComparisonOperator::LT,
                                         std::make_unique<ArrayAccess>(MakeFieldAccess("y", "data"),
                                                                       std::make_unique<VariableReference>("i")),
                                         Number(2)));
    Predicate predicate(std::move(condition));
    EXPECT_EQ(ReferencedAliases(predicate), std::set<std::string>{ "y" });
    EXPECT_TRUE(References(predicate, "i"));
    EXPECT_FALSE(ReferencesSelf(predicate));
    EXPECT_TRUE(ReferencesSelf(predicate, std::string("y")));
}

TEST(AstTest, AliasTableUsesFirstBinder) {
    auto property = MakeResponse();
    auto table = ComputeAliasTable(*property);
    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.at("c").get().channel, "/cmd");
}
