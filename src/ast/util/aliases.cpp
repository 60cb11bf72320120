#include "ast/util.hpp"

#include <sstream>

using namespace hpl;


//
// Referenced aliases
//

struct AliasCollector : public AstListener {
    std::set<std::string> result;
    std::deque<std::string> bound;

    void Enter(const VariableReference& object) override {
        if (Membership(bound, object.name)) return;
        result.insert(object.name);
    }

    void Visit(const Quantifier& object) override {
        object.domain->Accept(*this);
        bound.push_back(object.variable);
        object.condition->Accept(*this);
        bound.pop_back();
    }
};

std::set<std::string> hpl::ReferencedAliases(const AstObject& object) {
    AliasCollector collector;
    object.Accept(collector);
    return std::move(collector.result);
}

bool hpl::References(const AstObject& object, const std::string& alias) {
    return ReferencedAliases(object).count(alias) != 0;
}

bool hpl::ReferencesSelf(const Predicate& predicate, const std::optional<std::string>& ownAlias) {
    if (!Collect<ThisMessage>(predicate).empty()) return true;
    return ownAlias && References(predicate, ownAlias.value());
}


//
// Alias table
//

AliasTable hpl::ComputeAliasTable(const Property& property) {
    AliasTable result;
    for (const auto* event : property.Events()) {
        for (const auto* simple : event->SimpleEvents()) {
            if (!simple->alias) continue;
            result.emplace(simple->alias.value(), std::cref(*simple));
        }
    }
    return result;
}


//
// Builders
//

std::unique_ptr<FieldAccess> hpl::MakeFieldAccess(const std::string& alias, const std::string& path) {
    std::unique_ptr<Expression> result;
    if (alias.empty()) result = std::make_unique<ThisMessage>();
    else result = std::make_unique<VariableReference>(alias);

    std::stringstream stream(path);
    std::string field;
    do {
        field.clear();
        std::getline(stream, field, '.');
        result = std::make_unique<FieldAccess>(std::move(result), field);
    } while (!stream.eof());

    return std::unique_ptr<FieldAccess>(static_cast<FieldAccess*>(result.release()));
}
