#include "internal.hpp"

#include <set>
#include <cmath>
#include <variant>
#include "util/log.hpp"
#include "util/timer.hpp"

using namespace hpl;


const FieldType* FieldResolution::GetType(const Expression& access) const {
    auto find = types.find(access.Id());
    if (find == types.end()) return nullptr;
    return find->second;
}


//
// Message schemas
//

struct FieldResolver : public AstListener {
    const ValidationConfig& config;
    const AliasTable& aliases;
    const AtomicEvent& owner;
    const FieldType* ownType;
    FieldResolution& resolution;
    std::deque<std::string> bound;

    explicit FieldResolver(const ValidationConfig& config, const AliasTable& aliases, const AtomicEvent& owner,
                           FieldResolution& resolution)
            : config(config), aliases(aliases), owner(owner), ownType(config.GetMessageType(owner.channel)),
              resolution(resolution) {}

    void Report(DiagnosticKind kind, std::string subject, const AstObject& node, std::string message) {
        resolution.diagnostics.emplace_back(kind, std::move(subject), node.Id(), std::move(message));
    }

    const FieldType* GetAliasType(const std::string& alias) const {
        if (Membership(bound, alias)) return nullptr;
        if (owner.alias && owner.alias.value() == alias) return ownType;
        auto find = aliases.find(alias);
        if (find == aliases.end()) return nullptr;
        return config.GetMessageType(find->second.get().channel);
    }

    const FieldType* Resolve(const Expression& expression) {
        if (dynamic_cast<const ThisMessage*>(&expression)) return ownType;
        if (auto variable = dynamic_cast<const VariableReference*>(&expression)) return GetAliasType(variable->name);
        if (auto access = dynamic_cast<const FieldAccess*>(&expression)) return Resolve(*access);
        if (auto access = dynamic_cast<const ArrayAccess*>(&expression)) return Resolve(*access);
        expression.Accept(*this);
        return nullptr;
    }

    const FieldType* Resolve(const FieldAccess& access) {
        auto parent = Resolve(*access.message);
        const FieldType* result = nullptr;
        if (parent && parent->sort != FieldSort::MESSAGE) {
            Report(DiagnosticKind::TYPE_MISMATCH, ToString(access), access,
                   "cannot access field '" + access.field + "' of non-message type '" + parent->name + "'");
        } else if (parent) {
            if (auto field = parent->GetField(access.field)) result = &field->get();
            else Report(DiagnosticKind::UNKNOWN_FIELD, access.field, access,
                        "type '" + parent->name + "' has no field '" + access.field + "'");
        }
        resolution.types[access.Id()] = result;
        return result;
    }

    const FieldType* Resolve(const ArrayAccess& access) {
        auto parent = Resolve(*access.array);
        access.index->Accept(*this);
        const FieldType* result = nullptr;
        if (parent && parent->sort != FieldSort::ARRAY) {
            Report(DiagnosticKind::TYPE_MISMATCH, ToString(access), access,
                   "cannot index into non-array type '" + parent->name + "'");
        } else if (parent) {
            CheckIndex(access, *parent);
            result = parent->element;
        }
        resolution.types[access.Id()] = result;
        return result;
    }

    void CheckIndex(const ArrayAccess& access, const FieldType& array) {
        auto literal = dynamic_cast<const Literal*>(access.index.get());
        if (!literal) return;
        auto number = std::get_if<double>(&literal->value);
        if (!number) return;
        auto index = *number;
        bool valid = index >= 0 && std::floor(index) == index;
        if (valid && array.length) valid = index < static_cast<double>(array.length.value());
        if (valid) return;
        Report(DiagnosticKind::INDEX_OUT_OF_BOUNDS, ToString(access), access,
               "index " + literal->token + " is out of bounds for type '" + array.name + "'");
    }

    void Visit(const FieldAccess& object) override { Resolve(object); }
    void Visit(const ArrayAccess& object) override { Resolve(object); }

    void Visit(const Quantifier& object) override {
        object.domain->Accept(*this);
        bound.push_back(object.variable);
        object.condition->Accept(*this);
        bound.pop_back();
    }
};

FieldResolution hpl::ResolveFields(const Property& property, const ValidationConfig& config, const AliasTable& aliases) {
    FieldResolution result;
    std::set<std::string> undeclared;
    for (const auto* event : property.Events()) {
        for (const auto* simple : event->SimpleEvents()) {
            auto type = config.GetMessageType(simple->channel);
            if (!type && config.RequireMessageTypes() && undeclared.insert(simple->channel).second) {
                result.diagnostics.emplace_back(DiagnosticKind::UNDECLARED_CHANNEL, simple->channel, simple->Id(),
                                                "no message type known for channel '" + simple->channel + "'");
            }
            if (type && simple->messageType && simple->messageType.value() != type->name) {
                result.diagnostics.emplace_back(DiagnosticKind::TYPE_MISMATCH, simple->channel, simple->Id(),
                                                "channel '" + simple->channel + "' carries messages of type '" +
                                                type->name + "', not '" + simple->messageType.value() + "'");
            }
            if (!simple->predicate) continue;
            FieldResolver resolver(config, aliases, *simple, result);
            simple->predicate->Accept(resolver);
        }
    }
    return result;
}


//
// Alias binding
//

inline void CheckReferences(const Event* event, const std::string& slot, const std::vector<std::string>& available,
                            std::deque<Diagnostic>& result) {
    if (!event) return;
    for (const auto* simple : event->SimpleEvents()) {
        if (!simple->predicate) continue;
        auto references = ReferencedAliases(*simple->predicate);
        if (simple->alias) references.erase(simple->alias.value());
        for (const auto& alias : references) {
            if (Membership(available, alias)) continue;
            result.emplace_back(DiagnosticKind::UNBOUND_ALIAS, alias, simple->Id(),
                                "reference to undefined alias '" + alias + "' in the " + slot + " event on channel '" +
                                simple->channel + "'");
        }
    }
}

inline std::vector<std::string> GetAliases(const Event* event) {
    if (!event) return {};
    return event->Aliases();
}

std::deque<Diagnostic> hpl::CheckBindings(const Property& property, const ValidationConfig& config,
                                          FieldResolution& fields) {
    MEASURE("hpl::CheckBindings")
    DEBUG("Checking alias bindings" << std::endl)
    std::deque<Diagnostic> result;
    const Event* activator = property.scope ? property.scope->activator.get() : nullptr;
    const Event* terminator = property.scope ? property.scope->terminator.get() : nullptr;
    auto initial = GetAliases(activator);
    CheckReferences(activator, "activator", {}, result);

    if (property.pattern) {
        const auto& rule = GetRule(*property.pattern, config);
        const Event* behaviour = property.pattern->behaviour.get();
        const Event* trigger = property.pattern->trigger.get();
        const Event* first = rule.triggerBindsFirst ? trigger : behaviour;
        const Event* second = rule.triggerBindsFirst ? behaviour : trigger;
        std::string firstName = rule.triggerBindsFirst ? "trigger" : "behaviour";
        std::string secondName = rule.triggerBindsFirst ? "behaviour" : "trigger";

        CheckReferences(first, firstName, initial, result);
        auto available = initial;
        MoveInto(GetAliases(first), available);
        CheckReferences(second, secondName, available, result);
    }

    CheckReferences(terminator, "terminator", initial, result);
    MoveInto(std::move(fields.diagnostics), result);
    fields.diagnostics.clear();
    return result;
}
