#include "internal.hpp"

#include <set>
#include <stdexcept>
#include "validation/validate.hpp"
#include "util/log.hpp"
#include "util/timer.hpp"

using namespace hpl;


//
// Events
//

inline bool Binds(const AtomicEvent& event, const std::string& alias) {
    return event.alias && event.alias.value() == alias;
}

std::deque<Diagnostic> hpl::CheckEvent(const Event& event) {
    std::deque<Diagnostic> result;
    for (const auto* disjunction : Collect<EventDisjunction>(event)) {
        if (disjunction->disjuncts.size() >= 2) continue;
        result.emplace_back(DiagnosticKind::INVALID_DISJUNCTION_ARITY, std::to_string(disjunction->disjuncts.size()),
                            disjunction->Id(), "event disjunctions require at least two disjuncts, found " +
                            std::to_string(disjunction->disjuncts.size()));
    }
    if (!dynamic_cast<const EventDisjunction*>(&event)) return result;

    auto simpleEvents = event.SimpleEvents();
    std::set<std::string> channels, reported;
    for (const auto* simple : simpleEvents) {
        if (channels.insert(simple->channel).second) continue;
        if (!reported.insert(simple->channel).second) continue;
        result.emplace_back(DiagnosticKind::NON_UNIQUE_DISJUNCT_CHANNEL, simple->channel, simple->Id(),
                            "multiple disjuncts listen on channel '" + simple->channel + "'");
    }

    for (const auto& alias : event.Aliases()) {
        if (All(simpleEvents, [&alias](const auto* elem) { return Binds(*elem, alias); })) continue;
        result.emplace_back(DiagnosticKind::INCONSISTENT_DISJUNCTION_ALIAS, alias, event.Id(),
                            "alias '" + alias + "' is bound by only some disjuncts of " + ToString(event));
    }
    return result;
}


//
// Property shape
//

inline void CheckShape(const Property& property, const ValidationConfig& config, std::deque<Diagnostic>& result) {
    auto missing = [&result](const std::string& slot, const AstObject& node) {
        result.emplace_back(DiagnosticKind::MISSING_EVENT, slot, node.Id(), "missing " + slot);
    };

    if (!property.scope) missing("scope", property);
    else {
        auto kind = property.scope->kind;
        bool needsActivator = kind == ScopeKind::AFTER || kind == ScopeKind::AFTER_UNTIL;
        bool needsTerminator = kind == ScopeKind::UNTIL || kind == ScopeKind::AFTER_UNTIL;
        if (needsActivator && !property.scope->activator) missing("activator", *property.scope);
        if (needsTerminator && !property.scope->terminator) missing("terminator", *property.scope);
    }

    if (!property.pattern) missing("pattern", property);
    else {
        if (!property.pattern->behaviour) missing("behaviour", *property.pattern);
        const auto& rule = GetRule(*property.pattern, config);
        if (rule.requiresTrigger && !property.pattern->trigger) {
            result.emplace_back(DiagnosticKind::MISSING_TRIGGER, rule.name, property.pattern->Id(),
                                "pattern '" + rule.name + "' requires a trigger event");
        }
    }

    auto isEmpty = [](const auto& connective) { return connective.operands.empty(); };
    for (const auto* conjunction : Collect<Conjunction>(property, isEmpty)) {
        result.emplace_back(DiagnosticKind::EMPTY_CONNECTIVE, "and", conjunction->Id(), "conjunction without operands");
    }
    for (const auto* disjunction : Collect<Disjunction>(property, isEmpty)) {
        result.emplace_back(DiagnosticKind::EMPTY_CONNECTIVE, "or", disjunction->Id(), "disjunction without operands");
    }
}


//
// Aliases
//

inline const AtomicEvent& GetBinder(const Event& event, const std::string& alias) {
    for (const auto* simple : event.SimpleEvents()) {
        if (Binds(*simple, alias)) return *simple;
    }
    throw std::logic_error("Internal error: no event binds alias '" + alias + "'.");
}

inline void CheckDuplicateAliases(const std::deque<EventSlot>& slots, std::deque<Diagnostic>& result) {
    std::map<std::string, std::string> boundBy;
    std::set<std::string> reported;
    for (const auto& slot : slots) {
        for (const auto& alias : slot.event->Aliases()) {
            auto find = boundBy.find(alias);
            if (find == boundBy.end()) {
                boundBy.emplace(alias, slot.name);
                continue;
            }
            if (!reported.insert(alias).second) continue;
            result.emplace_back(DiagnosticKind::DUPLICATE_ALIAS, alias, GetBinder(*slot.event, alias).Id(),
                                "alias '" + alias + "' is bound by both the " + find->second + " and the " +
                                slot.name + " event");
        }
    }
}


//
// Pass
//

std::deque<Diagnostic> hpl::CheckStructure(const Property& property, const ValidationConfig& config,
                                           const FieldResolution& fields) {
    MEASURE("hpl::CheckStructure")
    DEBUG("Checking structure" << std::endl)
    std::deque<Diagnostic> result;
    CheckShape(property, config, result);

    auto slots = GetSlots(property, config);
    for (const auto& slot : slots) MoveInto(CheckEvent(*slot.event), result);
    CheckDuplicateAliases(slots, result);

    const auto& registry = config.GetFunctionRegistry();
    for (const auto& slot : slots) {
        for (const auto* simple : slot.event->SimpleEvents()) {
            if (!simple->predicate) continue;
            MoveInto(CheckTypes(*simple->predicate, registry, fields), result);
        }
    }
    return result;
}
