#include "internal.hpp"

#include "logics/encoding.hpp"
#include "util/log.hpp"
#include "util/timer.hpp"

using namespace hpl;


inline std::string Join(const std::vector<std::string>& names) {
    std::string result;
    for (const auto& name : names) {
        if (!result.empty()) result += ", ";
        result += name;
    }
    return result;
}

inline std::set<std::string> GetReferencedAliases(const Event& event) {
    std::set<std::string> result;
    for (const auto* simple : event.SimpleEvents()) {
        if (!simple->predicate) continue;
        auto references = ReferencedAliases(*simple->predicate);
        if (simple->alias) references.erase(simple->alias.value());
        InsertInto(std::move(references), result);
    }
    return result;
}

// the dependent slot of a pattern should make use of what the binding slot observed
inline void CheckResponse(const Pattern& pattern, const PatternRule& rule, std::deque<Diagnostic>& result) {
    if (!rule.flagsUnboundResponse) return;
    const Event* first = rule.triggerBindsFirst ? pattern.trigger.get() : pattern.behaviour.get();
    const Event* second = rule.triggerBindsFirst ? pattern.behaviour.get() : pattern.trigger.get();
    if (!first || !second) return;

    auto aliases = first->Aliases();
    if (aliases.empty()) return;
    auto references = GetReferencedAliases(*second);
    if (Any(aliases, [&references](const auto& alias) { return references.count(alias) != 0; })) return;

    std::string secondName = rule.triggerBindsFirst ? "behaviour" : "trigger";
    result.emplace_back(DiagnosticKind::SUSPICIOUS_UNBOUND_RESPONSE, Join(aliases), second->Id(),
                        "the " + secondName + " of " + rule.name + " pattern does not reference any of " + Join(aliases));
}

inline void CheckOwnMessage(const AtomicEvent& event, std::deque<Diagnostic>& result) {
    if (event.predicate->IsVacuous()) return;
    if (ReferencesSelf(*event.predicate, event.alias)) return;
    result.emplace_back(DiagnosticKind::PREDICATE_IGNORES_OWN_MESSAGE, event.channel, event.predicate->Id(),
                        "there are no references to any fields of the message on channel '" + event.channel + "'");
}

inline void CheckSatisfiability(Encoding& encoding, const AtomicEvent& event, std::deque<Diagnostic>& result) {
    const auto& predicate = *event.predicate;
    if (predicate.IsVacuous()) return;
    MEASURE("hpl::CheckSatisfiability")
    try {
        auto encoded = encoding.Encode(predicate);
        if (!encoding.IsSatisfiable(encoded)) {
            result.emplace_back(DiagnosticKind::UNSATISFIABLE_PREDICATE, event.channel, predicate.Id(),
                                "predicate " + ToString(predicate) + " on channel '" + event.channel + "' never holds");
        } else if (encoding.IsValid(encoded)) {
            result.emplace_back(DiagnosticKind::TAUTOLOGICAL_PREDICATE, event.channel, predicate.Id(),
                                "predicate " + ToString(predicate) + " on channel '" + event.channel + "' always holds");
        }
    } catch (const SolvingError& error) {
        WARNING("Satisfiability of predicate on channel '" << event.channel << "' is undecided: " << error.what() << std::endl)
        result.emplace_back(DiagnosticKind::UNDECIDED_PREDICATE, event.channel, predicate.Id(),
                            "could not decide whether predicate " + ToString(predicate) + " on channel '" +
                            event.channel + "' can hold");
    }
}

std::deque<Diagnostic> hpl::CheckPatternSanity(const Property& property, const ValidationConfig& config) {
    MEASURE("hpl::CheckPatternSanity")
    DEBUG("Checking pattern sanity" << std::endl)
    std::deque<Diagnostic> result;
    if (property.pattern) CheckResponse(*property.pattern, GetRule(*property.pattern, config), result);

    std::deque<const AtomicEvent*> events;
    for (const auto& slot : GetSlots(property, config)) MoveInto(slot.event->SimpleEvents(), events);
    RemoveIf(events, [](const auto* elem) { return elem->predicate == nullptr; });

    for (const auto* event : events) CheckOwnMessage(*event, result);
    if (!config.EnableSmtChecks()) return result;

    auto encoding = config.MakeEncoding();
    for (const auto* event : events) CheckSatisfiability(*encoding, *event, result);
    return result;
}
