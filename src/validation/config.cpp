#include "validation/config.hpp"

#include <stdexcept>
#include "ast/util.hpp"

using namespace hpl;


//
// Pattern catalog
//

void PatternCatalog::Set(PatternKind kind, PatternRule rule) {
    rules[kind] = std::move(rule);
}

bool PatternCatalog::Contains(PatternKind kind) const {
    return rules.count(kind) != 0;
}

const PatternRule& PatternCatalog::Get(PatternKind kind) const {
    auto find = rules.find(kind);
    if (find != rules.end()) return find->second;
    throw std::logic_error("Internal error: no rule for pattern '" + ToString(kind) + "'.");
}

inline PatternCatalog MakeBuiltinCatalog() {
    PatternCatalog catalog;
    catalog.Set(PatternKind::EXISTENCE, { "existence", false, true, false });
    catalog.Set(PatternKind::ABSENCE, { "absence", false, true, false });
    catalog.Set(PatternKind::RESPONSE, { "response", true, true, true });
    catalog.Set(PatternKind::REQUIREMENT, { "requirement", true, false, true });
    catalog.Set(PatternKind::PREVENTION, { "prevention", true, true, true });
    return catalog;
}

const PatternCatalog& PatternCatalog::Builtin() {
    static const PatternCatalog catalog = MakeBuiltinCatalog();
    return catalog;
}


//
// Default configuration
//

void DefaultValidationConfig::DeclareChannel(const std::string& channel, const FieldType& type) {
    messageTypes.erase(channel);
    messageTypes.emplace(channel, type);
}

const PatternCatalog& DefaultValidationConfig::GetPatternCatalog() const {
    return PatternCatalog::Builtin();
}

FunctionRegistry& DefaultValidationConfig::GetFunctionRegistry() const {
    return FunctionRegistry::Global();
}

const FieldType* DefaultValidationConfig::GetMessageType(const std::string& channel) const {
    auto find = messageTypes.find(channel);
    if (find == messageTypes.end()) return nullptr;
    return &find->second.get();
}

bool DefaultValidationConfig::RequireMessageTypes() const {
    return requireMessageTypes;
}

bool DefaultValidationConfig::EnableSmtChecks() const {
    return enableSmtChecks;
}

unsigned int DefaultValidationConfig::GetSolverTimeout() const {
    return solverTimeout;
}


//
// Validation config
//

std::unique_ptr<Encoding> ValidationConfig::MakeEncoding() const {
    return std::make_unique<Encoding>(GetSolverTimeout());
}
