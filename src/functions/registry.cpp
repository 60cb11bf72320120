#include "functions/registry.hpp"

#include <stdexcept>
#include "util/log.hpp"

using namespace hpl;


//
// Signatures
//

Parameters::Parameters(std::vector<TypeSet> kinds_, bool variadic) : kinds(std::move(kinds_)), variadic(variadic) {
    if (variadic && kinds.empty()) throw std::logic_error("Internal error: variadic parameters must not be empty.");
}

bool Parameters::Accepts(std::size_t arity) const {
    if (variadic) return arity >= kinds.size();
    return arity == kinds.size();
}

TypeSet Parameters::KindAt(std::size_t position) const {
    if (position < kinds.size()) return kinds.at(position);
    if (variadic) return kinds.back();
    throw std::logic_error("Internal error: parameter position out of range.");
}

FunctionSignature::FunctionSignature(std::vector<Parameters> overloads_, TypeSet result)
        : overloads(std::move(overloads_)), result(result) {
    if (overloads.empty()) throw std::logic_error("Internal error: function signature without overloads.");
}

FunctionSignature::FunctionSignature(TypeSet parameter, TypeSet result)
        : FunctionSignature({ Parameters({ parameter }) }, result) {}

FunctionSignature::FunctionSignature(TypeSet first, TypeSet second, TypeSet result)
        : FunctionSignature({ Parameters({ first, second }) }, result) {}

inline std::optional<std::size_t> FindMismatch(const Parameters& overload, const std::vector<TypeSet>& argumentKinds) {
    for (std::size_t index = 0; index < argumentKinds.size(); ++index) {
        if ((argumentKinds.at(index) & overload.KindAt(index)).IsEmpty()) return index;
    }
    return std::nullopt;
}

CallResolution hpl::Resolve(const FunctionSignature& signature, const std::vector<TypeSet>& argumentKinds) {
    const Parameters* firstCandidate = nullptr;
    for (const auto& overload : signature.overloads) {
        if (!overload.Accepts(argumentKinds.size())) continue;
        if (!firstCandidate) firstCandidate = &overload;
        if (!FindMismatch(overload, argumentKinds)) return { CallStatus::OK, &overload, 0, TypeSet::Any() };
    }

    CallResolution result;
    if (!firstCandidate) {
        result.status = CallStatus::ARITY_MISMATCH;
        return result;
    }
    auto position = FindMismatch(*firstCandidate, argumentKinds).value();
    result.status = CallStatus::ARGUMENT_TYPE_MISMATCH;
    result.overload = firstCandidate;
    result.position = position;
    result.expected = firstCandidate->KindAt(position);
    return result;
}


//
// Registry
//

RegistryFrozenError::RegistryFrozenError(const std::string& function)
        : ExceptionWithMessage("Cannot register function '" + function + "': the function registry is frozen.") {}

void FunctionRegistry::Register(const std::string& name, FunctionSignature signature) {
    std::lock_guard<std::mutex> guard(mutex);
    if (frozen) throw RegistryFrozenError(name);
    if (name.empty()) throw std::logic_error("Internal error: function name must not be empty.");
    if (functions.count(name) != 0) {
        DEBUG("Replacing signature of function '" << name << "'" << std::endl)
        functions.erase(name);
    }
    functions.emplace(name, std::move(signature));
}

void FunctionRegistry::Freeze() {
    std::lock_guard<std::mutex> guard(mutex);
    frozen = true;
}

bool FunctionRegistry::IsFrozen() const {
    return frozen;
}

const FunctionSignature* FunctionRegistry::Lookup(const std::string& name) const {
    auto find = functions.find(name);
    if (find == functions.end()) return nullptr;
    return &find->second;
}

std::vector<std::string> FunctionRegistry::Names() const {
    std::vector<std::string> result;
    result.reserve(functions.size());
    for (const auto& entry : functions) result.push_back(entry.first);
    return result;
}

FunctionRegistry& FunctionRegistry::Global() {
    static FunctionRegistry registry;
    static std::once_flag initialized;
    std::call_once(initialized, [](){ RegisterBuiltins(registry); });
    return registry;
}
