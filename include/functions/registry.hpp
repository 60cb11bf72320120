#pragma once
#ifndef HPL_FUNCTIONS_REGISTRY_HPP
#define HPL_FUNCTIONS_REGISTRY_HPP

#include <map>
#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <optional>
#include "ast/types.hpp"
#include "util/shortcuts.hpp"

namespace hpl {

    /**
     * One overload of a function. If 'variadic' is set, the last parameter kind may be repeated arbitrarily often.
     */
    struct Parameters {
        std::vector<TypeSet> kinds;
        bool variadic = false;

        explicit Parameters(std::vector<TypeSet> kinds, bool variadic = false);
        [[nodiscard]] bool Accepts(std::size_t arity) const;
        [[nodiscard]] TypeSet KindAt(std::size_t position) const;
    };

    struct FunctionSignature {
        std::vector<Parameters> overloads;
        TypeSet result;

        explicit FunctionSignature(std::vector<Parameters> overloads, TypeSet result);
        explicit FunctionSignature(TypeSet parameter, TypeSet result);
        explicit FunctionSignature(TypeSet first, TypeSet second, TypeSet result);
    };

    enum struct CallStatus {
        OK, ARITY_MISMATCH, ARGUMENT_TYPE_MISMATCH
    };

    struct CallResolution {
        CallStatus status = CallStatus::OK;
        const Parameters* overload = nullptr; // matching overload, if any
        std::size_t position = 0; // offending argument for ARGUMENT_TYPE_MISMATCH
        TypeSet expected = TypeSet::Any();
    };

    /**
     * Picks the first overload of 'signature' that accepts arguments of the given kinds.
     */
    CallResolution Resolve(const FunctionSignature& signature, const std::vector<TypeSet>& argumentKinds);

    struct RegistryFrozenError : public ExceptionWithMessage {
        explicit RegistryFrozenError(const std::string& function);
    };

    /**
     * Maps function names to signatures. Registration is possible until the registry is frozen;
     * afterwards the registry is read-only and may be shared between threads without synchronization.
     */
    class FunctionRegistry final {
    private:
        std::map<std::string, FunctionSignature> functions;
        std::atomic<bool> frozen{false};
        std::mutex mutex;

    public:
        FunctionRegistry() = default;
        FunctionRegistry(const FunctionRegistry& other) = delete;

        void Register(const std::string& name, FunctionSignature signature);
        void Freeze();
        [[nodiscard]] bool IsFrozen() const;
        [[nodiscard]] const FunctionSignature* Lookup(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> Names() const;

        /**
         * Process-wide registry, populated with the builtin functions on first use.
         */
        static FunctionRegistry& Global();
    };

    void RegisterBuiltins(FunctionRegistry& registry);

} // namespace hpl

#endif //HPL_FUNCTIONS_REGISTRY_HPP
