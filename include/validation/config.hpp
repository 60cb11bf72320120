#pragma once
#ifndef HPL_VALIDATION_CONFIG_HPP
#define HPL_VALIDATION_CONFIG_HPP

#include <map>
#include <memory>
#include <string>
#include <functional>
#include "ast/ast.hpp"
#include "ast/types.hpp"
#include "functions/registry.hpp"
#include "logics/encoding.hpp"

namespace hpl {

    /**
     * Describes how a pattern kind uses its event slots.
     */
    struct PatternRule {
        std::string name;
        bool requiresTrigger = false;
        bool triggerBindsFirst = true; // otherwise, the behaviour introduces aliases and the trigger may use them
        bool flagsUnboundResponse = false;
    };

    class PatternCatalog final {
    private:
        std::map<PatternKind, PatternRule> rules;

    public:
        void Set(PatternKind kind, PatternRule rule);
        [[nodiscard]] bool Contains(PatternKind kind) const;
        [[nodiscard]] const PatternRule& Get(PatternKind kind) const;

        /**
         * Existence and absence use only their behaviour. Response and prevention bind the trigger first,
         * requirement binds the behaviour first.
         */
        static const PatternCatalog& Builtin();
    };

    struct ValidationConfig {
        explicit ValidationConfig() = default;
        virtual ~ValidationConfig() = default;

        /**
         * Retrieves the rules for every pattern kind.
         * @return The pattern catalog.
         */
        [[nodiscard]] virtual const PatternCatalog& GetPatternCatalog() const = 0;

        /**
         * Retrieves the functions predicates may call. Validation freezes the registry.
         * @return The function registry.
         */
        [[nodiscard]] virtual FunctionRegistry& GetFunctionRegistry() const = 0;

        /**
         * Retrieves the schema of the messages published on a channel.
         * @param channel The channel identifier.
         * @return The message type, or 'nullptr' if the channel's schema is unknown.
         */
        [[nodiscard]] virtual const FieldType* GetMessageType(const std::string& channel) const = 0;

        /**
         * Whether channels without a known message type are reported as errors.
         */
        [[nodiscard]] virtual bool RequireMessageTypes() const = 0;

        /**
         * Whether predicates are checked for satisfiability and validity with the SMT backend.
         */
        [[nodiscard]] virtual bool EnableSmtChecks() const = 0;

        /**
         * Timeout for a single SMT query in milliseconds, 0 for no timeout.
         */
        [[nodiscard]] virtual unsigned int GetSolverTimeout() const = 0;

        /**
         * Creates the SMT backend for checking the predicates of one property.
         * @return An encoding with a fresh solver context, by default limited by 'GetSolverTimeout()'.
         */
        [[nodiscard]] virtual std::unique_ptr<Encoding> MakeEncoding() const;
    };

    struct DefaultValidationConfig : public ValidationConfig {
        std::map<std::string, std::reference_wrapper<const FieldType>> messageTypes;
        bool requireMessageTypes = false;
        bool enableSmtChecks = true;
        unsigned int solverTimeout = 0;

        void DeclareChannel(const std::string& channel, const FieldType& type);

        [[nodiscard]] const PatternCatalog& GetPatternCatalog() const override;
        [[nodiscard]] FunctionRegistry& GetFunctionRegistry() const override;
        [[nodiscard]] const FieldType* GetMessageType(const std::string& channel) const override;
        [[nodiscard]] bool RequireMessageTypes() const override;
        [[nodiscard]] bool EnableSmtChecks() const override;
        [[nodiscard]] unsigned int GetSolverTimeout() const override;
    };

} // namespace hpl

#endif //HPL_VALIDATION_CONFIG_HPP
