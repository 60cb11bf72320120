#pragma once
#ifndef HPL_AST_TYPES_HPP
#define HPL_AST_TYPES_HPP

#include <map>
#include <string>
#include <cstdint>
#include <ostream>
#include <optional>
#include <functional>

namespace hpl {

    //
    // Coarse value kinds
    //

    enum struct ValueKind : std::uint8_t {
        BOOL = 0x01, NUMBER = 0x02, STRING = 0x04, ARRAY = 0x08, RANGE = 0x10, SET = 0x20, MESSAGE = 0x40
    };

    /**
     * Set of value kinds an expression may evaluate to. Type inference narrows these sets by intersection;
     * an empty set signals a type error.
     */
    struct TypeSet final {
        std::uint8_t bits;

        constexpr explicit TypeSet(std::uint8_t bits) : bits(static_cast<std::uint8_t>(bits & 0x7F)) {}
        constexpr TypeSet(ValueKind kind) : bits(static_cast<std::uint8_t>(kind)) {}

        [[nodiscard]] constexpr bool IsEmpty() const { return bits == 0; }
        [[nodiscard]] constexpr bool IsExact() const { return bits != 0 && (bits & (bits - 1)) == 0; }
        [[nodiscard]] constexpr bool CanBe(TypeSet other) const { return (bits & other.bits) != 0; }
        [[nodiscard]] constexpr bool IsSubsetOf(TypeSet other) const { return (bits & ~other.bits) == 0; }

        [[nodiscard]] constexpr TypeSet operator&(TypeSet other) const { return TypeSet(static_cast<std::uint8_t>(bits & other.bits)); }
        [[nodiscard]] constexpr TypeSet operator|(TypeSet other) const { return TypeSet(static_cast<std::uint8_t>(bits | other.bits)); }
        [[nodiscard]] constexpr bool operator==(TypeSet other) const { return bits == other.bits; }
        [[nodiscard]] constexpr bool operator!=(TypeSet other) const { return bits != other.bits; }

        static constexpr TypeSet None() { return TypeSet(std::uint8_t(0)); }
        static constexpr TypeSet Bool() { return TypeSet(ValueKind::BOOL); }
        static constexpr TypeSet Number() { return TypeSet(ValueKind::NUMBER); }
        static constexpr TypeSet String() { return TypeSet(ValueKind::STRING); }
        static constexpr TypeSet Array() { return TypeSet(ValueKind::ARRAY); }
        static constexpr TypeSet Range() { return TypeSet(ValueKind::RANGE); }
        static constexpr TypeSet Set() { return TypeSet(ValueKind::SET); }
        static constexpr TypeSet Message() { return TypeSet(ValueKind::MESSAGE); }
        static constexpr TypeSet Any() { return TypeSet(std::uint8_t(0x7F)); }
        static constexpr TypeSet Primitive() { return Bool() | Number() | String(); }
        static constexpr TypeSet Composite() { return Array() | Range() | Set(); }
        static constexpr TypeSet Field() { return Bool() | Number() | String() | Array() | Message(); }
        static constexpr TypeSet Item() { return Bool() | Number() | String() | Message(); }
    };

    std::string ToString(TypeSet type);
    std::ostream& operator<<(std::ostream& stream, TypeSet type);

    //
    // Message schemas
    //

    enum struct FieldSort {
        BOOL, NUMBER, STRING, ARRAY, MESSAGE
    };

    struct FieldType final {
        std::string name;
        FieldSort sort;
        std::map<std::string, std::reference_wrapper<const FieldType>> fields; // MESSAGE only
        const FieldType* element = nullptr; // ARRAY only
        std::optional<std::size_t> length; // ARRAY only, absent for unbounded arrays

        explicit FieldType(std::string name, FieldSort sort);
        explicit FieldType(std::string name, const FieldType& element, std::optional<std::size_t> length = std::nullopt);
        FieldType(const FieldType& other) = delete;

        [[nodiscard]] bool operator==(const FieldType& other) const;
        [[nodiscard]] bool operator!=(const FieldType& other) const;

        [[nodiscard]] std::optional<std::reference_wrapper<const FieldType>> GetField(const std::string& fieldName) const;
        void AddField(const std::string& fieldName, const FieldType& type);
        [[nodiscard]] TypeSet GetKinds() const;

        static const FieldType& Bool();
        static const FieldType& Number();
        static const FieldType& String();
    };

} // namespace hpl

#endif //HPL_AST_TYPES_HPP
