#include "ast/types.hpp"

#include <vector>

using namespace hpl;


//
// Value kinds
//

std::string hpl::ToString(TypeSet type) {
    static const std::vector<std::pair<TypeSet, const char*>> names = {
            { TypeSet::Bool(), "bool" }, { TypeSet::Number(), "number" }, { TypeSet::String(), "string" },
            { TypeSet::Array(), "array" }, { TypeSet::Range(), "range" }, { TypeSet::Set(), "set" },
            { TypeSet::Message(), "message" }
    };
    if (type.IsEmpty()) return "none";
    if (type == TypeSet::Any()) return "any";
    std::string result;
    for (const auto& [kind, name] : names) {
        if (!type.CanBe(kind)) continue;
        if (!result.empty()) result += " | ";
        result += name;
    }
    return result;
}

std::ostream& hpl::operator<<(std::ostream& stream, TypeSet type) {
    stream << ToString(type);
    return stream;
}


//
// Message schemas
//

FieldType::FieldType(std::string name, FieldSort sort) : name(std::move(name)), sort(sort) {}

FieldType::FieldType(std::string name, const FieldType& element, std::optional<std::size_t> length)
        : name(std::move(name)), sort(FieldSort::ARRAY), element(&element), length(length) {}

bool FieldType::operator==(const FieldType& other) const { return this == &other; }

bool FieldType::operator!=(const FieldType& other) const { return this != &other; }

std::optional<std::reference_wrapper<const FieldType>> FieldType::GetField(const std::string& fieldName) const {
    auto find = fields.find(fieldName);
    if (find != fields.end()) return find->second;
    else return std::nullopt;
}

void FieldType::AddField(const std::string& fieldName, const FieldType& type) {
    fields.insert_or_assign(fieldName, std::cref(type));
}

TypeSet FieldType::GetKinds() const {
    switch (sort) {
        case FieldSort::BOOL: return TypeSet::Bool();
        case FieldSort::NUMBER: return TypeSet::Number();
        case FieldSort::STRING: return TypeSet::String();
        case FieldSort::ARRAY: return TypeSet::Array();
        case FieldSort::MESSAGE: return TypeSet::Message();
    }
    return TypeSet::None();
}

const FieldType& FieldType::Bool() {
    static const FieldType type = FieldType("bool", FieldSort::BOOL);
    return type;
}

const FieldType& FieldType::Number() {
    static const FieldType type = FieldType("float64", FieldSort::NUMBER);
    return type;
}

const FieldType& FieldType::String() {
    static const FieldType type = FieldType("string", FieldSort::STRING);
    return type;
}
