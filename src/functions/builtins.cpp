#include "functions/registry.hpp"

using namespace hpl;


inline FunctionSignature Unary(TypeSet parameter, TypeSet result) {
    return FunctionSignature(parameter, result);
}

inline FunctionSignature Aggregate() {
    return FunctionSignature({
        Parameters({ TypeSet::Composite() }),
        Parameters({ TypeSet::Number(), TypeSet::Number() }, true)
    }, TypeSet::Number());
}

inline FunctionSignature Orientation() {
    return FunctionSignature({
        Parameters({ TypeSet::Message() }),
        Parameters({ TypeSet::Number(), TypeSet::Number(), TypeSet::Number(), TypeSet::Number() })
    }, TypeSet::Number());
}

void hpl::RegisterBuiltins(FunctionRegistry& registry) {
    const auto number = TypeSet::Number();
    const auto primitive = TypeSet::Primitive();
    const auto composite = TypeSet::Composite();

    registry.Register("abs", Unary(number, number));
    registry.Register("bool", Unary(primitive, TypeSet::Bool()));
    registry.Register("int", Unary(primitive, number));
    registry.Register("float", Unary(primitive, number));
    registry.Register("str", Unary(primitive, TypeSet::String()));
    registry.Register("len", Unary(composite, number));
    registry.Register("sum", Unary(composite, number));
    registry.Register("prod", Unary(composite, number));
    registry.Register("sqrt", Unary(number, number));
    registry.Register("ceil", Unary(number, number));
    registry.Register("floor", Unary(number, number));
    registry.Register("log", FunctionSignature(number, number, number));
    registry.Register("sin", Unary(number, number));
    registry.Register("cos", Unary(number, number));
    registry.Register("tan", Unary(number, number));
    registry.Register("asin", Unary(number, number));
    registry.Register("acos", Unary(number, number));
    registry.Register("atan", Unary(number, number));
    registry.Register("atan2", FunctionSignature(number, number, number));
    registry.Register("deg", Unary(number, number));
    registry.Register("rad", Unary(number, number));

    // positions
    registry.Register("x", Unary(TypeSet::Message(), number));
    registry.Register("y", Unary(TypeSet::Message(), number));
    registry.Register("z", Unary(TypeSet::Message(), number));

    registry.Register("max", Aggregate());
    registry.Register("min", Aggregate());
    registry.Register("gcd", Aggregate());

    // orientations, either from a quaternion message or from its four components
    registry.Register("roll", Orientation());
    registry.Register("pitch", Orientation());
    registry.Register("yaw", Orientation());
}
