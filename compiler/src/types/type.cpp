//! # Type Implementation
//!
//! ## Type Factory Functions
//!
//! | Function         | Creates                        |
//! |------------------|--------------------------------|
//! | `make_primitive` | Int, Float, Bool, Str, Unit    |
//! | `make_int`, etc. | Convenience for each primitive |
//! | `make_func`      | Function types                 |
//! | `make_unknown`   | Error recovery placeholder     |
//!
//! `types_equal()` is structural. `Unknown` only equals `Unknown`; callers
//! that want error suppression test `is_unknown()` first.

#include "types/type.hpp"

#include <sstream>

namespace kindred::types {

auto make_primitive(PrimitiveKind kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = PrimitiveType{kind};
    return type;
}

auto make_int() -> TypePtr {
    return make_primitive(PrimitiveKind::Int);
}

auto make_float() -> TypePtr {
    return make_primitive(PrimitiveKind::Float);
}

auto make_bool() -> TypePtr {
    return make_primitive(PrimitiveKind::Bool);
}

auto make_str() -> TypePtr {
    return make_primitive(PrimitiveKind::Str);
}

auto make_unit() -> TypePtr {
    return make_primitive(PrimitiveKind::Unit);
}

auto make_unknown() -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = UnknownType{};
    return type;
}

auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = FuncType{std::move(params), std::move(ret)};
    return type;
}

auto primitive_from_name(const std::string& name) -> std::optional<PrimitiveKind> {
    if (name == "Int")
        return PrimitiveKind::Int;
    if (name == "Float")
        return PrimitiveKind::Float;
    if (name == "Bool")
        return PrimitiveKind::Bool;
    if (name == "Str")
        return PrimitiveKind::Str;
    if (name == "Unit")
        return PrimitiveKind::Unit;
    return std::nullopt;
}

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string {
    switch (kind) {
    case PrimitiveKind::Int:
        return "Int";
    case PrimitiveKind::Float:
        return "Float";
    case PrimitiveKind::Bool:
        return "Bool";
    case PrimitiveKind::Str:
        return "Str";
    case PrimitiveKind::Unit:
        return "Unit";
    }
    return "?";
}

auto type_to_string(const TypePtr& type) -> std::string {
    if (!type)
        return "<null>";

    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, FuncType>) {
                std::stringstream ss;
                ss << "fn(";
                for (size_t i = 0; i < t.params.size(); ++i) {
                    if (i > 0)
                        ss << ", ";
                    ss << type_to_string(t.params[i]);
                }
                ss << ") -> " << type_to_string(t.return_type);
                return ss.str();
            } else {
                return "<unknown>";
            }
        },
        type->kind);
}

auto types_equal(const TypePtr& a, const TypePtr& b) -> bool {
    if (!a && !b)
        return true;
    if (!a || !b)
        return false;
    if (a == b)
        return true;

    return std::visit(
        [&b](const auto& ta) -> bool {
            using T = std::decay_t<decltype(ta)>;

            if (!std::holds_alternative<T>(b->kind))
                return false;
            const auto& tb = std::get<T>(b->kind);

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return ta.kind == tb.kind;
            } else if constexpr (std::is_same_v<T, FuncType>) {
                if (ta.params.size() != tb.params.size())
                    return false;
                for (size_t i = 0; i < ta.params.size(); ++i) {
                    if (!types_equal(ta.params[i], tb.params[i]))
                        return false;
                }
                return types_equal(ta.return_type, tb.return_type);
            } else {
                return true;
            }
        },
        a->kind);
}

auto is_primitive(const TypePtr& type, PrimitiveKind kind) -> bool {
    return type && type->is<PrimitiveType>() && type->as<PrimitiveType>().kind == kind;
}

auto is_unknown(const TypePtr& type) -> bool {
    return !type || type->is<UnknownType>();
}

auto is_numeric(const TypePtr& type) -> bool {
    return is_primitive(type, PrimitiveKind::Int) || is_primitive(type, PrimitiveKind::Float);
}

} // namespace kindred::types
