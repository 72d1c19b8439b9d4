#include "automat/types.hpp"

namespace automat
{

    std::string base_name(BaseType b)
    {
        switch (b)
        {
        case BaseType::Int:
            return "int";
        case BaseType::Bool:
            return "bool";
        case BaseType::Float:
            return "float";
        case BaseType::Void:
            return "void";
        case BaseType::String:
            return "string";
        case BaseType::Auto:
            return "auto";
        }
        return "<bad-base>";
    }

    std::string TypeContext::to_string(TypeId id) const
    {
        const Type &t = at(id);
        switch (t.kind)
        {
        case Type::Kind::Base:
            return base_name(t.base);
        case Type::Kind::Matrix:
            return "matrix<" + to_string(t.elem) + ", " + std::to_string(t.rows) + ", " + std::to_string(t.cols) + ">";
        }
        return "<bad-type>";
    }

} // namespace automat
