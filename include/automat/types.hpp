// Closed type set of the language, interned so types compare by id.
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace automat
{

    using TypeId = uint32_t;

    enum class BaseType
    {
        Int,
        Bool,
        Float,
        Void,
        String,
        Auto
    };

    struct Type
    {
        enum class Kind
        {
            Base,
            Matrix
        } kind;
        BaseType base{};  // Base
        TypeId elem{0};   // Matrix
        uint32_t rows{0}; // Matrix
        uint32_t cols{0}; // Matrix
    };

    class TypeContext
    {
    public:
        TypeContext()
        { // seed base types (order matters only for stable ids across run)
            get_base(BaseType::Int);
            get_base(BaseType::Bool);
            get_base(BaseType::Float);
            get_base(BaseType::Void);
            get_base(BaseType::String);
            get_base(BaseType::Auto);
        }

        TypeId get_base(BaseType b)
        {
            auto key = static_cast<int>(b);
            auto it = base_index_.find(key);
            if (it != base_index_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Base;
            t.base = b;
            TypeId id = add_type(t);
            base_index_[key] = id;
            return id;
        }
        TypeId get_matrix(TypeId elem, uint32_t rows, uint32_t cols)
        {
            auto key = std::make_tuple(elem, rows, cols);
            auto it = matrix_cache_.find(key);
            if (it != matrix_cache_.end())
                return it->second;
            Type t{};
            t.kind = Type::Kind::Matrix;
            t.elem = elem;
            t.rows = rows;
            t.cols = cols;
            TypeId id = add_type(t);
            matrix_cache_[key] = id;
            return id;
        }

        TypeId int_type() { return get_base(BaseType::Int); }
        TypeId bool_type() { return get_base(BaseType::Bool); }
        TypeId float_type() { return get_base(BaseType::Float); }
        TypeId void_type() { return get_base(BaseType::Void); }
        TypeId string_type() { return get_base(BaseType::String); }
        TypeId auto_type() { return get_base(BaseType::Auto); }

        const Type &at(TypeId id) const { return types_.at(id); }

        bool is_base(TypeId id, BaseType b) const
        {
            const Type &t = at(id);
            return t.kind == Type::Kind::Base && t.base == b;
        }
        bool is_matrix(TypeId id) const { return at(id).kind == Type::Kind::Matrix; }
        bool is_numeric(TypeId id) const { return is_base(id, BaseType::Int) || is_base(id, BaseType::Float); }
        // Element types a matrix may carry.
        bool is_scalar(TypeId id) const { return is_numeric(id) || is_base(id, BaseType::Bool); }

        std::string to_string(TypeId id) const;

    private:
        std::vector<Type> types_;
        std::unordered_map<int, TypeId> base_index_;
        std::map<std::tuple<TypeId, uint32_t, uint32_t>, TypeId> matrix_cache_;
        TypeId add_type(const Type &t)
        {
            types_.push_back(t);
            return static_cast<TypeId>(types_.size() - 1);
        }
    };

    std::string base_name(BaseType b);

} // namespace automat
