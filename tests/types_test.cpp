// Tests for type interning and naming
#include <cassert>
#include <iostream>

#include "automat/types.hpp"

using namespace automat;

void run_type_tests(){
    std::cout << "[types] type tests...\n";
    TypeContext ctx;
    auto i = ctx.int_type();
    assert(i == ctx.get_base(BaseType::Int));
    assert(i != ctx.float_type());
    assert(ctx.is_numeric(i) && ctx.is_numeric(ctx.float_type()));
    assert(!ctx.is_numeric(ctx.bool_type()));
    assert(ctx.is_scalar(ctx.bool_type()) && !ctx.is_scalar(ctx.string_type()));

    auto m34 = ctx.get_matrix(i, 3, 4);
    auto m34b = ctx.get_matrix(ctx.int_type(), 3, 4);
    assert(m34 == m34b);
    assert(m34 != ctx.get_matrix(i, 4, 3));
    assert(m34 != ctx.get_matrix(ctx.float_type(), 3, 4));
    assert(ctx.is_matrix(m34) && !ctx.is_matrix(i));
    assert(ctx.at(m34).rows == 3 && ctx.at(m34).cols == 4);
    assert(ctx.at(m34).elem == i);

    assert(ctx.to_string(m34) == "matrix<int, 3, 4>");
    assert(ctx.to_string(ctx.auto_type()) == "auto");
    assert(ctx.to_string(ctx.string_type()) == "string");
    assert(base_name(BaseType::Void) == "void");

    TypeContext other;
    auto f = other.get_matrix(other.float_type(), 1, 1);
    assert(other.to_string(f) == "matrix<float, 1, 1>");
    std::cout << "[types] type tests passed\n";
}
