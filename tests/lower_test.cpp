#include <cassert>
#include <iostream>

#include "automat/lower.hpp"
#include "test_util.hpp"

using namespace automat;
using namespace automat::sast;

static void test_for_desugars_to_block_while(){
    TypeContext tctx;
    auto res = test::check("void F() { int I; for (I = 0; I < 3; I = I + 1) print(I); }", tctx, test::quiet_env());
    assert(res.success);
    const SFor& f = std::get<SFor>(res.program.functions.at(0).body.stmts.at(1)->data);

    SStmtPtr lowered = lower::desugar_for(f);
    const SBlock& outer = std::get<SBlock>(lowered->data);
    assert(outer.scope == f.scope);
    assert(outer.stmts.size() == 2);
    // init runs once, ahead of the loop
    const SExprStmt& init = std::get<SExprStmt>(outer.stmts[0]->data);
    assert(init.expr == f.init);

    const SWhile& loop = std::get<SWhile>(outer.stmts[1]->data);
    assert(loop.cond == f.cond);
    const SBlock& body = std::get<SBlock>(loop.body->data);
    assert(body.scope == f.scope);
    assert(body.stmts.size() == 2);
    // body first, then the update
    assert(body.stmts[0] == f.body);
    assert(std::get<SExprStmt>(body.stmts[1]->data).expr == f.update);
}

static void test_empty_header_parts(){
    TypeContext tctx;
    auto res = test::check("void F() { for (;;) { return; } }", tctx, test::quiet_env());
    assert(res.success);
    const SFor& f = std::get<SFor>(res.program.functions.at(0).body.stmts.at(0)->data);
    SStmtPtr lowered = lower::desugar_for(f);
    const SBlock& outer = std::get<SBlock>(lowered->data);
    assert(std::holds_alternative<SNoExpr>(std::get<SExprStmt>(outer.stmts[0]->data).expr->data));
    const SWhile& loop = std::get<SWhile>(outer.stmts[1]->data);
    assert(std::get<SBoolLit>(loop.cond->data).value);
}

void run_lower_tests(){
    std::cout << "[lower] for-loop lowering tests...\n";
    test_for_desugars_to_block_while();
    test_empty_header_parts();
    std::cout << "[lower] for-loop lowering tests passed\n";
}
