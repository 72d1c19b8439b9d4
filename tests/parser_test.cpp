#include <cassert>
#include <iostream>
#include <string>

#include "test_util.hpp"

using namespace automat;
using namespace automat::ast;
using automat::test::contains;

static const Binary& as_binary(const ExprPtr& e){ return std::get<Binary>(e->data); }

static void test_precedence(){
    TypeContext tctx;
    auto e = test::parse_expr("1 + 2 * 3", tctx);
    const Binary& add = as_binary(e);
    assert(add.op == BinOp::Add);
    assert(std::get<IntLit>(add.lhs->data).value == 1);
    assert(as_binary(add.rhs).op == BinOp::Mul);

    auto rel = test::parse_expr("A < B == C < D", tctx);
    const Binary& eq = as_binary(rel);
    assert(eq.op == BinOp::Eq);
    assert(as_binary(eq.lhs).op == BinOp::Lt && as_binary(eq.rhs).op == BinOp::Lt);

    auto logic = test::parse_expr("A || B && C", tctx);
    assert(as_binary(logic).op == BinOp::Or);
    assert(as_binary(as_binary(logic).rhs).op == BinOp::And);

    auto neg = test::parse_expr("-X * 2", tctx);
    const Binary& mul = as_binary(neg);
    assert(mul.op == BinOp::Mul);
    assert(std::get<Unary>(mul.lhs->data).op == UnOp::Neg);

    auto paren = test::parse_expr("(1 + 2) * 3", tctx);
    assert(as_binary(paren).op == BinOp::Mul);
}

static void test_associativity(){
    TypeContext tctx;
    auto sub = test::parse_expr("1 - 2 - 3", tctx);
    const Binary& outer = as_binary(sub);
    assert(outer.op == BinOp::Sub);
    assert(as_binary(outer.lhs).op == BinOp::Sub);
    assert(std::get<IntLit>(outer.rhs->data).value == 3);

    auto asg = test::parse_expr("A = B = 3", tctx);
    const Assign& a = std::get<Assign>(asg->data);
    assert(a.name == "A");
    const Assign& b = std::get<Assign>(a.value->data);
    assert(b.name == "B");
    assert(std::get<IntLit>(b.value->data).value == 3);
}

static void test_calls_and_builtins(){
    TypeContext tctx;
    auto call = test::parse_expr("F(1, X + 2)", tctx);
    const Call& c = std::get<Call>(call->data);
    assert(c.callee == "F" && c.args.size() == 2);

    auto rows = test::parse_expr("rows(M)", tctx);
    const BuiltinCall& bc = std::get<BuiltinCall>(rows->data);
    assert(bc.fn == Builtin::Rows && bc.args.size() == 1);

    auto none = test::parse_expr("G()", tctx);
    assert(std::get<Call>(none->data).args.empty());
}

static void test_matrix_literal(){
    TypeContext tctx;
    auto m = test::parse_expr("[[1, -2], [3, 4]]", tctx);
    const MatrixLit& lit = std::get<MatrixLit>(m->data);
    assert(lit.rows.size() == 2);
    assert(lit.rows[0].size() == 2);
    assert(std::get<IntLit>(lit.rows[0][1]->data).value == -2);

    auto f = test::parse_expr("[[1.5, true]]", tctx);
    const MatrixLit& mixed = std::get<MatrixLit>(f->data);
    assert(std::holds_alternative<FloatLit>(mixed.rows[0][0]->data));
    assert(std::holds_alternative<BoolLit>(mixed.rows[0][1]->data));
}

static void test_program_shape(){
    TypeContext tctx;
    auto prog = test::parse(
        "matrix<int, 3, 4> M;\n"
        "int G;\n"
        "int ADD(int A, float B) { return A; }\n"
        "void MAIN() { auto X = 3; if (X < 2) X = 1; else { X = 2; } while (X > 0) X = X - 1; }\n", tctx);
    assert(prog.globals.size() == 2);
    assert(prog.globals[0].type == tctx.get_matrix(tctx.int_type(), 3, 4));
    assert(prog.globals[1].name == "G");
    assert(prog.functions.size() == 2);
    const Function& add = prog.functions[0];
    assert(add.name == "ADD" && add.formals.size() == 2);
    assert(add.formals[1].type == tctx.float_type());
    const Function& main = prog.functions[1];
    assert(main.ret == tctx.void_type());
    assert(main.body.stmts.size() == 3);
    const VarDecl& v = std::get<VarDecl>(main.body.stmts[0]->data);
    assert(v.type == tctx.auto_type() && v.init);
    const If& i = std::get<If>(main.body.stmts[1]->data);
    assert(i.else_branch && std::holds_alternative<Block>(i.else_branch->data));
    assert(std::holds_alternative<While>(main.body.stmts[2]->data));
}

static void test_for_defaults(){
    TypeContext tctx;
    auto prog = test::parse("void F() { for (;;) { } for (I = 0; I < 3; I = I + 1) print(I); }", tctx);
    const auto& stmts = prog.functions[0].body.stmts;
    const For& bare = std::get<For>(stmts[0]->data);
    assert(std::holds_alternative<NoExpr>(bare.init->data));
    assert(std::get<BoolLit>(bare.cond->data).value);
    assert(std::holds_alternative<NoExpr>(bare.update->data));
    const For& full = std::get<For>(stmts[1]->data);
    assert(std::holds_alternative<Assign>(full.init->data));
    assert(as_binary(full.cond).op == BinOp::Lt);
    assert(std::holds_alternative<ExprStmt>(full.body->data));
}

static void test_dangling_else(){
    TypeContext tctx;
    auto prog = test::parse("void F() { if (A) if (B) X = 1; else X = 2; }", tctx);
    const If& outer = std::get<If>(prog.functions[0].body.stmts[0]->data);
    assert(!outer.else_branch);
    const If& inner = std::get<If>(outer.then_branch->data);
    assert(inner.else_branch);
}

static Diagnostic parse_failure(const std::string& src){
    TypeContext tctx;
    try {
        test::parse(src, tctx);
    } catch(const CompileError& e){
        return e.diagnostic();
    }
    assert(false && "expected a syntax error");
    return {};
}

static void test_errors(){
    Diagnostic eof = parse_failure("int X");
    assert(eof.code == "P0002" && eof.stage == Stage::Syntax);

    Diagnostic init = parse_failure("int X = 3;");
    assert(init.code == "P0001");
    assert(contains(init.message, "'='"));
    assert(init.line == 1 && init.col == 7);

    Diagnostic semi = parse_failure("void F() {\n  return 1\n}");
    assert(semi.code == "P0001");
    assert(semi.line == 3 && semi.col == 1);
    assert(contains(semi.hint, "';'"));

    assert(parse_failure("matrix<string, 1, 1> M;").code == "P0001");
    assert(parse_failure("void F() { X = ; }").code == "P0001");
    assert(parse_failure("void F() { X = [[A]]; }").code == "P0001");
    assert(parse_failure("void F() { x = 1; }").code == "P0001");
    assert(parse_failure("void F() {").code == "P0002");
}

void run_parser_tests(){
    std::cout << "[parse] parser tests...\n";
    test_precedence();
    test_associativity();
    test_calls_and_builtins();
    test_matrix_literal();
    test_program_shape();
    test_for_defaults();
    test_dangling_else();
    test_errors();
    std::cout << "[parse] parser tests passed\n";
}
