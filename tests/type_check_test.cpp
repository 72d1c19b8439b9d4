#include <cassert>
#include <iostream>
#include <string>

#include "test_util.hpp"

using namespace automat;
using namespace automat::sast;
using automat::test::contains;

static TypeCheckResult check(const std::string& src, TypeContext& tctx, CompileEnv env = test::quiet_env()){
    return test::check(src, tctx, env);
}

static std::string code_of(const std::string& src){
    TypeContext tctx;
    auto res = check(src, tctx);
    if(res.success) return "";
    assert(res.error);
    assert(res.error->stage == Stage::Semantic);
    return res.error->code;
}

static void test_declaration_errors(){
    assert(code_of("int G; float G;") == "E0101");
    assert(code_of("int F() { return 1; } void F() { }") == "E0102");
    assert(code_of("int F(int A, float A) { return 1; }") == "E0103");
    assert(code_of("void F() { int X; bool X; }") == "E0104");
    assert(code_of("void F(int A) { int A; }") == "E0104");
    // functions and variables live in separate namespaces
    assert(code_of("int F; int F() { return F; }") == "");
}

static void test_resolution_errors(){
    assert(code_of("int F() { return Y; }") == "E0201");
    assert(code_of("void F() { Y = 1; }") == "E0201");
    assert(code_of("int F() { return G(); }") == "E0202");
    // names from a finished block do not leak into its siblings
    assert(code_of("void F() { { int X = 1; } X = 2; }") == "E0201");
    // callees may appear later in the unit
    assert(code_of("int A() { return B(); } int B() { return 1; }") == "");
}

static void test_auto_and_void(){
    assert(code_of("void F() { auto X; }") == "E0301");
    assert(code_of("auto G;") == "E0302");
    assert(code_of("void F(auto A) { }") == "E0302");
    assert(code_of("auto F() { return 1; }") == "E0302");
    assert(code_of("void G;") == "E0303");
    assert(code_of("void F(void A) { }") == "E0303");
    assert(code_of("void F() { void X; }") == "E0303");
    assert(code_of("void G() { } void F() { auto X = G(); }") == "E0303");
}

static void test_operator_errors(){
    assert(code_of("int F() { return 1 + 2.0; }") == "E0401");
    assert(code_of("int F() { return true * 2; }") == "E0401");
    assert(code_of("bool F() { return 1 < 2.0; }") == "E0402");
    assert(code_of("bool F() { return true == true; }") == "E0402");
    assert(code_of("bool F() { return 1.0 && true; }") == "E0403");
    assert(code_of("bool F() { return true || 0; }") == "E0403");
    assert(code_of("bool F() { return -true; }") == "E0404");
    assert(code_of("int F() { return !1; }") == "E0404");
}

static void test_assignment_and_condition_errors(){
    assert(code_of("void F() { int X = 1.5; }") == "E0405");
    assert(code_of("void F() { float X; X = 1; }") == "E0405");
    assert(code_of("void F() { string S = 1; }") == "E0405");
    assert(code_of("void F() { if (1) { } }") == "E0406");
    assert(code_of("void F() { while (1.0) { } }") == "E0406");
    assert(code_of("void F() { for (; 1; ) { } }") == "E0406");
}

static void test_call_errors(){
    assert(code_of("int G(int A) { return A; } int F() { return G(); }") == "E0501");
    assert(code_of("int G(int A) { return A; } int F() { return G(1, 2); }") == "E0501");
    assert(code_of("void F() { print(1, 2); }") == "E0501");
    assert(code_of("int G(int A) { return A; } int F() { return G(1.0); }") == "E0502");
    assert(code_of("void F() { print(\"text\"); }") == "E0503");
    assert(code_of("void F() { printstr(1); }") == "E0503");
    assert(code_of("int F() { return rows(3); }") == "E0503");
    assert(code_of("void F() { print(1); print(true); print(1.5); printstr(\"s\"); }") == "");
}

static void test_return_errors(){
    assert(code_of("int F() { return; }") == "E0601");
    assert(code_of("int F() { return 1.0; }") == "E0601");
    assert(code_of("void F() { return 1; }") == "E0602");
    assert(code_of("void F() { return; }") == "");
    // falling off the end is allowed for every return type
    assert(code_of("int F() { }") == "");
}

static void test_matrix_errors(){
    assert(code_of("void F() { auto M = [[1, 2.0]]; }") == "E0701");
    assert(code_of("void F() { auto M = [[1, 2], [3]]; }") == "E0702");
    assert(code_of("void F() { matrix<int, 2, 2> M = [[1, 2, 3]]; }") == "E0703");
    assert(code_of("void F() { matrix<float, 1, 2> M = [[1, 2]]; }") == "E0703");
    assert(code_of("matrix<int, 1, 2> G; void F() { G = [[1, 2]]; }") == "");
    assert(code_of("int F() { matrix<bool, 2, 3> M; return rows(M) + cols(M); }") == "");
}

static const SVarDecl& decl(const SFunction& fn, size_t i){
    return std::get<SVarDecl>(fn.body.stmts.at(i)->data);
}

static void test_inference(){
    TypeContext tctx;
    auto res = check("void F() { auto X = 3; auto Y = 3.0; auto M = [[1, 2], [3, 4]]; auto B = X < 4; auto S = \"s\"; }", tctx);
    assert(res.success);
    const SFunction& fn = res.program.functions.at(0);
    assert(decl(fn, 0).type == tctx.int_type());
    assert(decl(fn, 1).type == tctx.float_type());
    assert(decl(fn, 2).type == tctx.get_matrix(tctx.int_type(), 2, 2));
    assert(decl(fn, 3).type == tctx.bool_type());
    assert(decl(fn, 4).type == tctx.string_type());
    // the initializer keeps the same resolved type
    assert(decl(fn, 0).init->type == tctx.int_type());
}

static void test_shadowing(){
    TypeContext tctx;
    auto res = check("int F() { int X = 1; { float X = 2.0; print(X); } return X; }", tctx);
    assert(res.success);
    const SFunction& fn = res.program.functions.at(0);
    const SBlock& inner = std::get<SBlock>(fn.body.stmts.at(1)->data);
    assert(inner.scope != fn.body.scope);
    assert(*res.program.scopes.parent(inner.scope) == fn.body.scope);
    const SExprStmt& p = std::get<SExprStmt>(inner.stmts.at(1)->data);
    const SBuiltinCall& call = std::get<SBuiltinCall>(p.expr->data);
    assert(call.args.at(0)->type == tctx.float_type());
    const SReturn& r = std::get<SReturn>(fn.body.stmts.at(2)->data);
    assert(r.value->type == tctx.int_type());
}

static void test_formals_and_for_scope(){
    TypeContext tctx;
    auto res = check("int SUM(int N) { int T = 0; int I; for (I = 0; I < N; I = I + 1) { T = T + I; } return T; }", tctx);
    assert(res.success);
    const SFunction& fn = res.program.functions.at(0);
    assert(res.program.scopes.lookup_local(fn.body.scope, "N"));
    const SFor& f = std::get<SFor>(fn.body.stmts.at(2)->data);
    assert(f.scope == fn.body.scope);
    assert(f.cond->type == tctx.bool_type());
    assert(std::get<SIf>(check("void F() { if (true) print(1); }", tctx).program.functions.at(0).body.stmts.at(0)->data).else_branch);
}

static void test_unbraced_bodies(){
    // a declaration used as a branch or loop body stays inside it
    assert(code_of("int F() { if (false) int Y = 1; return Y; }") == "E0201");
    assert(code_of("int F() { if (false) { } else int Y = 1; return Y; }") == "E0201");
    assert(code_of("int F() { while (false) int Y = 1; return Y; }") == "E0201");
    assert(code_of("int F() { for (; false; ) int Y = 5; return Y; }") == "E0201");
    assert(code_of("void F() { if (true) int Y = 1; else int Y = 2; }") == "");
    assert(code_of("void F() { int Y = 0; while (false) int Y = 1; }") == "");

    TypeContext tctx;
    auto res = check("void F() { if (true) int Y = 1; }", tctx);
    assert(res.success);
    const SFunction& fn = res.program.functions.at(0);
    const SIf& i = std::get<SIf>(fn.body.stmts.at(0)->data);
    const SBlock& then_block = std::get<SBlock>(i.then_branch->data);
    assert(then_block.scope != fn.body.scope);
    assert(*res.program.scopes.parent(then_block.scope) == fn.body.scope);
    assert(res.program.scopes.lookup_local(then_block.scope, "Y"));
    assert(!res.program.scopes.lookup(fn.body.scope, "Y"));
}

static void test_diagnostic_detail(){
    TypeContext tctx;
    auto res = check("int COUNT;\nint F() {\n  return COUNTT;\n}", tctx);
    assert(!res.success);
    const Diagnostic& d = *res.error;
    assert(d.code == "E0201");
    assert(d.file == "main.mat");
    assert(d.line == 3 && d.col == 10);
    assert(d.notes.size() == 1);
    assert(contains(d.notes[0].message, "did you mean COUNT"));

    CompileEnv quiet = test::quiet_env();
    quiet.suggest = false;
    TypeContext t2;
    auto plain = check("int COUNT;\nint F() { return COUNTT; }", t2, quiet);
    assert(plain.error && plain.error->notes.empty());

    TypeContext t3;
    auto fn = check("int TOTAL() { return 1; } int F() { return TOTL(); }", t3);
    assert(fn.error->code == "E0202");
    assert(contains(fn.error->notes.at(0).message, "TOTAL"));

    TypeContext t4;
    auto mism = check("void F() { int X = 1.5; }", t4);
    assert(mism.error->notes.size() == 2);
    assert(mism.error->notes[0].message == "expected: int");
    assert(mism.error->notes[1].message == "   found: float");
    // a failed check never hands out a partial tree
    assert(mism.program.functions.empty());
}

static void test_suggestion_helpers(){
    assert(TypeChecker::edit_distance("COUNT", "COUNT") == 0);
    assert(TypeChecker::edit_distance("COUNT", "COUNTT") == 1);
    assert(TypeChecker::edit_distance("ABC", "XYZ") == 3);
    auto c = TypeChecker::fuzzy_candidates("TOTL", {"TOTAL", "TOOL", "ZZZZZZ", "TOTL"});
    assert(c.size() == 2 && c[0] == "TOOL" && c[1] == "TOTAL");
}

static void test_checker_reuse(){
    // a checker holds no state between programs
    TypeContext tctx;
    CompileEnv env = test::quiet_env();
    SourceFiles files;
    files.add("main.mat");
    TypeChecker tc(tctx, env, files);
    ast::Program empty;
    assert(tc.check(empty).success);
    assert(tc.check(empty).program.functions.empty());
}

void run_type_checker_tests(){
    std::cout << "[check] type checker tests...\n";
    test_declaration_errors();
    test_resolution_errors();
    test_auto_and_void();
    test_operator_errors();
    test_assignment_and_condition_errors();
    test_call_errors();
    test_return_errors();
    test_matrix_errors();
    test_inference();
    test_shadowing();
    test_formals_and_for_scope();
    test_unbraced_bodies();
    test_diagnostic_detail();
    test_suggestion_helpers();
    test_checker_reuse();
    std::cout << "[check] type checker tests passed\n";
}
