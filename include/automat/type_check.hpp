// Semantic analysis: untyped tree in, typed tree or first error out.
#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "automat/ast.hpp"
#include "automat/diagnostics.hpp"
#include "automat/env.hpp"
#include "automat/sast.hpp"
#include "automat/types.hpp"

namespace automat {

struct TypeCheckResult {
    bool success=false;
    std::optional<Diagnostic> error;
    sast::SProgram program;
};

struct ParamInfo { std::string name; TypeId type; };
struct FunctionInfo { std::string name; TypeId ret; std::vector<ParamInfo> params; };

class TypeChecker {
public:
    TypeChecker(TypeContext& ctx, const CompileEnv& env, const SourceFiles& files)
        : ctx_(ctx), env_(env), rep_{Stage::Semantic, &files} {}
    TypeCheckResult check(const ast::Program& prog);

    static int edit_distance(const std::string& a, const std::string& b);
    static std::vector<std::string> fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist=2);

private:
    TypeContext& ctx_;
    const CompileEnv& env_;
    ErrorReporter rep_;

    // symbol tables (cleared per program)
    std::unordered_map<std::string, FunctionInfo> functions_;
    sast::SProgram* prog_ = nullptr;
    const FunctionInfo* current_ = nullptr;

    void reset();
    void collect_globals(const ast::Program& prog);
    void collect_functions(const ast::Program& prog);
    sast::SFunction check_function(const ast::Function& fn);

    sast::SBlock check_block(const ast::Block& b, ScopeId scope);
    sast::SStmtPtr check_stmt(const ast::Stmt& s, ScopeId scope);
    sast::SStmtPtr check_body(const ast::Stmt& s, ScopeId scope);
    sast::SExprPtr check_expr(const ast::Expr& e, ScopeId scope);
    sast::SExprPtr check_binary(const ast::Binary& b, const ast::Expr& e, ScopeId scope);
    sast::SExprPtr check_call(const ast::Call& c, const ast::Expr& e, ScopeId scope);
    sast::SExprPtr check_builtin(const ast::BuiltinCall& c, const ast::Expr& e, ScopeId scope);
    sast::SExprPtr check_matrix(const ast::MatrixLit& m, const ast::Expr& e, ScopeId scope);
    sast::SExprPtr check_condition(const ast::Expr& e, ScopeId scope, const char* what);
    // Value of type `actual` stored into a slot of type `expected` (E0405, or E0703 for matrices).
    void check_assignable(TypeId expected, TypeId actual, SourceLoc loc, const std::string& role);
    void require_concrete(TypeId t, SourceLoc loc, const std::string& role);

    [[noreturn]] void type_mismatch(const std::string& code, SourceLoc loc, const std::string& role, TypeId expected, TypeId actual);
    [[noreturn]] void fail_with_suggestions(const std::string& code, const std::string& msg, SourceLoc loc,
                                            const std::string& name, const std::vector<std::string>& pool);
};

} // namespace automat
