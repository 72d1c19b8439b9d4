// Typed tree: what the analyzer hands to lowering and IR generation.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "automat/ast.hpp"
#include "automat/scope.hpp"
#include "automat/types.hpp"

namespace automat::sast {

struct SExpr;
struct SStmt;
using SExprPtr = std::shared_ptr<SExpr>;
using SStmtPtr = std::shared_ptr<SStmt>;

struct SIntLit { int32_t value; };
struct SFloatLit { double value; };
struct SBoolLit { bool value; };
struct SStrLit { std::string value; };
struct SMatrixLit { std::vector<std::vector<SExprPtr>> rows; };
struct SId { std::string name; };
struct SBinary { ast::BinOp op; SExprPtr lhs; SExprPtr rhs; };
struct SUnary { ast::UnOp op; SExprPtr operand; };
struct SAssign { std::string name; SExprPtr value; };
struct SCall { std::string callee; std::vector<SExprPtr> args; };
struct SBuiltinCall { ast::Builtin fn; std::vector<SExprPtr> args; };
struct SNoExpr {};

using SExprData = std::variant<SIntLit, SFloatLit, SBoolLit, SStrLit, SMatrixLit, SId, SBinary, SUnary, SAssign, SCall, SBuiltinCall, SNoExpr>;

struct SExpr {
    TypeId type;
    SExprData data;
};

struct SBlock { std::vector<SStmtPtr> stmts; ScopeId scope; };
struct SVarDecl { TypeId type; std::string name; SExprPtr init; }; // init may be null
struct SExprStmt { SExprPtr expr; };
struct SReturn { SExprPtr value; };                                 // null for `return;`
struct SIf { SExprPtr cond; SStmtPtr then_branch; SStmtPtr else_branch; }; // else is an empty block when absent
struct SWhile { SExprPtr cond; SStmtPtr body; };
struct SFor { SExprPtr init; SExprPtr cond; SExprPtr update; SStmtPtr body; ScopeId scope; };

using SStmtData = std::variant<SBlock, SVarDecl, SExprStmt, SReturn, SIf, SWhile, SFor>;

struct SStmt { SStmtData data; };

struct SFormal { TypeId type; std::string name; };
struct SFunction {
    TypeId ret;
    std::string name;
    std::vector<SFormal> formals;
    SBlock body; // body.scope holds the formals
};
struct SGlobal { TypeId type; std::string name; };

struct SProgram {
    std::vector<SGlobal> globals;
    std::vector<SFunction> functions;
    ScopeArena scopes;
    ScopeId global_scope = 0;
};

template<typename T>
SExprPtr make_sexpr(TypeId type, T data){ return std::make_shared<SExpr>(SExpr{type, SExprData{std::move(data)}}); }
template<typename T>
SStmtPtr make_sstmt(T data){ return std::make_shared<SStmt>(SStmt{SStmtData{std::move(data)}}); }

} // namespace automat::sast
