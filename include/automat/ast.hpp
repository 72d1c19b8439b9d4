// Untyped syntax tree produced by the parser.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "automat/source.hpp"
#include "automat/types.hpp"

namespace automat::ast {

enum class BinOp { Add, Sub, Mul, Div, Eq, Ne, Lt, Le, Gt, Ge, And, Or };
enum class UnOp { Neg, Not };
enum class Builtin { Print, PrintStr, Rows, Cols };

const char* binop_symbol(BinOp op);
const char* unop_symbol(UnOp op);
const char* builtin_name(Builtin b);

struct Expr;
struct Stmt;
using ExprPtr = std::shared_ptr<Expr>;
using StmtPtr = std::shared_ptr<Stmt>;

struct IntLit { int32_t value; };
struct FloatLit { double value; };
struct BoolLit { bool value; };
struct StrLit { std::string value; }; // without quotes
struct MatrixLit { std::vector<std::vector<ExprPtr>> rows; };
struct Id { std::string name; };
struct Binary { BinOp op; ExprPtr lhs; ExprPtr rhs; };
struct Unary { UnOp op; ExprPtr operand; };
struct Assign { std::string name; ExprPtr value; };
struct Call { std::string callee; std::vector<ExprPtr> args; };
struct BuiltinCall { Builtin fn; std::vector<ExprPtr> args; };
struct NoExpr {}; // omitted for-init / for-update

using ExprData = std::variant<IntLit, FloatLit, BoolLit, StrLit, MatrixLit, Id, Binary, Unary, Assign, Call, BuiltinCall, NoExpr>;

struct Expr {
    ExprData data;
    SourceLoc loc;
};

struct Block { std::vector<StmtPtr> stmts; };
struct VarDecl { TypeId type; std::string name; ExprPtr init; }; // init may be null
struct ExprStmt { ExprPtr expr; };
struct Return { ExprPtr value; };                                 // value may be null
struct If { ExprPtr cond; StmtPtr then_branch; StmtPtr else_branch; }; // else may be null
struct While { ExprPtr cond; StmtPtr body; };
struct For { ExprPtr init; ExprPtr cond; ExprPtr update; StmtPtr body; };

using StmtData = std::variant<Block, VarDecl, ExprStmt, Return, If, While, For>;

struct Stmt {
    StmtData data;
    SourceLoc loc;
};

struct Formal { TypeId type; std::string name; SourceLoc loc; };
struct Function {
    TypeId ret;
    std::string name;
    std::vector<Formal> formals;
    Block body;
    SourceLoc loc;
};
struct Global { TypeId type; std::string name; SourceLoc loc; };

// Globals and functions each in source order.
struct Program {
    std::vector<Global> globals;
    std::vector<Function> functions;
};

template<typename T>
ExprPtr make_expr(T data, SourceLoc loc){ return std::make_shared<Expr>(Expr{ExprData{std::move(data)}, loc}); }
template<typename T>
StmtPtr make_stmt(T data, SourceLoc loc){ return std::make_shared<Stmt>(Stmt{StmtData{std::move(data)}, loc}); }

} // namespace automat::ast
