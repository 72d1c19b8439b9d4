#pragma once
#include <string>
#include <utility>
#include <vector>

#include "automat/ast.hpp"
#include "automat/lexer.hpp"
#include "automat/types.hpp"

namespace automat {

// Recursive-descent parser over the lexer's token vector. The first syntax
// error throws a CompileError (P0001 unexpected token, P0002 unexpected end).
class Parser {
public:
    using OpTable = std::vector<std::pair<std::string, ast::BinOp>>;

    Parser(std::vector<LexToken> toks, TypeContext& tctx, const SourceFiles& files);

    ast::Program parse_program();
    // Single expression followed by end of input (tests, tooling).
    ast::ExprPtr parse_expression_only();

private:
    std::vector<LexToken> toks_;
    TypeContext& tctx_;
    const SourceFiles& files_;
    size_t pos_ = 0;

    // token cursor (skips whitespace and line ends)
    const LexToken& peek(size_t ahead = 0);
    const LexToken& advance();
    bool check(Tok kind, const char* text = nullptr, size_t ahead = 0);
    bool accept(Tok kind, const char* text);
    const LexToken& expect(Tok kind, const char* text, const char* what);
    [[noreturn]] void unexpected(const LexToken& t, const std::string& expected);

    bool at_type();
    TypeId parse_type();
    void parse_top_level(ast::Program& prog);
    ast::Function parse_function(TypeId ret, const LexToken& name);
    ast::Block parse_block();
    ast::StmtPtr parse_statement();

    ast::ExprPtr parse_left_assoc(const OpTable& ops, ast::ExprPtr (Parser::*next)());
    ast::ExprPtr parse_expr();
    ast::ExprPtr parse_or();
    ast::ExprPtr parse_and();
    ast::ExprPtr parse_equality();
    ast::ExprPtr parse_relational();
    ast::ExprPtr parse_additive();
    ast::ExprPtr parse_term();
    ast::ExprPtr parse_unary();
    ast::ExprPtr parse_primary();
    ast::ExprPtr parse_matrix_literal();
    ast::ExprPtr parse_scalar();
    std::vector<ast::ExprPtr> parse_args();
};

} // namespace automat
