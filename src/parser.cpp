#include "automat/parser.hpp"
#include "automat/diagnostics.hpp"

#include <utility>

namespace automat {

namespace ast {

const char* binop_symbol(BinOp op){
    switch(op){
        case BinOp::Add: return "+";
        case BinOp::Sub: return "-";
        case BinOp::Mul: return "*";
        case BinOp::Div: return "/";
        case BinOp::Eq: return "==";
        case BinOp::Ne: return "!=";
        case BinOp::Lt: return "<";
        case BinOp::Le: return "<=";
        case BinOp::Gt: return ">";
        case BinOp::Ge: return ">=";
        case BinOp::And: return "&&";
        case BinOp::Or: return "||";
    }
    return "?";
}

const char* unop_symbol(UnOp op){ return op == UnOp::Neg ? "-" : "!"; }

const char* builtin_name(Builtin b){
    switch(b){
        case Builtin::Print: return "print";
        case Builtin::PrintStr: return "printstr";
        case Builtin::Rows: return "rows";
        case Builtin::Cols: return "cols";
    }
    return "?";
}

} // namespace ast

using namespace ast;

namespace {

const Parser::OpTable kEqualityOps = { {"==", BinOp::Eq}, {"!=", BinOp::Ne} };
const Parser::OpTable kRelationalOps = { {"<", BinOp::Lt}, {"<=", BinOp::Le}, {">", BinOp::Gt}, {">=", BinOp::Ge} };
const Parser::OpTable kAdditiveOps = { {"+", BinOp::Add}, {"-", BinOp::Sub} };
const Parser::OpTable kTermOps = { {"*", BinOp::Mul}, {"/", BinOp::Div} };

bool is_trivia(const LexToken& t){ return t.kind == Tok::Whitespace || t.kind == Tok::LineEnd; }

} // namespace

Parser::Parser(std::vector<LexToken> toks, TypeContext& tctx, const SourceFiles& files)
    : toks_(std::move(toks)), tctx_(tctx), files_(files) {
    if(toks_.empty() || toks_.back().kind != Tok::Eof){
        LexToken eof; eof.kind = Tok::Eof;
        if(!toks_.empty()) eof.loc = toks_.back().loc;
        toks_.push_back(std::move(eof));
    }
}

const LexToken& Parser::peek(size_t ahead){
    size_t i = pos_;
    for(;;){
        while(i + 1 < toks_.size() && is_trivia(toks_[i])) ++i;
        if(ahead == 0 || toks_[i].kind == Tok::Eof) return toks_[i];
        --ahead; ++i;
    }
}

const LexToken& Parser::advance(){
    while(pos_ + 1 < toks_.size() && is_trivia(toks_[pos_])) ++pos_;
    const LexToken& t = toks_[pos_];
    if(t.kind != Tok::Eof) ++pos_;
    return t;
}

bool Parser::check(Tok kind, const char* text, size_t ahead){
    const LexToken& t = peek(ahead);
    if(t.kind != kind) return false;
    return !text || t.text == text;
}

bool Parser::accept(Tok kind, const char* text){
    if(!check(kind, text)) return false;
    advance();
    return true;
}

const LexToken& Parser::expect(Tok kind, const char* text, const char* what){
    if(!check(kind, text)) unexpected(peek(), what);
    return advance();
}

void Parser::unexpected(const LexToken& t, const std::string& expected){
    ErrorReporter rep{Stage::Syntax, &files_};
    if(t.kind == Tok::Eof)
        rep.fail("P0002", "unexpected end of input", t.loc, "expected " + expected);
    rep.fail("P0001", "unexpected token '" + t.text + "'", t.loc, "expected " + expected);
}

// --- types ----------------------------------------------------------------

bool Parser::at_type(){
    const LexToken& t = peek();
    if(t.kind != Tok::Keyword) return false;
    return t.text=="int" || t.text=="bool" || t.text=="float" || t.text=="void"
        || t.text=="string" || t.text=="auto" || t.text=="matrix";
}

TypeId Parser::parse_type(){
    const LexToken& t = peek();
    if(!at_type()) unexpected(t, "a type");
    advance();
    if(t.text=="int") return tctx_.int_type();
    if(t.text=="bool") return tctx_.bool_type();
    if(t.text=="float") return tctx_.float_type();
    if(t.text=="void") return tctx_.void_type();
    if(t.text=="string") return tctx_.string_type();
    if(t.text=="auto") return tctx_.auto_type();
    // matrix<elem, rows, cols>
    expect(Tok::Punct, "<", "'<'");
    TypeId elem;
    if(accept(Tok::Keyword, "int")) elem = tctx_.int_type();
    else if(accept(Tok::Keyword, "float")) elem = tctx_.float_type();
    else if(accept(Tok::Keyword, "bool")) elem = tctx_.bool_type();
    else unexpected(peek(), "matrix element type (int, float or bool)");
    expect(Tok::Punct, ",", "','");
    int32_t rows = expect(Tok::IntLit, nullptr, "row count").ival;
    expect(Tok::Punct, ",", "','");
    int32_t cols = expect(Tok::IntLit, nullptr, "column count").ival;
    expect(Tok::Punct, ">", "'>'");
    return tctx_.get_matrix(elem, static_cast<uint32_t>(rows), static_cast<uint32_t>(cols));
}

// --- declarations -----------------------------------------------------------

Program Parser::parse_program(){
    Program prog;
    while(peek().kind != Tok::Eof) parse_top_level(prog);
    return prog;
}

void Parser::parse_top_level(Program& prog){
    SourceLoc loc = peek().loc;
    TypeId ty = parse_type();
    const LexToken& name = expect(Tok::Identifier, nullptr, "a name");
    if(check(Tok::Punct, "(")){
        prog.functions.push_back(parse_function(ty, name));
        prog.functions.back().loc = loc;
        return;
    }
    if(accept(Tok::Punct, ";")){
        prog.globals.push_back(Global{ty, name.text, name.loc});
        return;
    }
    unexpected(peek(), "'(' or ';'");
}

Function Parser::parse_function(TypeId ret, const LexToken& name){
    Function fn;
    fn.ret = ret;
    fn.name = name.text;
    expect(Tok::Punct, "(", "'('");
    if(!check(Tok::Punct, ")")){
        do {
            TypeId fty = parse_type();
            const LexToken& fname = expect(Tok::Identifier, nullptr, "a parameter name");
            fn.formals.push_back(Formal{fty, fname.text, fname.loc});
        } while(accept(Tok::Punct, ","));
    }
    expect(Tok::Punct, ")", "')'");
    fn.body = parse_block();
    return fn;
}

// --- statements -------------------------------------------------------------

Block Parser::parse_block(){
    expect(Tok::Punct, "{", "'{'");
    Block b;
    while(!check(Tok::Punct, "}")){
        if(peek().kind == Tok::Eof) unexpected(peek(), "'}'");
        b.stmts.push_back(parse_statement());
    }
    advance();
    return b;
}

StmtPtr Parser::parse_statement(){
    SourceLoc loc = peek().loc;
    if(check(Tok::Punct, "{")) return make_stmt(parse_block(), loc);

    if(at_type()){
        TypeId ty = parse_type();
        const LexToken& name = expect(Tok::Identifier, nullptr, "a variable name");
        ExprPtr init;
        if(accept(Tok::Punct, "=")) init = parse_expr();
        expect(Tok::Punct, ";", "';'");
        return make_stmt(VarDecl{ty, name.text, init}, name.loc);
    }

    if(accept(Tok::Keyword, "return")){
        ExprPtr value;
        if(!check(Tok::Punct, ";")) value = parse_expr();
        expect(Tok::Punct, ";", "';'");
        return make_stmt(Return{value}, loc);
    }

    if(accept(Tok::Keyword, "if")){
        expect(Tok::Punct, "(", "'('");
        ExprPtr cond = parse_expr();
        expect(Tok::Punct, ")", "')'");
        StmtPtr then_branch = parse_statement();
        StmtPtr else_branch;
        if(accept(Tok::Keyword, "else")) else_branch = parse_statement();
        return make_stmt(If{cond, then_branch, else_branch}, loc);
    }

    if(accept(Tok::Keyword, "while")){
        expect(Tok::Punct, "(", "'('");
        ExprPtr cond = parse_expr();
        expect(Tok::Punct, ")", "')'");
        return make_stmt(While{cond, parse_statement()}, loc);
    }

    if(accept(Tok::Keyword, "for")){
        expect(Tok::Punct, "(", "'('");
        For f;
        f.init = check(Tok::Punct, ";") ? make_expr(NoExpr{}, peek().loc) : parse_expr();
        expect(Tok::Punct, ";", "';'");
        // an omitted condition loops forever
        f.cond = check(Tok::Punct, ";") ? make_expr(BoolLit{true}, peek().loc) : parse_expr();
        expect(Tok::Punct, ";", "';'");
        f.update = check(Tok::Punct, ")") ? make_expr(NoExpr{}, peek().loc) : parse_expr();
        expect(Tok::Punct, ")", "')'");
        f.body = parse_statement();
        return make_stmt(std::move(f), loc);
    }

    ExprPtr e = parse_expr();
    expect(Tok::Punct, ";", "';'");
    return make_stmt(ExprStmt{e}, loc);
}

// --- expressions ------------------------------------------------------------

ExprPtr Parser::parse_expression_only(){
    ExprPtr e = parse_expr();
    if(peek().kind != Tok::Eof) unexpected(peek(), "end of input");
    return e;
}

ExprPtr Parser::parse_expr(){
    if(check(Tok::Identifier) && check(Tok::Punct, "=", 1)){
        const LexToken& name = advance();
        advance();
        return make_expr(Assign{name.text, parse_expr()}, name.loc);
    }
    return parse_or();
}

ExprPtr Parser::parse_or(){
    ExprPtr lhs = parse_and();
    while(check(Tok::Punct, "||")){
        SourceLoc loc = advance().loc;
        lhs = make_expr(Binary{BinOp::Or, lhs, parse_and()}, loc);
    }
    return lhs;
}

ExprPtr Parser::parse_and(){
    ExprPtr lhs = parse_equality();
    while(check(Tok::Punct, "&&")){
        SourceLoc loc = advance().loc;
        lhs = make_expr(Binary{BinOp::And, lhs, parse_equality()}, loc);
    }
    return lhs;
}

// Left-associative level over an operator table.
ExprPtr Parser::parse_left_assoc(const OpTable& ops, ExprPtr (Parser::*next)()){
    ExprPtr lhs = (this->*next)();
    for(;;){
        const std::pair<std::string, BinOp>* hit = nullptr;
        for(const auto& e : ops) if(check(Tok::Punct, e.first.c_str())){ hit = &e; break; }
        if(!hit) return lhs;
        SourceLoc loc = advance().loc;
        lhs = make_expr(Binary{hit->second, lhs, (this->*next)()}, loc);
    }
}

ExprPtr Parser::parse_equality(){ return parse_left_assoc(kEqualityOps, &Parser::parse_relational); }
ExprPtr Parser::parse_relational(){ return parse_left_assoc(kRelationalOps, &Parser::parse_additive); }
ExprPtr Parser::parse_additive(){ return parse_left_assoc(kAdditiveOps, &Parser::parse_term); }
ExprPtr Parser::parse_term(){ return parse_left_assoc(kTermOps, &Parser::parse_unary); }

ExprPtr Parser::parse_unary(){
    if(check(Tok::Punct, "-") || check(Tok::Punct, "!")){
        const LexToken& t = advance();
        UnOp op = t.text == "-" ? UnOp::Neg : UnOp::Not;
        return make_expr(Unary{op, parse_unary()}, t.loc);
    }
    return parse_primary();
}

std::vector<ExprPtr> Parser::parse_args(){
    std::vector<ExprPtr> args;
    expect(Tok::Punct, "(", "'('");
    if(!check(Tok::Punct, ")")){
        do { args.push_back(parse_expr()); } while(accept(Tok::Punct, ","));
    }
    expect(Tok::Punct, ")", "')'");
    return args;
}

ExprPtr Parser::parse_primary(){
    const LexToken& t = peek();
    SourceLoc loc = t.loc;
    switch(t.kind){
        case Tok::IntLit: { int32_t v = advance().ival; return make_expr(IntLit{v}, loc); }
        case Tok::FloatLit: { double v = advance().fval; return make_expr(FloatLit{v}, loc); }
        case Tok::StrLit: {
            const std::string& text = advance().text;
            return make_expr(StrLit{text.substr(1, text.size()-2)}, loc);
        }
        case Tok::Identifier: {
            std::string name = advance().text;
            if(check(Tok::Punct, "(")) return make_expr(Call{name, parse_args()}, loc);
            return make_expr(Id{name}, loc);
        }
        case Tok::Keyword: {
            if(t.text == "true" || t.text == "false"){
                bool v = advance().text == "true";
                return make_expr(BoolLit{v}, loc);
            }
            Builtin fn;
            if(t.text == "print") fn = Builtin::Print;
            else if(t.text == "printstr") fn = Builtin::PrintStr;
            else if(t.text == "rows") fn = Builtin::Rows;
            else if(t.text == "cols") fn = Builtin::Cols;
            else unexpected(t, "an expression");
            advance();
            return make_expr(BuiltinCall{fn, parse_args()}, loc);
        }
        case Tok::Punct:
            if(t.text == "("){
                advance();
                ExprPtr e = parse_expr();
                expect(Tok::Punct, ")", "')'");
                return e;
            }
            if(t.text == "[") return parse_matrix_literal();
            break;
        default:
            break;
    }
    unexpected(t, "an expression");
}

ExprPtr Parser::parse_matrix_literal(){
    SourceLoc loc = expect(Tok::Punct, "[", "'['").loc;
    MatrixLit m;
    do {
        expect(Tok::Punct, "[", "'[' starting a matrix row");
        std::vector<ExprPtr> row;
        do { row.push_back(parse_scalar()); } while(accept(Tok::Punct, ","));
        expect(Tok::Punct, "]", "']'");
        m.rows.push_back(std::move(row));
    } while(accept(Tok::Punct, ","));
    expect(Tok::Punct, "]", "']'");
    return make_expr(std::move(m), loc);
}

ExprPtr Parser::parse_scalar(){
    SourceLoc loc = peek().loc;
    if(check(Tok::Keyword, "true") || check(Tok::Keyword, "false"))
        return make_expr(BoolLit{advance().text == "true"}, loc);
    bool neg = accept(Tok::Punct, "-");
    if(check(Tok::IntLit)){
        int32_t v = advance().ival;
        return make_expr(IntLit{neg ? -v : v}, loc);
    }
    if(check(Tok::FloatLit)){
        double v = advance().fval;
        return make_expr(FloatLit{neg ? -v : v}, loc);
    }
    unexpected(peek(), "a matrix element literal");
}

} // namespace automat
