#include "test_util.hpp"

#include "automat/parser.hpp"

namespace automat::test {

pp::Preprocessor::Loader memory_loader(Units units){
    return [units = std::move(units)](const std::string& path) -> std::optional<std::string> {
        auto it = units.find(path);
        if(it == units.end()) return std::nullopt;
        return it->second;
    };
}

CompileEnv quiet_env(){
    CompileEnv env;
    env.verifyIR = true;
    return env;
}

pp::Output preprocess(const std::string& src, const CompileEnv& env, const Units& units){
    pp::Preprocessor pre(env);
    pre.set_loader(memory_loader(units));
    return pre.run(src, "main.mat");
}

std::vector<LexToken> lex(const std::string& src){
    CompileEnv env = quiet_env();
    pp::Output out = preprocess(src, env);
    Lexer lexer(out, env);
    return lexer.run();
}

std::vector<LexToken> significant(const std::vector<LexToken>& toks){
    std::vector<LexToken> out;
    for(const auto& t : toks)
        if(t.kind != Tok::Whitespace && t.kind != Tok::LineEnd && t.kind != Tok::Eof) out.push_back(t);
    return out;
}

ast::Program parse(const std::string& src, TypeContext& tctx){
    CompileEnv env = quiet_env();
    pp::Output out = preprocess(src, env);
    Lexer lexer(out, env);
    Parser parser(lexer.run(), tctx, out.files);
    return parser.parse_program();
}

ast::ExprPtr parse_expr(const std::string& src, TypeContext& tctx){
    CompileEnv env = quiet_env();
    pp::Output out = preprocess(src, env);
    Lexer lexer(out, env);
    Parser parser(lexer.run(), tctx, out.files);
    return parser.parse_expression_only();
}

TypeCheckResult check(const std::string& src, TypeContext& tctx, const CompileEnv& env){
    pp::Output out = preprocess(src, env);
    Lexer lexer(out, env);
    Parser parser(lexer.run(), tctx, out.files);
    ast::Program prog = parser.parse_program();
    TypeChecker checker(tctx, env, out.files);
    return checker.check(prog);
}

std::string compile_ir(const std::string& src, CompileResult& res, const Units& units){
    Compiler c(quiet_env());
    c.set_loader(memory_loader(units));
    if(!c.compile(src, "main.mat", res)) return {};
    return c.to_ir_text();
}

} // namespace automat::test
