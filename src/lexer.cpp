#include "automat/lexer.hpp"
#include "automat/diagnostics.hpp"
#include "lex/grammar.hpp"

#include <charconv>
#include <cstdlib>
#include <set>

namespace automat {

const char* tok_name(Tok t){
    switch(t){
        case Tok::Keyword: return "keyword";
        case Tok::Identifier: return "identifier";
        case Tok::IntLit: return "integer literal";
        case Tok::FloatLit: return "float literal";
        case Tok::StrLit: return "string literal";
        case Tok::Punct: return "punctuation";
        case Tok::Whitespace: return "whitespace";
        case Tok::LineEnd: return "line end";
        case Tok::Fallback: return "character";
        case Tok::Eof: return "end of input";
    }
    return "token";
}

bool is_keyword(const std::string& word){
    static const std::set<std::string> words = {
        "int", "bool", "float", "void", "string", "auto", "matrix",
        "if", "else", "while", "for", "return", "true", "false",
        "print", "printstr", "rows", "cols"
    };
    return words.count(word) != 0;
}

std::vector<LexToken> Lexer::run(){
    ErrorReporter rep{Stage::Lexical, &src_.files};
    std::vector<LexToken> out;
    tao::pegtl::memory_input<> in(src_.text.data(), src_.text.size(), "<preprocessed>");
    try {
        while(!in.empty()){
            LexToken t;
            auto p = in.position();
            t.loc = src_.origin(static_cast<int>(p.line), static_cast<int>(p.column));
            tao::pegtl::parse< lex::grammar::token, lex::grammar::action, lex::grammar::control >(in, t);
            if(t.kind == Tok::IntLit){
                auto res = std::from_chars(t.text.data(), t.text.data()+t.text.size(), t.ival);
                if(res.ec != std::errc())
                    rep.fail("L0004", "integer literal '" + t.text + "' out of range", t.loc, "integer literals must fit in 32 bits");
            } else if(t.kind == Tok::FloatLit){
                t.fval = std::strtod(t.text.c_str(), nullptr);
            }
            if(env_.debugLex && t.kind != Tok::Whitespace && t.kind != Tok::LineEnd)
                trace("lex", "%s:%d:%d %s '%s'", src_.files.name(t.loc.file).c_str(), t.loc.line, t.loc.col, tok_name(t.kind), t.text.c_str());
            out.push_back(std::move(t));
        }
    } catch(const tao::pegtl::parse_error& e){
        const auto& p = e.positions().front();
        rep.fail("L0001", std::string(e.message()), src_.origin(static_cast<int>(p.line), static_cast<int>(p.column)));
    }
    LexToken eof;
    eof.kind = Tok::Eof;
    auto p = in.position();
    eof.loc = src_.origin(static_cast<int>(p.line), static_cast<int>(p.column));
    out.push_back(std::move(eof));
    return out;
}

} // namespace automat
