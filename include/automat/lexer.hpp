#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "automat/env.hpp"
#include "automat/preprocess.hpp"
#include "automat/source.hpp"

namespace automat {

enum class Tok {
    Keyword,
    Identifier,
    IntLit,
    FloatLit,
    StrLit,
    Punct,
    Whitespace,
    LineEnd,
    Fallback,
    Eof
};

const char* tok_name(Tok t);

struct LexToken {
    Tok kind{Tok::Eof};
    std::string text;
    int32_t ival=0;   // IntLit
    double fval=0.0;  // FloatLit
    SourceLoc loc;    // position in the original unit
};

// Keywords and built-in pseudo-function names share the lowercase word space.
bool is_keyword(const std::string& word);

// Turns preprocessed text into language tokens. Whitespace and line ends are
// kept as tokens; the parser discards them.
class Lexer {
public:
    Lexer(const pp::Output& src, const CompileEnv& env) : src_(src), env_(env) {}
    std::vector<LexToken> run();
private:
    const pp::Output& src_;
    const CompileEnv& env_;
};

} // namespace automat
