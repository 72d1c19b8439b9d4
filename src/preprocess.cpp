#include "automat/preprocess.hpp"
#include "automat/diagnostics.hpp"
#include "pp/grammar.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace automat::pp {

const char* token_kind_name(TokenKind k){
    switch(k){
        case TokenKind::Identifier: return "identifier";
        case TokenKind::IntLit: return "integer literal";
        case TokenKind::StrLit: return "string literal";
        case TokenKind::Whitespace: return "whitespace";
        case TokenKind::LineEnd: return "line end";
        case TokenKind::DirInclude: return "#include";
        case TokenKind::DirDefine: return "#define";
        case TokenKind::DirUndef: return "#undef";
        case TokenKind::DirIfdef: return "#ifdef";
        case TokenKind::DirIfndef: return "#ifndef";
        case TokenKind::DirEnd: return "#end";
        case TokenKind::Eof: return "end of file";
        case TokenKind::Char: return "character";
    }
    return "token";
}

namespace {

// Reads one token at a time so that excluded regions are never tokenized.
class TokenReader {
public:
    TokenReader(std::string_view src, const std::string& source)
        : in_(src.data(), src.size(), source) {}

    bool eof() { return in_.empty(); }

    Token next(){
        Token t;
        auto p = in_.position();
        t.line = static_cast<int>(p.line); t.col = static_cast<int>(p.column);
        if(in_.empty()){ t.kind = TokenKind::Eof; return t; }
        tao::pegtl::parse< grammar::token, grammar::action, grammar::control >(in_, t);
        return t;
    }

    // Consume one line of an excluded region; returns the conditional directive on it
    // (DirIfdef/DirIfndef/DirEnd) or Char when there is none.
    TokenKind skip_line(int& line){
        Token t; t.kind = TokenKind::Char;
        line = static_cast<int>(in_.position().line);
        tao::pegtl::parse< grammar::skip_line, grammar::skip_action >(in_, t);
        return t.kind;
    }

private:
    tao::pegtl::memory_input<> in_;
};

bool is_terminator(const Token& t){ return t.kind==TokenKind::LineEnd || t.kind==TokenKind::Eof; }

// Integer macro values follow the language rule: must fit a signed 32-bit int.
bool fits_int32(const std::string& text){
    int32_t v = 0;
    auto res = std::from_chars(text.data(), text.data()+text.size(), v);
    return res.ec == std::errc() && res.ptr == text.data()+text.size();
}

std::optional<std::string> read_file(const std::string& path){
    std::ifstream f(path, std::ios::binary);
    if(!f) return std::nullopt;
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

// Classify a command-line/env define value the way the #define directive would.
Macro macro_from_text(const std::string& value){
    Macro m;
    if(value.empty()) { m.kind = Macro::Kind::Flag; return m; }
    if(value.size()>=2 && value.front()=='"' && value.back()=='"'){ m.kind = Macro::Kind::String; m.value = value; return m; }
    if(fits_int32(value)){ m.kind = Macro::Kind::Int; m.value = value; return m; }
    m.kind = Macro::Kind::Alias; m.value = value;
    return m;
}

} // namespace

std::vector<Token> tokenize(std::string_view src, const std::string& source){
    std::vector<Token> out;
    TokenReader rd(src, source);
    try {
        for(;;){
            out.push_back(rd.next());
            if(out.back().kind == TokenKind::Eof) break;
        }
    } catch(const tao::pegtl::parse_error& e){
        const auto& p = e.positions().front();
        Diagnostic d; d.stage = Stage::Lexical; d.code = "L0001"; d.message = std::string(e.message());
        d.file = source; d.line = static_cast<int>(p.line); d.col = static_cast<int>(p.column);
        throw CompileError(std::move(d));
    }
    return out;
}

SourceLoc Output::origin(int outLine, int col) const {
    if(lines.empty()) return SourceLoc{0, outLine, col};
    if(outLine >= 1 && static_cast<size_t>(outLine) <= lines.size()){
        const auto& o = lines[static_cast<size_t>(outLine-1)];
        return SourceLoc{o.file, o.line, col};
    }
    const auto& last = lines.back();
    return SourceLoc{last.file, last.line + (outLine - static_cast<int>(lines.size())), col};
}

Preprocessor::Preprocessor(const CompileEnv& env) : env_(env), loader_(read_file) {
    for(const auto& d : env_.defines) define(d.first, macro_from_text(d.second));
}

void Preprocessor::define(const std::string& name, Macro m){
    macros_[name] = std::move(m);
}

void Preprocessor::undefine(const std::string& name){
    macros_.erase(name);
}

const Macro* Preprocessor::find(const std::string& name) const {
    auto it = macros_.find(name);
    return it == macros_.end() ? nullptr : &it->second;
}

std::string Preprocessor::expand(const std::string& name) const {
    std::string cur = name;
    std::set<std::string> seen;
    for(;;){
        const Macro* m = find(cur);
        if(!m) return cur;
        switch(m->kind){
            case Macro::Kind::Flag: return cur;
            case Macro::Kind::Int:
            case Macro::Kind::String: return m->value;
            case Macro::Kind::Alias:
                if(!seen.insert(cur).second) return cur; // alias cycle
                cur = m->value;
                break;
        }
    }
}

std::optional<std::pair<std::string,std::string>> Preprocessor::resolve_include(const std::string& target, const std::string& includer) const {
    namespace fs = std::filesystem;
    std::vector<fs::path> candidates;
    fs::path t(target);
    if(t.is_absolute()){
        candidates.push_back(t);
    } else {
        candidates.push_back(fs::path(includer).parent_path() / t);
        for(const auto& dir : env_.includePath) candidates.push_back(fs::path(dir) / t);
    }
    for(const auto& c : candidates){
        std::string path = c.lexically_normal().string();
        if(auto text = loader_(path)) return std::make_pair(path, std::move(*text));
    }
    return std::nullopt;
}

Output Preprocessor::run(std::string_view src, const std::string& filename){
    Output out;
    int main = out.files.add(filename);
    process(src, main, 0, out);
    return out;
}

Output Preprocessor::run_file(const std::string& path){
    auto text = loader_(path);
    if(!text){
        Diagnostic d; d.stage = Stage::Lexical; d.code = "L0003";
        d.message = "cannot read source file '" + path + "'"; d.file = path;
        throw CompileError(std::move(d));
    }
    return run(*text, path);
}

void Preprocessor::process(std::string_view src, int file, int depth, Output& out){
    ErrorReporter rep{Stage::Lexical, &out.files};
    const std::string fname = out.files.name(file);
    TokenReader rd(src, fname);
    std::vector<int> openConds; // lines of #ifdef/#ifndef still open in this unit
    bool lineStart = true;
    bool lineDirty = false;
    int curLine = 1;

    auto loc = [&](const Token& t){ return SourceLoc{file, t.line, t.col}; };
    auto newline = [&](int line){
        out.text += '\n';
        out.lines.push_back({file, line});
        lineStart = true; lineDirty = false;
    };
    auto emit = [&](const Token& t, const std::string& text){
        int l = t.line;
        for(char c : text){
            out.text += c;
            if(c=='\n'){ out.lines.push_back({file, l}); ++l; }
        }
        lineDirty = true;
    };
    auto next_arg = [&]()->Token{
        Token t;
        do { t = rd.next(); } while(t.kind == TokenKind::Whitespace);
        return t;
    };
    // A directive owns its whole line; anything after its arguments is an error.
    auto end_directive = [&](const Token& dir, const Token& term){
        if(!is_terminator(term))
            rep.fail("L0002", "unexpected '" + term.text + "' after " + token_kind_name(dir.kind) + " directive", loc(term));
        if(term.kind == TokenKind::LineEnd) newline(term.line);
    };
    auto expect_name = [&](const Token& dir)->Token{
        Token name = next_arg();
        if(name.kind != TokenKind::Identifier)
            rep.fail("L0002", std::string(token_kind_name(dir.kind)) + " expects a macro name", loc(name));
        return name;
    };

    try {
        for(;;){
            Token t = rd.next();
            curLine = t.line;
            switch(t.kind){
            case TokenKind::Eof:
                if(!openConds.empty())
                    rep.fail("L0005", "unterminated conditional (missing #end)", SourceLoc{file, openConds.back(), 1});
                if(lineDirty) newline(curLine);
                return;
            case TokenKind::LineEnd:
                newline(t.line);
                break;
            case TokenKind::Whitespace:
                emit(t, t.text);
                break;
            case TokenKind::Identifier:
                emit(t, expand(t.text));
                lineStart = false;
                break;
            case TokenKind::IntLit:
            case TokenKind::StrLit:
                emit(t, t.text);
                lineStart = false;
                break;
            case TokenKind::Char:
                if(t.text == "#" && lineStart) rep.fail("L0002", "unknown preprocessor directive", loc(t));
                emit(t, t.text);
                lineStart = false;
                break;
            case TokenKind::DirInclude: {
                if(!lineStart) rep.fail("L0002", "preprocessor directive must start a line", loc(t));
                Token arg = next_arg();
                if(arg.kind != TokenKind::StrLit)
                    rep.fail("L0002", "#include expects a quoted file name", loc(arg));
                Token term = next_arg();
                if(!is_terminator(term))
                    rep.fail("L0002", "unexpected '" + term.text + "' after #include directive", loc(term));
                std::string target = arg.text.substr(1, arg.text.size()-2);
                if(depth + 1 > env_.maxIncludeDepth)
                    rep.fail("L0006", "#include nested too deeply (limit " + std::to_string(env_.maxIncludeDepth) + ")", loc(t));
                auto unit = resolve_include(target, fname);
                if(!unit) rep.fail("L0003", "cannot find include file '" + target + "'", loc(arg));
                if(env_.debugPP) trace("pp", "include %s (depth %d)", unit->first.c_str(), depth+1);
                int inc = out.files.add(unit->first);
                process(unit->second, inc, depth+1, out);
                if(term.kind == TokenKind::LineEnd) newline(term.line);
                break;
            }
            case TokenKind::DirDefine: {
                if(!lineStart) rep.fail("L0002", "preprocessor directive must start a line", loc(t));
                Token name = expect_name(t);
                Token v = next_arg();
                Macro m;
                if(is_terminator(v)){
                    m.kind = Macro::Kind::Flag;
                } else {
                    bool neg = false;
                    if(v.kind == TokenKind::Char && v.text == "-"){
                        neg = true; v = rd.next();
                        if(v.kind != TokenKind::IntLit) rep.fail("L0002", "invalid macro value", loc(v));
                    }
                    if(v.kind == TokenKind::IntLit){
                        std::string text = (neg ? "-" : "") + v.text;
                        if(!fits_int32(text)) rep.fail("L0004", "integer literal '" + text + "' out of range", loc(v));
                        m.kind = Macro::Kind::Int; m.value = text;
                    } else if(v.kind == TokenKind::StrLit){
                        m.kind = Macro::Kind::String; m.value = v.text;
                    } else if(v.kind == TokenKind::Identifier){
                        m.kind = Macro::Kind::Alias; m.value = v.text;
                    } else {
                        rep.fail("L0002", "invalid macro value '" + v.text + "'", loc(v));
                    }
                    v = next_arg();
                }
                if(env_.debugPP) trace("pp", "define %s = '%s'", name.text.c_str(), m.value.c_str());
                define(name.text, std::move(m));
                end_directive(t, v);
                break;
            }
            case TokenKind::DirUndef: {
                if(!lineStart) rep.fail("L0002", "preprocessor directive must start a line", loc(t));
                Token name = expect_name(t);
                undefine(name.text);
                end_directive(t, next_arg());
                break;
            }
            case TokenKind::DirIfdef:
            case TokenKind::DirIfndef: {
                if(!lineStart) rep.fail("L0002", "preprocessor directive must start a line", loc(t));
                Token name = expect_name(t);
                Token term = next_arg();
                bool cond = is_defined(name.text);
                if(t.kind == TokenKind::DirIfndef) cond = !cond;
                end_directive(t, term);
                if(env_.debugPP) trace("pp", "%s %s -> %s", token_kind_name(t.kind), name.text.c_str(), cond ? "include" : "skip");
                if(cond){
                    openConds.push_back(t.line);
                    break;
                }
                // Excluded region: consume whole lines up to the matching #end.
                int nest = 1;
                while(nest > 0){
                    if(rd.eof()) rep.fail("L0005", "unterminated conditional (missing #end)", loc(t));
                    int line = 0;
                    TokenKind k = rd.skip_line(line);
                    if(k == TokenKind::DirIfdef || k == TokenKind::DirIfndef) ++nest;
                    else if(k == TokenKind::DirEnd) --nest;
                    newline(line);
                }
                break;
            }
            case TokenKind::DirEnd: {
                if(!lineStart) rep.fail("L0002", "preprocessor directive must start a line", loc(t));
                if(openConds.empty()) rep.fail("L0002", "#end without matching #ifdef/#ifndef", loc(t));
                openConds.pop_back();
                end_directive(t, next_arg());
                break;
            }
            }
        }
    } catch(const tao::pegtl::parse_error& e){
        const auto& p = e.positions().front();
        rep.fail("L0001", std::string(e.message()), SourceLoc{file, static_cast<int>(p.line), static_cast<int>(p.column)});
    }
}

} // namespace automat::pp
