#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "automat/env.hpp"
#include "automat/source.hpp"

namespace automat::pp {

enum class TokenKind {
    Identifier,
    IntLit,
    StrLit,
    Whitespace, // blanks and comments
    LineEnd,
    DirInclude,
    DirDefine,
    DirUndef,
    DirIfdef,
    DirIfndef,
    DirEnd,
    Eof,
    Char        // single-character fallback
};

const char* token_kind_name(TokenKind k);

struct Token { TokenKind kind{TokenKind::Eof}; std::string text; int line=1; int col=1; };

// Tokenize a whole unit without resolving directives (diagnostics and tests only;
// the preprocessor itself reads one token at a time).
std::vector<Token> tokenize(std::string_view src, const std::string& source = "<memory>");

struct Macro {
    enum class Kind { Flag, Int, String, Alias } kind{Kind::Flag};
    std::string value; // Int: decimal text, String: quoted literal, Alias: target name
};

// Preprocessed text plus, for every output line, the unit and line it came from.
struct Output {
    std::string text;
    SourceFiles files;
    struct LineOrigin { int file; int line; };
    std::vector<LineOrigin> lines;
    SourceLoc origin(int outLine, int col) const;
};

class Preprocessor {
public:
    // Returns the unit's text, or nullopt when it cannot be read.
    using Loader = std::function<std::optional<std::string>(const std::string& path)>;

    explicit Preprocessor(const CompileEnv& env);

    Output run(std::string_view src, const std::string& filename);
    Output run_file(const std::string& path);

    void define(const std::string& name, Macro m);
    void undefine(const std::string& name);
    bool is_defined(const std::string& name) const { return macros_.count(name) != 0; }
    const Macro* find(const std::string& name) const;
    // Expand a macro name to its replacement text; identifiers that are not value
    // macros expand to themselves.
    std::string expand(const std::string& name) const;

    void set_loader(Loader l) { loader_ = std::move(l); }

private:
    const CompileEnv& env_;
    std::map<std::string, Macro> macros_;
    Loader loader_;

    void process(std::string_view src, int file, int depth, Output& out);
    // Resolved path and text of an #include target.
    std::optional<std::pair<std::string,std::string>> resolve_include(const std::string& target, const std::string& includer) const;
};

} // namespace automat::pp
