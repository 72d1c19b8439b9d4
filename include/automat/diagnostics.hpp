// Diagnostics shared by every compiler stage.
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "automat/source.hpp"

namespace automat {

enum class Stage { Lexical, Syntax, Semantic, Internal };

const char* stage_name(Stage s);

struct Note { std::string message; int line=-1; int col=-1; };

struct Diagnostic {
    Stage stage{Stage::Internal};
    std::string code;
    std::string message;
    std::string hint;
    std::string file;
    int line=-1;
    int col=-1;
    std::vector<Note> notes;
};

// Thrown by a stage on its first error. The compiler catches it and records
// the diagnostic; no stage ever continues after throwing.
class CompileError : public std::runtime_error {
public:
    explicit CompileError(Diagnostic d);
    const Diagnostic& diagnostic() const { return diag_; }
    Diagnostic& diagnostic() { return diag_; }
private:
    Diagnostic diag_;
};

// Lightweight factory so stages format errors the same way.
struct ErrorReporter {
    Stage stage;
    const SourceFiles* files=nullptr;

    Diagnostic make(std::string code, std::string message, SourceLoc loc, std::string hint = "") const {
        Diagnostic d; d.stage=stage; d.code=std::move(code); d.message=std::move(message);
        d.hint=std::move(hint); d.line=loc.line; d.col=loc.col;
        if(files) d.file=files->name(loc.file);
        return d;
    }
    [[noreturn]] void fail(std::string code, std::string message, SourceLoc loc, std::string hint = "") const {
        throw CompileError(make(std::move(code), std::move(message), loc, std::move(hint)));
    }
};

// "file:line:col: semantic error[E0201]: message" followed by note lines.
std::string format_diagnostic(const Diagnostic& d);

[[noreturn]] void internal_error(std::string code, std::string message);

} // namespace automat
