#include "automat/diagnostics.hpp"

#include <sstream>

namespace automat {

const char* stage_name(Stage s){
    switch(s){
        case Stage::Lexical: return "lexical";
        case Stage::Syntax: return "syntax";
        case Stage::Semantic: return "semantic";
        case Stage::Internal: return "internal";
    }
    return "internal";
}

CompileError::CompileError(Diagnostic d)
    : std::runtime_error(format_diagnostic(d)), diag_(std::move(d)) {}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    if(!d.file.empty()) os << d.file << ":";
    if(d.line>=0) os << d.line << ":" << d.col << ":";
    if(!d.file.empty() || d.line>=0) os << " ";
    os << stage_name(d.stage) << " error[" << d.code << "]: " << d.message;
    for(auto& n : d.notes){
        os << "\n  note: " << n.message;
    }
    if(!d.hint.empty()) os << "\n  hint: " << d.hint;
    return os.str();
}

void internal_error(std::string code, std::string message){
    Diagnostic d; d.stage=Stage::Internal; d.code=std::move(code);
    d.message="internal error: " + message;
    throw CompileError(std::move(d));
}

} // namespace automat
