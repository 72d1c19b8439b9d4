#include "automat/env.hpp"
#include <cstdarg>
#include <cstdio>
#include <string>

namespace automat {

static std::vector<std::string> split(const std::string& s, char sep){
    std::vector<std::string> out; size_t start=0;
    for(size_t i=0;i<=s.size();++i){
        if(i==s.size() || s[i]==sep){
            if(i>start) out.push_back(s.substr(start, i-start));
            start=i+1;
        }
    }
    return out;
}

bool parse_define(const std::string& text, std::pair<std::string,std::string>& out){
    auto eq = text.find('=');
    std::string name = eq==std::string::npos ? text : text.substr(0, eq);
    std::string value = eq==std::string::npos ? std::string() : text.substr(eq+1);
    if(name.empty()) return false;
    out = {name, value};
    return true;
}

// Reads process env vars and constructs a CompileEnv.
// Note: the driver layers its command-line options on top of the result.
CompileEnv detectEnv(){
    CompileEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("AUTOMAT_INCLUDE_PATH")) e.includePath = split(v, ':');
    if (const char* v = get("AUTOMAT_DEFINES")) {
        for(auto& d : split(v, ',')){
            std::pair<std::string,std::string> def;
            if(parse_define(d, def)) e.defines.push_back(std::move(def));
        }
    }
    if (const char* v = get("AUTOMAT_MAX_INCLUDE_DEPTH")) {
        int depth = std::atoi(v);
        if(depth > 0) e.maxIncludeDepth = depth;
    }
    if (const char* v = get("AUTOMAT_TARGET_TRIPLE")) e.targetTriple = v;

    e.verifyIR = flag_enabled("AUTOMAT_VERIFY_IR");
    e.diagJson = flag_enabled("AUTOMAT_DIAG_JSON");
    // Suggestions default ON if unset; explicit 0 disables.
    if (const char* v = get("AUTOMAT_SUGGEST")) e.suggest = v[0] != '0';
    e.debugPP = flag_enabled("AUTOMAT_DEBUG_PP");
    e.debugLex = flag_enabled("AUTOMAT_DEBUG_LEX");
    e.debugEmit = flag_enabled("AUTOMAT_DEBUG_EMIT");
    return e;
}

void trace(const char* tag, const char* fmt, ...){
    std::fprintf(stderr, "[automat][%s] ", tag);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fputc('\n', stderr);
}

} // namespace automat
