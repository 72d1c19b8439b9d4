#pragma once
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace automat {

struct CompileEnv {
    std::vector<std::string> includePath;
    // Predefined macros: (name, value). Empty value = flag-only define.
    std::vector<std::pair<std::string,std::string>> defines;
    int maxIncludeDepth = 64;
    std::string targetTriple; // empty = default
    bool verifyIR = false;
    bool diagJson = false;
    bool suggest = true;
    bool debugPP = false;
    bool debugLex = false;
    bool debugEmit = false;
};

inline bool flag_enabled(const char* name) {
    const char* v = std::getenv(name);
    if(!v) return false;
    return *v=='1' || *v=='t' || *v=='T' || *v=='y' || *v=='Y';
}

// Reads AUTOMAT_* process env vars and constructs a CompileEnv.
CompileEnv detectEnv();

// Parse "NAME" or "NAME=VALUE" into a define entry; returns false when NAME is empty.
bool parse_define(const std::string& text, std::pair<std::string,std::string>& out);

// printf-style trace line "[automat][tag] ..." on stderr.
void trace(const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace automat
