#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "automat/compiler.hpp"

static std::string read_all(std::istream& is){
    std::ostringstream ss; ss << is.rdbuf(); return ss.str();
}

static int usage(){
    std::cerr << "usage: automatc [-I dir] [-D NAME[=VALUE]] [-o out.ll] [--verify] [--json] [file|-]\n";
    return 2;
}

int main(int argc, char** argv){
    try{
        automat::CompileEnv env = automat::detectEnv();
        std::string input = "-";
        std::string output;
        bool haveInput = false;
        for(int i=1;i<argc;++i){
            std::string a = argv[i];
            if(a == "-I" || a == "-D" || a == "-o"){
                if(i+1 >= argc) return usage();
                std::string v = argv[++i];
                if(a == "-I") env.includePath.push_back(v);
                else if(a == "-o") output = v;
                else {
                    std::pair<std::string,std::string> def;
                    if(!automat::parse_define(v, def)) return usage();
                    env.defines.push_back(std::move(def));
                }
            } else if(a.size() > 2 && (a.rfind("-I", 0) == 0 || a.rfind("-D", 0) == 0)){
                std::string v = a.substr(2);
                if(a[1] == 'I') env.includePath.push_back(v);
                else {
                    std::pair<std::string,std::string> def;
                    if(!automat::parse_define(v, def)) return usage();
                    env.defines.push_back(std::move(def));
                }
            } else if(a == "--verify"){
                env.verifyIR = true;
            } else if(a == "--json"){
                env.diagJson = true;
            } else if(a == "-h" || a == "--help"){
                usage();
                return 0;
            } else if(!a.empty() && a[0] == '-' && a != "-"){
                std::cerr << "automatc: unknown option '" << a << "'\n";
                return usage();
            } else {
                if(haveInput) return usage();
                input = a; haveInput = true;
            }
        }

        automat::Compiler compiler(env);
        automat::CompileResult res;
        if(input == "-"){
            const auto src = read_all(std::cin);
            compiler.compile(src, "<stdin>", res);
        } else {
            compiler.compile_file(input, res);
        }
        if(!res.success){
            if(res.error && !env.diagJson) std::cerr << automat::format_diagnostic(*res.error) << "\n";
            return 1;
        }
        const std::string ir = compiler.to_ir_text();
        if(output.empty()){
            std::cout << ir;
        } else {
            std::ofstream out(output, std::ios::binary);
            if(!out){ std::cerr << "automatc: cannot write '" << output << "'\n"; return 2; }
            out << ir;
        }
        return 0;
    } catch(const std::exception& e){
        std::cerr << "automatc: exception: " << e.what() << "\n";
        return 2;
    }
}
