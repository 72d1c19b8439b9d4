#include "automat/compiler.hpp"
#include "automat/diagnostics_json.hpp"
#include "automat/lexer.hpp"
#include "automat/parser.hpp"
#include "automat/type_check.hpp"

#include <llvm/Support/raw_ostream.h>

namespace automat {

Compiler::Compiler(CompileEnv env) : env_(std::move(env)) {}
Compiler::~Compiler() = default;

llvm::Module* Compiler::compile(std::string_view source, const std::string& filename, CompileResult& result){
    pp::Preprocessor pre(env_);
    return run(pre, [&](pp::Preprocessor& p){ return p.run(source, filename); }, filename, result);
}

llvm::Module* Compiler::compile_file(const std::string& path, CompileResult& result){
    pp::Preprocessor pre(env_);
    return run(pre, [&](pp::Preprocessor& p){ return p.run_file(path); }, path, result);
}

llvm::Module* Compiler::run(pp::Preprocessor& pre, const std::function<pp::Output(pp::Preprocessor&)>& preprocess,
                            const std::string& filename, CompileResult& result){
    result = CompileResult{};
    emitter_.reset();
    tctx_ = std::make_unique<TypeContext>();
    if(loader_) pre.set_loader(loader_);
    llvm::Module* M = nullptr;
    try {
        pp::Output text = preprocess(pre);
        if(env_.debugPP) trace("pp", "%s: %zu line(s) after preprocessing", filename.c_str(), text.lines.size());

        Lexer lexer(text, env_);
        Parser parser(lexer.run(), *tctx_, text.files);
        ast::Program prog = parser.parse_program();

        TypeChecker checker(*tctx_, env_, text.files);
        TypeCheckResult tc = checker.check(prog);
        if(!tc.success){
            result.error = tc.error;
        } else {
            emitter_ = std::make_unique<IREmitter>(*tctx_, env_);
            M = emitter_->emit(tc.program, filename);
            result.success = true;
        }
    } catch(const CompileError& e){
        result.error = e.diagnostic();
    }
    if(!result.success){
        emitter_.reset();
        M = nullptr;
    }
    maybe_print_json(env_, result.success, result.error);
    return M;
}

std::string Compiler::to_ir_text() const {
    if(!emitter_ || !emitter_->module()) return {};
    std::string out;
    llvm::raw_string_ostream os(out);
    emitter_->module()->print(os, nullptr);
    os.flush();
    return out;
}

llvm::orc::ThreadSafeModule Compiler::toThreadSafeModule(){
    if(!emitter_ || !emitter_->module()) return {};
    return emitter_->toThreadSafeModule();
}

} // namespace automat
