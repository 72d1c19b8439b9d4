#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/Module.h>

#include "automat/diagnostics.hpp"
#include "automat/env.hpp"
#include "automat/ir_emitter.hpp"
#include "automat/preprocess.hpp"
#include "automat/types.hpp"

namespace automat {

struct CompileResult {
    bool success=false;
    std::optional<Diagnostic> error; // exactly one on failure
};

// preprocess -> lex -> parse -> analyze -> emit. Every call starts from a
// fresh macro table, type context and LLVM context.
class Compiler {
public:
    explicit Compiler(CompileEnv env = detectEnv());
    ~Compiler();

    // Returns nullptr and fills result.error on failure; no partial module is kept.
    llvm::Module* compile(std::string_view source, const std::string& filename, CompileResult& result);
    llvm::Module* compile_file(const std::string& path, CompileResult& result);

    // Textual IR of the last successful compilation (empty when there is none).
    std::string to_ir_text() const;
    // Hands the module to the caller; empty when the last compilation failed.
    llvm::orc::ThreadSafeModule toThreadSafeModule();

    const CompileEnv& env() const { return env_; }
    CompileEnv& env() { return env_; }
    // Replace how #include targets are read (tests use in-memory units).
    void set_loader(pp::Preprocessor::Loader l) { loader_ = std::move(l); }

private:
    CompileEnv env_;
    pp::Preprocessor::Loader loader_;
    std::unique_ptr<TypeContext> tctx_;
    std::unique_ptr<IREmitter> emitter_; // declared after tctx_: destroyed first

    llvm::Module* run(pp::Preprocessor& pre, const std::function<pp::Output(pp::Preprocessor&)>& preprocess,
                      const std::string& filename, CompileResult& result);
};

} // namespace automat
