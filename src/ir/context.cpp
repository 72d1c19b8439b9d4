#include "automat/ir/context.hpp"
#include "automat/diagnostics.hpp"

#include <string>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

namespace automat::ir {

void applyEnvToModule(llvm::Module& M, const CompileEnv& env){
    if(!env.targetTriple.empty()){
        M.setTargetTriple(env.targetTriple);
    }
}

void verifyIfRequested(llvm::Module& M, const CompileEnv& env){
    if(!env.verifyIR) return;
    std::string msg;
    llvm::raw_string_ostream os(msg);
    if(llvm::verifyModule(M, &os)){
        os.flush();
        internal_error("I0004", "module verification failed: " + msg);
    }
    if(env.debugEmit) trace("emit", "module '%s' verified", M.getName().str().c_str());
}

} // namespace automat::ir
