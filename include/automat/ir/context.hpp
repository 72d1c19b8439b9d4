#pragma once
#include <llvm/IR/Module.h>

#include "automat/env.hpp"

namespace automat::ir {

// Apply environment configuration to a module (target triple). Safe to call with defaults.
void applyEnvToModule(llvm::Module& M, const CompileEnv& env);

// Runs the LLVM verifier when AUTOMAT_VERIFY_IR / --verify is set; a broken
// module is an internal error (I0004).
void verifyIfRequested(llvm::Module& M, const CompileEnv& env);

} // namespace automat::ir
