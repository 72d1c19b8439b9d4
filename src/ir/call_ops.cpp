#include "automat/ir/call_ops.hpp"
#include "automat/diagnostics.hpp"

namespace automat::ir::call_ops {

std::string symbol_name(const std::string& source){
    return source == "MAIN" ? std::string("main") : source;
}

llvm::FunctionCallee get_printf(builder::State& S){
    auto* i8p = llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(S.llctx));
    auto* fty = llvm::FunctionType::get(llvm::Type::getInt32Ty(S.llctx), {i8p}, /*isVarArg*/true);
    return S.module.getOrInsertFunction("printf", fty);
}

static llvm::Constant* format(builder::State& S, const std::string& fmt){
    auto it = S.formats.find(fmt);
    if(it != S.formats.end()) return it->second;
    llvm::Constant* c = S.builder.CreateGlobalStringPtr(fmt, "fmt", 0, &S.module);
    S.formats.emplace(fmt, c);
    return c;
}

void emit_print(builder::State& S, TypeId argType, llvm::Value* arg){
    auto& B = S.builder;
    const auto& tctx = S.tctx;
    llvm::Value* fmt = nullptr;
    if(tctx.is_base(argType, BaseType::Int)){
        fmt = format(S, "%d\n");
    } else if(tctx.is_base(argType, BaseType::Bool)){
        fmt = format(S, "%d\n");
        arg = B.CreateZExt(arg, llvm::Type::getInt32Ty(S.llctx), "zext");
    } else if(tctx.is_base(argType, BaseType::Float)){
        fmt = format(S, "%g\n");
    } else if(tctx.is_base(argType, BaseType::String)){
        fmt = format(S, "%s\n");
    } else {
        internal_error("I0002", "cannot print a value of type " + tctx.to_string(argType));
    }
    B.CreateCall(get_printf(S), {fmt, arg}, "printf");
}

llvm::Value* emit_user_call(builder::State& S, const std::string& callee, TypeId ret, const std::vector<llvm::Value*>& args){
    auto it = S.functions.find(callee);
    if(it == S.functions.end()) internal_error("I0006", "no generated function for '" + callee + "'");
    bool isVoid = S.tctx.is_base(ret, BaseType::Void);
    return S.builder.CreateCall(it->second, args, isVoid ? "" : callee + "_result");
}

} // namespace automat::ir::call_ops
