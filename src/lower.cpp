#include "automat/lower.hpp"

namespace automat::lower {

using namespace sast;

SStmtPtr desugar_for(const SFor& f){
    SBlock loopBody;
    loopBody.scope = f.scope;
    loopBody.stmts.push_back(f.body);
    loopBody.stmts.push_back(make_sstmt(SExprStmt{f.update}));

    SBlock outer;
    outer.scope = f.scope;
    outer.stmts.push_back(make_sstmt(SExprStmt{f.init}));
    outer.stmts.push_back(make_sstmt(SWhile{f.cond, make_sstmt(std::move(loopBody))}));
    return make_sstmt(std::move(outer));
}

} // namespace automat::lower
