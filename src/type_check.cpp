#include "automat/type_check.hpp"

#include <algorithm>
#include <set>

namespace automat {

using namespace ast;
using namespace sast;

void TypeChecker::reset(){
    functions_.clear();
    prog_ = nullptr;
    current_ = nullptr;
}

TypeCheckResult TypeChecker::check(const Program& prog){
    reset();
    TypeCheckResult r;
    prog_ = &r.program;
    try {
        r.program.global_scope = r.program.scopes.create();
        collect_globals(prog);
        collect_functions(prog);
        for(const auto& fn : prog.functions) r.program.functions.push_back(check_function(fn));
        r.success = true;
    } catch(const CompileError& e){
        r.success = false;
        r.error = e.diagnostic();
        r.program = SProgram{}; // never hand out a partial tree
    }
    prog_ = nullptr;
    current_ = nullptr;
    return r;
}

// --- suggestion utilities ---------------------------------------------------
int TypeChecker::edit_distance(const std::string& a, const std::string& b){
    size_t n=a.size(), m=b.size();
    if(n>64||m>64){ // cap to avoid large tables; positional fallback
        int dist=0; for(size_t i=0;i<std::min(n,m);++i) if(a[i]!=b[i]) ++dist;
        return dist + static_cast<int>(std::max(n,m) - std::min(n,m));
    }
    int dp[65][65];
    for(size_t i=0;i<=n;++i) dp[i][0]=static_cast<int>(i);
    for(size_t j=0;j<=m;++j) dp[0][j]=static_cast<int>(j);
    for(size_t i=1;i<=n;++i)
        for(size_t j=1;j<=m;++j){
            int c = a[i-1]==b[j-1] ? 0 : 1;
            dp[i][j] = std::min({dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+c});
        }
    return dp[n][m];
}

std::vector<std::string> TypeChecker::fuzzy_candidates(const std::string& target, const std::vector<std::string>& pool, int maxDist){
    std::vector<std::string> out;
    for(const auto& c : pool){ if(c.empty() || c==target) continue; if(edit_distance(target,c)<=maxDist) out.push_back(c); }
    std::sort(out.begin(), out.end());
    if(out.size()>5) out.resize(5);
    return out;
}

void TypeChecker::fail_with_suggestions(const std::string& code, const std::string& msg, SourceLoc loc,
                                        const std::string& name, const std::vector<std::string>& pool){
    Diagnostic d = rep_.make(code, msg, loc);
    auto suggs = env_.suggest ? fuzzy_candidates(name, pool) : std::vector<std::string>{};
    if(!suggs.empty()){
        std::string note="did you mean ";
        for(size_t i=0;i<suggs.size();++i){ note+=suggs[i]; if(i+1<suggs.size()) note+= i+2==suggs.size()?" or ":", "; }
        d.notes.push_back(Note{note, loc.line, loc.col});
    }
    throw CompileError(std::move(d));
}

void TypeChecker::type_mismatch(const std::string& code, SourceLoc loc, const std::string& role, TypeId expected, TypeId actual){
    std::string expStr = ctx_.to_string(expected);
    std::string actStr = ctx_.to_string(actual);
    Diagnostic d = rep_.make(code, role+" type mismatch", loc, "ensure "+role+" has type "+expStr);
    d.notes.push_back(Note{"expected: "+expStr, loc.line, loc.col});
    d.notes.push_back(Note{"   found: "+actStr, loc.line, loc.col});
    throw CompileError(std::move(d));
}

void TypeChecker::check_assignable(TypeId expected, TypeId actual, SourceLoc loc, const std::string& role){
    if(expected == actual) return;
    if(ctx_.is_matrix(expected) && ctx_.is_matrix(actual)) type_mismatch("E0703", loc, role, expected, actual);
    type_mismatch("E0405", loc, role, expected, actual);
}

void TypeChecker::require_concrete(TypeId t, SourceLoc loc, const std::string& role){
    if(ctx_.is_base(t, BaseType::Auto))
        rep_.fail("E0302", "'auto' is not allowed for "+role, loc, "spell out the type");
    if(ctx_.is_base(t, BaseType::Void))
        rep_.fail("E0303", role+" cannot have type void", loc);
}

// --- declarations -----------------------------------------------------------

void TypeChecker::collect_globals(const Program& prog){
    for(const auto& g : prog.globals){
        require_concrete(g.type, g.loc, "global '"+g.name+"'");
        if(!prog_->scopes.declare(prog_->global_scope, g.name, g.type))
            rep_.fail("E0101", "duplicate global '"+g.name+"'", g.loc, "rename one of the globals");
        prog_->globals.push_back(SGlobal{g.type, g.name});
    }
}

void TypeChecker::collect_functions(const Program& prog){
    for(const auto& fn : prog.functions){
        if(ctx_.is_base(fn.ret, BaseType::Auto))
            rep_.fail("E0302", "'auto' is not allowed as the return type of '"+fn.name+"'", fn.loc, "spell out the type");
        if(functions_.count(fn.name))
            rep_.fail("E0102", "duplicate function '"+fn.name+"'", fn.loc, "rename one of the functions");
        FunctionInfo info{fn.name, fn.ret, {}};
        std::set<std::string> seen;
        for(const auto& f : fn.formals){
            require_concrete(f.type, f.loc, "parameter '"+f.name+"'");
            if(!seen.insert(f.name).second)
                rep_.fail("E0103", "duplicate parameter '"+f.name+"' in function '"+fn.name+"'", f.loc);
            info.params.push_back(ParamInfo{f.name, f.type});
        }
        functions_.emplace(fn.name, std::move(info));
    }
}

SFunction TypeChecker::check_function(const Function& fn){
    const FunctionInfo& info = functions_.at(fn.name);
    current_ = &info;
    ScopeId scope = prog_->scopes.create(prog_->global_scope);
    SFunction out;
    out.ret = fn.ret;
    out.name = fn.name;
    for(const auto& p : info.params){
        prog_->scopes.declare(scope, p.name, p.type);
        out.formals.push_back(SFormal{p.type, p.name});
    }
    // Top-level statements share the formals' scope.
    out.body = check_block(fn.body, scope);
    current_ = nullptr;
    return out;
}

// --- statements -------------------------------------------------------------

SBlock TypeChecker::check_block(const Block& b, ScopeId scope){
    SBlock out;
    out.scope = scope;
    for(const auto& s : b.stmts) out.stmts.push_back(check_stmt(*s, scope));
    return out;
}

SExprPtr TypeChecker::check_condition(const Expr& e, ScopeId scope, const char* what){
    SExprPtr c = check_expr(e, scope);
    if(!ctx_.is_base(c->type, BaseType::Bool))
        type_mismatch("E0406", e.loc, std::string(what)+" condition", ctx_.bool_type(), c->type);
    return c;
}

// Branch and loop bodies always get their own scope, braces or not.
SStmtPtr TypeChecker::check_body(const Stmt& s, ScopeId scope){
    if(std::holds_alternative<Block>(s.data)) return check_stmt(s, scope);
    ScopeId child = prog_->scopes.create(scope);
    SBlock out;
    out.scope = child;
    out.stmts.push_back(check_stmt(s, child));
    return make_sstmt(std::move(out));
}

SStmtPtr TypeChecker::check_stmt(const Stmt& s, ScopeId scope){
    if(auto b = std::get_if<Block>(&s.data)){
        ScopeId child = prog_->scopes.create(scope);
        return make_sstmt(check_block(*b, child));
    }
    if(auto v = std::get_if<VarDecl>(&s.data)){
        TypeId ty = v->type;
        SExprPtr init;
        if(ctx_.is_base(ty, BaseType::Auto)){
            if(!v->init)
                rep_.fail("E0301", "'auto' variable '"+v->name+"' requires an initializer", s.loc, "add '= <expr>' or spell out the type");
            init = check_expr(*v->init, scope);
            if(ctx_.is_base(init->type, BaseType::Void))
                rep_.fail("E0303", "variable '"+v->name+"' cannot have type void", v->init->loc, "the initializer produces no value");
            ty = init->type;
        } else {
            if(ctx_.is_base(ty, BaseType::Void))
                rep_.fail("E0303", "variable '"+v->name+"' cannot have type void", s.loc);
            if(v->init){
                init = check_expr(*v->init, scope);
                check_assignable(ty, init->type, v->init->loc, "initializer of '"+v->name+"'");
            }
        }
        if(!prog_->scopes.declare(scope, v->name, ty))
            rep_.fail("E0104", "'"+v->name+"' is already declared in this scope", s.loc, "rename the variable or move it into a nested block");
        return make_sstmt(SVarDecl{ty, v->name, init});
    }
    if(auto e = std::get_if<ExprStmt>(&s.data)){
        return make_sstmt(SExprStmt{check_expr(*e->expr, scope)});
    }
    if(auto r = std::get_if<Return>(&s.data)){
        TypeId ret = current_->ret;
        if(ctx_.is_base(ret, BaseType::Void)){
            if(r->value)
                rep_.fail("E0602", "void function '"+current_->name+"' cannot return a value", s.loc, "use 'return;'");
            return make_sstmt(SReturn{nullptr});
        }
        if(!r->value)
            rep_.fail("E0601", "function '"+current_->name+"' must return a value of type "+ctx_.to_string(ret), s.loc);
        SExprPtr v = check_expr(*r->value, scope);
        if(v->type != ret) type_mismatch("E0601", r->value->loc, "return value of '"+current_->name+"'", ret, v->type);
        return make_sstmt(SReturn{v});
    }
    if(auto i = std::get_if<If>(&s.data)){
        SExprPtr cond = check_condition(*i->cond, scope, "if");
        SStmtPtr then_branch = check_body(*i->then_branch, scope);
        SStmtPtr else_branch = i->else_branch
            ? check_body(*i->else_branch, scope)
            : make_sstmt(SBlock{{}, prog_->scopes.create(scope)});
        return make_sstmt(SIf{cond, then_branch, else_branch});
    }
    if(auto w = std::get_if<While>(&s.data)){
        SExprPtr cond = check_condition(*w->cond, scope, "while");
        return make_sstmt(SWhile{cond, check_body(*w->body, scope)});
    }
    const auto& f = std::get<For>(s.data);
    SExprPtr init = check_expr(*f.init, scope);
    SExprPtr cond = check_condition(*f.cond, scope, "for");
    SExprPtr update = check_expr(*f.update, scope);
    SStmtPtr body = check_body(*f.body, scope);
    return make_sstmt(SFor{init, cond, update, body, scope});
}

// --- expressions ------------------------------------------------------------

SExprPtr TypeChecker::check_expr(const Expr& e, ScopeId scope){
    if(auto v = std::get_if<IntLit>(&e.data)) return make_sexpr(ctx_.int_type(), SIntLit{v->value});
    if(auto v = std::get_if<FloatLit>(&e.data)) return make_sexpr(ctx_.float_type(), SFloatLit{v->value});
    if(auto v = std::get_if<BoolLit>(&e.data)) return make_sexpr(ctx_.bool_type(), SBoolLit{v->value});
    if(auto v = std::get_if<StrLit>(&e.data)) return make_sexpr(ctx_.string_type(), SStrLit{v->value});
    if(auto m = std::get_if<MatrixLit>(&e.data)) return check_matrix(*m, e, scope);
    if(auto id = std::get_if<Id>(&e.data)){
        auto t = prog_->scopes.lookup(scope, id->name);
        if(!t) fail_with_suggestions("E0201", "undeclared identifier '"+id->name+"'", e.loc, id->name, prog_->scopes.visible_names(scope));
        return make_sexpr(*t, SId{id->name});
    }
    if(auto b = std::get_if<Binary>(&e.data)) return check_binary(*b, e, scope);
    if(auto u = std::get_if<Unary>(&e.data)){
        SExprPtr operand = check_expr(*u->operand, scope);
        bool ok = u->op == UnOp::Neg ? ctx_.is_numeric(operand->type) : ctx_.is_base(operand->type, BaseType::Bool);
        if(!ok){
            Diagnostic d = rep_.make("E0404", std::string("operator '")+unop_symbol(u->op)+"' cannot be applied to "+ctx_.to_string(operand->type), e.loc,
                                     u->op == UnOp::Neg ? "negate an int or float" : "'!' requires a bool operand");
            throw CompileError(std::move(d));
        }
        return make_sexpr(operand->type, SUnary{u->op, operand});
    }
    if(auto a = std::get_if<Assign>(&e.data)){
        auto t = prog_->scopes.lookup(scope, a->name);
        if(!t) fail_with_suggestions("E0201", "undeclared identifier '"+a->name+"'", e.loc, a->name, prog_->scopes.visible_names(scope));
        SExprPtr value = check_expr(*a->value, scope);
        check_assignable(*t, value->type, a->value->loc, "assignment to '"+a->name+"'");
        return make_sexpr(*t, SAssign{a->name, value});
    }
    if(auto c = std::get_if<Call>(&e.data)) return check_call(*c, e, scope);
    if(auto c = std::get_if<BuiltinCall>(&e.data)) return check_builtin(*c, e, scope);
    return make_sexpr(ctx_.void_type(), SNoExpr{});
}

SExprPtr TypeChecker::check_binary(const Binary& b, const Expr& e, ScopeId scope){
    SExprPtr lhs = check_expr(*b.lhs, scope);
    SExprPtr rhs = check_expr(*b.rhs, scope);
    std::string op = binop_symbol(b.op);
    auto operand_error = [&](const char* code, const std::string& need){
        Diagnostic d = rep_.make(code, "operator '"+op+"' requires "+need, e.loc);
        d.notes.push_back(Note{" left: "+ctx_.to_string(lhs->type), b.lhs->loc.line, b.lhs->loc.col});
        d.notes.push_back(Note{"right: "+ctx_.to_string(rhs->type), b.rhs->loc.line, b.rhs->loc.col});
        throw CompileError(std::move(d));
    };
    switch(b.op){
        case BinOp::Add: case BinOp::Sub: case BinOp::Mul: case BinOp::Div:
            if(!ctx_.is_numeric(lhs->type) || lhs->type != rhs->type) operand_error("E0401", "matching int or float operands");
            return make_sexpr(lhs->type, SBinary{b.op, lhs, rhs});
        case BinOp::Eq: case BinOp::Ne: case BinOp::Lt: case BinOp::Le: case BinOp::Gt: case BinOp::Ge:
            if(!ctx_.is_numeric(lhs->type) || lhs->type != rhs->type) operand_error("E0402", "matching int or float operands");
            return make_sexpr(ctx_.bool_type(), SBinary{b.op, lhs, rhs});
        case BinOp::And: case BinOp::Or:
            if(!ctx_.is_base(lhs->type, BaseType::Bool) || !ctx_.is_base(rhs->type, BaseType::Bool)) operand_error("E0403", "bool operands");
            return make_sexpr(ctx_.bool_type(), SBinary{b.op, lhs, rhs});
    }
    internal_error("I0005", "unknown binary operator");
}

SExprPtr TypeChecker::check_call(const Call& c, const Expr& e, ScopeId scope){
    auto it = functions_.find(c.callee);
    if(it == functions_.end()){
        std::vector<std::string> pool;
        for(const auto& kv : functions_) pool.push_back(kv.first);
        fail_with_suggestions("E0202", "call to undefined function '"+c.callee+"'", e.loc, c.callee, pool);
    }
    const FunctionInfo& fn = it->second;
    if(c.args.size() != fn.params.size())
        rep_.fail("E0501", "function '"+fn.name+"' expects "+std::to_string(fn.params.size())+" argument(s), got "+std::to_string(c.args.size()), e.loc);
    std::vector<SExprPtr> args;
    for(size_t i=0;i<c.args.size();++i){
        SExprPtr a = check_expr(*c.args[i], scope);
        if(a->type != fn.params[i].type)
            type_mismatch("E0502", c.args[i]->loc, "argument "+std::to_string(i+1)+" of '"+fn.name+"'", fn.params[i].type, a->type);
        args.push_back(a);
    }
    return make_sexpr(fn.ret, SCall{c.callee, std::move(args)});
}

SExprPtr TypeChecker::check_builtin(const BuiltinCall& c, const Expr& e, ScopeId scope){
    std::string name = builtin_name(c.fn);
    if(c.args.size() != 1)
        rep_.fail("E0501", "built-in '"+name+"' expects 1 argument, got "+std::to_string(c.args.size()), e.loc);
    SExprPtr arg = check_expr(*c.args[0], scope);
    TypeId t = arg->type;
    bool ok = false;
    const char* want = "";
    TypeId result = ctx_.void_type();
    switch(c.fn){
        case Builtin::Print:
            ok = ctx_.is_scalar(t); want = "an int, bool or float"; break;
        case Builtin::PrintStr:
            ok = ctx_.is_base(t, BaseType::String); want = "a string"; break;
        case Builtin::Rows:
        case Builtin::Cols:
            ok = ctx_.is_matrix(t); want = "a matrix"; result = ctx_.int_type(); break;
    }
    if(!ok){
        Diagnostic d = rep_.make("E0503", "built-in '"+name+"' expects "+want+" argument", c.args[0]->loc);
        d.notes.push_back(Note{"found: "+ctx_.to_string(t), c.args[0]->loc.line, c.args[0]->loc.col});
        throw CompileError(std::move(d));
    }
    return make_sexpr(result, SBuiltinCall{c.fn, {arg}});
}

SExprPtr TypeChecker::check_matrix(const MatrixLit& m, const Expr& e, ScopeId scope){
    SMatrixLit out;
    TypeId elem = 0;
    size_t ncols = m.rows.front().size();
    for(size_t r=0;r<m.rows.size();++r){
        const auto& row = m.rows[r];
        if(row.size() != ncols){
            Diagnostic d = rep_.make("E0702", "matrix literal rows must have the same length", e.loc);
            d.notes.push_back(Note{"row 1 has "+std::to_string(ncols)+" element(s)", e.loc.line, e.loc.col});
            d.notes.push_back(Note{"row "+std::to_string(r+1)+" has "+std::to_string(row.size())+" element(s)", row.front()->loc.line, row.front()->loc.col});
            throw CompileError(std::move(d));
        }
        std::vector<SExprPtr> srow;
        for(const auto& x : row){
            SExprPtr sx = check_expr(*x, scope);
            if(r==0 && srow.empty()) elem = sx->type;
            else if(sx->type != elem) type_mismatch("E0701", x->loc, "matrix element", elem, sx->type);
            srow.push_back(sx);
        }
        out.rows.push_back(std::move(srow));
    }
    TypeId ty = ctx_.get_matrix(elem, static_cast<uint32_t>(m.rows.size()), static_cast<uint32_t>(ncols));
    return make_sexpr(ty, std::move(out));
}

} // namespace automat
