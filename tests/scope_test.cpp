#include <algorithm>
#include <cassert>
#include <iostream>

#include "automat/scope.hpp"

using namespace automat;

static void test_lookup_walks_outward(){
    TypeContext ctx;
    ScopeArena arena;
    ScopeId global = arena.create();
    ScopeId fn = arena.create(global);
    ScopeId inner = arena.create(fn);
    assert(arena.declare(global, "G", ctx.int_type()));
    assert(arena.declare(fn, "X", ctx.int_type()));
    assert(arena.declare(inner, "X", ctx.float_type()));

    assert(*arena.lookup(inner, "X") == ctx.float_type());
    assert(*arena.lookup(fn, "X") == ctx.int_type());
    assert(*arena.lookup(inner, "G") == ctx.int_type());
    assert(!arena.lookup(global, "X"));
    assert(!arena.lookup_local(inner, "G"));
    assert(*arena.parent(inner) == fn);
    assert(!arena.parent(global));
    assert(arena.size() == 3);
}

static void test_duplicates_and_siblings(){
    TypeContext ctx;
    ScopeArena arena;
    ScopeId root = arena.create();
    ScopeId a = arena.create(root);
    ScopeId b = arena.create(root);
    assert(arena.declare(a, "Y", ctx.int_type()));
    assert(!arena.declare(a, "Y", ctx.bool_type()));
    assert(*arena.lookup(a, "Y") == ctx.int_type());
    // sibling blocks never see each other's names
    assert(!arena.lookup(b, "Y"));
}

static void test_visible_names(){
    TypeContext ctx;
    ScopeArena arena;
    ScopeId root = arena.create();
    ScopeId child = arena.create(root);
    arena.declare(root, "COUNT", ctx.int_type());
    arena.declare(child, "COUNT", ctx.float_type());
    arena.declare(child, "TOTAL", ctx.int_type());
    auto names = arena.visible_names(child);
    assert(names.size() == 2);
    assert(std::count(names.begin(), names.end(), "COUNT") == 1);
    assert(std::count(names.begin(), names.end(), "TOTAL") == 1);
}

void run_scope_tests(){
    std::cout << "[scope] scope tests...\n";
    test_lookup_walks_outward();
    test_duplicates_and_siblings();
    test_visible_names();
    std::cout << "[scope] scope tests passed\n";
}
