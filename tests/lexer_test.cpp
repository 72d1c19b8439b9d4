#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "test_util.hpp"

using namespace automat;
using automat::test::error_code;

static void test_basic_stream(){
    auto toks = test::significant(test::lex("int X = 3 + 4.5; // trailing\n"));
    assert(toks.size() == 7);
    assert(toks[0].kind == Tok::Keyword && toks[0].text == "int");
    assert(toks[1].kind == Tok::Identifier && toks[1].text == "X");
    assert(toks[2].kind == Tok::Punct && toks[2].text == "=");
    assert(toks[3].kind == Tok::IntLit && toks[3].ival == 3);
    assert(toks[4].kind == Tok::Punct && toks[4].text == "+");
    assert(toks[5].kind == Tok::FloatLit && toks[5].fval == 4.5);
    assert(toks[6].kind == Tok::Punct && toks[6].text == ";");
}

static void test_trivia_kept(){
    // the preprocessor terminates the last line
    auto toks = test::lex("A\n B");
    assert(toks.size() == 6);
    assert(toks[1].kind == Tok::LineEnd);
    assert(toks[2].kind == Tok::Whitespace);
    assert(toks.back().kind == Tok::Eof);
}

static void test_two_char_punct(){
    auto toks = test::significant(test::lex("<= >= == != && || < > ! ="));
    const char* want[] = {"<=", ">=", "==", "!=", "&&", "||", "<", ">", "!", "="};
    assert(toks.size() == 10);
    for(size_t i=0;i<toks.size();++i){
        assert(toks[i].kind == Tok::Punct);
        assert(toks[i].text == want[i]);
    }
}

static void test_keywords_and_fallback(){
    auto toks = test::significant(test::lex("matrix rows cols print printstr foo @"));
    for(size_t i=0;i<5;++i) assert(toks[i].kind == Tok::Keyword);
    // lowercase words that are not keywords stay whole
    assert(toks[5].kind == Tok::Fallback && toks[5].text == "foo");
    assert(toks[6].kind == Tok::Fallback && toks[6].text == "@");
    assert(is_keyword("while") && !is_keyword("WHILE"));
}

static void test_identifiers_are_uppercase(){
    auto toks = test::significant(test::lex("COUNT_2 Ab"));
    assert(toks[0].kind == Tok::Identifier && toks[0].text == "COUNT_2");
    assert(toks[1].kind == Tok::Identifier && toks[1].text == "A");
    assert(toks[2].kind == Tok::Fallback && toks[2].text == "b");
}

static void test_literals(){
    auto toks = test::significant(test::lex("2147483647 1.5e3 3. \"a b\""));
    assert(toks[0].kind == Tok::IntLit && toks[0].ival == 2147483647);
    assert(toks[1].kind == Tok::FloatLit && std::fabs(toks[1].fval - 1500.0) < 1e-9);
    assert(toks[2].kind == Tok::FloatLit && toks[2].fval == 3.0);
    assert(toks[3].kind == Tok::StrLit && toks[3].text == "\"a b\"");
}

static void test_comments(){
    auto toks = test::significant(test::lex("A /* multi\nline */ B"));
    assert(toks.size() == 2);
    assert(toks[1].text == "B" && toks[1].loc.line == 2);
}

static void test_errors(){
    assert(error_code([]{ test::lex("2147483648"); }) == "L0004");
    assert(error_code([]{ test::lex("A /* never closed"); }) == "L0001");
}

static void test_positions_follow_includes(){
    CompileEnv env = test::quiet_env();
    auto out = test::preprocess("#include \"lib.mat\"\nint  Y;\n", env, {{"lib.mat", "int X;\n"}});
    Lexer lexer(out, env);
    auto toks = test::significant(lexer.run());
    assert(toks[1].text == "X");
    assert(out.files.name(toks[1].loc.file) == "lib.mat");
    assert(toks[1].loc.line == 1 && toks[1].loc.col == 5);
    assert(toks[4].text == "Y");
    assert(toks[4].loc.file == 0 && toks[4].loc.line == 2 && toks[4].loc.col == 6);
}

void run_lexer_tests(){
    std::cout << "[lex] lexer tests...\n";
    test_basic_stream();
    test_trivia_kept();
    test_two_char_punct();
    test_keywords_and_fallback();
    test_identifiers_are_uppercase();
    test_literals();
    test_comments();
    test_errors();
    test_positions_follow_includes();
    std::cout << "[lex] lexer tests passed\n";
}
