#pragma once
#include <tao/pegtl.hpp>

#include "automat/lexer.hpp"

namespace automat::lex::grammar {
using namespace tao::pegtl;

struct comment_line : seq< two<'/'>, until< at< eolf > > > {};
struct block_comment_body : until< seq< one<'*'>, one<'/'> > > {};
struct block_comment : if_must< seq< one<'/'>, one<'*'> >, block_comment_body > {};
struct blanks : plus< sor< blank, comment_line, block_comment > > {};
struct line_end : sor< string<'\r','\n'>, one<'\n'>, one<'\r'> > {};

struct exponent : seq< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > {};
struct float_lit : seq< plus< digit >, one<'.'>, star< digit >, opt< exponent > > {};
struct int_lit : plus< digit > {};
struct str_body : until< one<'"'>, not_one<'\r','\n'> > {};
struct str_lit : if_must< one<'"'>, str_body > {};
struct ident : seq< ranges<'A','Z','_','_'>, star< ranges<'A','Z','0','9','_','_'> > > {};
// Lowercase words: keywords and built-ins, anything else falls back whole.
struct word : plus< range<'a','z'> > {};

struct punct : sor< two<'&'>, two<'|'>, string<'=','='>, string<'!','='>, string<'<','='>, string<'>','='>,
                    one<'+','-','*','/','<','>','=','!','(',')','{','}','[',']',',',';'> > {};
struct fallback : any {};

// Comments before punctuation so '/' never eats "//".
struct token : sor< str_lit, float_lit, int_lit, ident, word, blanks, line_end, punct, fallback > {};

template<typename Rule>
struct error_message { static constexpr const char* value = "malformed input"; };
template<> struct error_message< str_body > { static constexpr const char* value = "unterminated string literal"; };
template<> struct error_message< block_comment_body > { static constexpr const char* value = "unterminated block comment"; };

template<typename Rule>
struct control : normal<Rule> {
    template<typename Input, typename... States>
    [[noreturn]] static void raise(const Input& in, States&&...) {
        throw parse_error(error_message<Rule>::value, in);
    }
};

template<typename Rule>
struct action : nothing<Rule> {};

template<Tok K>
struct set_kind {
    template<typename Input>
    static void apply(const Input& in, LexToken& t){ t.kind = K; t.text = in.string(); }
};

template<> struct action< float_lit > : set_kind< Tok::FloatLit > {};
template<> struct action< int_lit > : set_kind< Tok::IntLit > {};
template<> struct action< str_lit > : set_kind< Tok::StrLit > {};
template<> struct action< ident > : set_kind< Tok::Identifier > {};
template<> struct action< blanks > : set_kind< Tok::Whitespace > {};
template<> struct action< line_end > : set_kind< Tok::LineEnd > {};
template<> struct action< punct > : set_kind< Tok::Punct > {};
template<> struct action< fallback > : set_kind< Tok::Fallback > {};
template<> struct action< word > {
    template<typename Input>
    static void apply(const Input& in, LexToken& t){
        t.text = in.string();
        t.kind = is_keyword(t.text) ? Tok::Keyword : Tok::Fallback;
    }
};

} // namespace automat::lex::grammar
