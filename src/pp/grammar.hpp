#pragma once
#include <tao/pegtl.hpp>

#include "automat/preprocess.hpp"

namespace automat::pp::grammar {
using namespace tao::pegtl;

// Comments travel as whitespace so quotes inside them never start a string.
struct comment_line : seq< two<'/'>, until< at< eolf > > > {};
struct block_comment_body : until< seq< one<'*'>, one<'/'> > > {};
struct block_comment : if_must< seq< one<'/'>, one<'*'> >, block_comment_body > {};
struct blanks : plus< sor< blank, comment_line, block_comment > > {};

struct line_end : sor< string<'\r','\n'>, one<'\n'>, one<'\r'> > {};

// tokens
struct ident : seq< ranges<'A','Z','_','_'>, star< ranges<'A','Z','0','9','_','_'> > > {};
struct int_lit : plus< digit > {};
struct str_body : until< one<'"'>, not_one<'\r','\n'> > {};
struct str_lit : if_must< one<'"'>, str_body > {};

// Directive keywords are matched case-insensitively and must not run into a longer word.
struct kw_tail : not_at< identifier_other > {};
struct dir_include : seq< TAO_PEGTL_ISTRING("include"), kw_tail > {};
struct dir_define : seq< TAO_PEGTL_ISTRING("define"), kw_tail > {};
struct dir_undef : seq< TAO_PEGTL_ISTRING("undef"), kw_tail > {};
struct dir_ifdef : seq< TAO_PEGTL_ISTRING("ifdef"), kw_tail > {};
struct dir_ifndef : seq< TAO_PEGTL_ISTRING("ifndef"), kw_tail > {};
struct dir_end : seq< TAO_PEGTL_ISTRING("end"), kw_tail > {};
struct dir_keyword : sor< dir_include, dir_define, dir_undef, dir_ifdef, dir_ifndef, dir_end > {};
struct directive : seq< one<'#'>, star< blank >, dir_keyword > {};

struct fallback : any {};

// One token per parse call.
struct token : sor< directive, str_lit, ident, int_lit, blanks, line_end, fallback > {};

// Excluded regions: consume a whole line, only noticing conditional directives.
struct skip_directive : seq< star< blank >, one<'#'>, star< blank >, sor< dir_ifdef, dir_ifndef, dir_end > > {};
struct rest_of_line : seq< star< not_one<'\r','\n'> >, opt< line_end > > {};
struct skip_line : seq< opt< skip_directive >, rest_of_line > {};

// ---------------------------------------------------------------------------

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

template<TokenKind K>
struct set_kind {
    template<typename Input>
    static void apply(const Input& in, Token& t){ t.kind = K; t.text = in.string(); }
};

template<> struct action< ident > : set_kind< TokenKind::Identifier > {};
template<> struct action< int_lit > : set_kind< TokenKind::IntLit > {};
template<> struct action< str_lit > : set_kind< TokenKind::StrLit > {};
template<> struct action< blanks > : set_kind< TokenKind::Whitespace > {};
template<> struct action< line_end > : set_kind< TokenKind::LineEnd > {};
template<> struct action< fallback > : set_kind< TokenKind::Char > {};
template<> struct action< dir_include > : set_kind< TokenKind::DirInclude > {};
template<> struct action< dir_define > : set_kind< TokenKind::DirDefine > {};
template<> struct action< dir_undef > : set_kind< TokenKind::DirUndef > {};
template<> struct action< dir_ifdef > : set_kind< TokenKind::DirIfdef > {};
template<> struct action< dir_ifndef > : set_kind< TokenKind::DirIfndef > {};
template<> struct action< dir_end > : set_kind< TokenKind::DirEnd > {};
// Keep the directive kind chosen above, but record the full "#  define" text.
template<> struct action< directive > {
    template<typename Input>
    static void apply(const Input& in, Token& t){ t.text = in.string(); }
};

// Only conditional directives matter while skipping.
template<typename Rule>
struct skip_action : nothing<Rule> {};
template<> struct skip_action< dir_ifdef > : set_kind< TokenKind::DirIfdef > {};
template<> struct skip_action< dir_ifndef > : set_kind< TokenKind::DirIfndef > {};
template<> struct skip_action< dir_end > : set_kind< TokenKind::DirEnd > {};

} // namespace automat::pp::grammar
