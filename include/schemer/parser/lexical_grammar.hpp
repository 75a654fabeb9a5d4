#pragma once

#include <tao/pegtl.hpp>

namespace schemer::parser::lex {

namespace pegtl = tao::pegtl;

struct whitespace : pegtl::plus<pegtl::space> {
};

// Comments. `--` and `#` only open a comment when they are not glued between
// identifier characters (see word_joiner), so `table--name` stays one word.
struct dash_comment : pegtl::seq<pegtl::two<'-'>, pegtl::until<pegtl::eolf>> {
};

struct hash_comment : pegtl::seq<pegtl::one<'#'>, pegtl::until<pegtl::eolf>> {
};

struct block_comment_open : pegtl::string<'/', '*'> {
};

struct block_comment_close : pegtl::string<'*', '/'> {
};

struct block_comment : pegtl::if_must<block_comment_open, pegtl::until<block_comment_close>> {
};

struct comment : pegtl::sor<dash_comment, hash_comment, block_comment> {
};

// Literals.
struct string_open : pegtl::one<'\''> {
};

struct string_close : pegtl::one<'\''> {
};

struct string_char
    : pegtl::sor<pegtl::two<'\''>, pegtl::seq<pegtl::one<'\\'>, pegtl::any>, pegtl::not_one<'\''>> {
};

struct string_literal : pegtl::if_must<string_open, pegtl::star<string_char>, string_close> {
};

struct exponent : pegtl::seq<pegtl::one<'e', 'E'>, pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>> {
};

struct unsigned_number
    : pegtl::sor<pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<pegtl::one<'.'>, pegtl::star<pegtl::digit>>>,
                 pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>>> {
};

struct number_literal
    : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>,
                 unsigned_number,
                 pegtl::opt<exponent>,
                 pegtl::not_at<pegtl::identifier_other>> {
};

// Quoted identifiers.
struct double_quote_open : pegtl::one<'"'> {
};

struct double_quote_close : pegtl::one<'"'> {
};

struct double_quoted_identifier
    : pegtl::if_must<double_quote_open,
                     pegtl::star<pegtl::sor<pegtl::two<'"'>, pegtl::not_one<'"'>>>,
                     double_quote_close> {
};

struct backtick_open : pegtl::one<'`'> {
};

struct backtick_close : pegtl::one<'`'> {
};

struct backtick_identifier
    : pegtl::if_must<backtick_open,
                     pegtl::star<pegtl::sor<pegtl::two<'`'>, pegtl::not_one<'`'>>>,
                     backtick_close> {
};

// `[]` and `[n]` are array dimensions; any other bracket span quotes a name.
struct array_dimension
    : pegtl::seq<pegtl::one<'['>,
                 pegtl::star<pegtl::blank>,
                 pegtl::opt<pegtl::plus<pegtl::digit>>,
                 pegtl::star<pegtl::blank>,
                 pegtl::one<']'>> {
};

struct bracket_open : pegtl::one<'['> {
};

struct bracket_close : pegtl::one<']'> {
};

struct bracket_identifier : pegtl::if_must<bracket_open, pegtl::star<pegtl::not_one<']'>>, bracket_close> {
};

// Words.
struct identifier_start : pegtl::sor<pegtl::identifier_first, pegtl::utf8::range<0x80, 0x10FFFF>> {
};

struct word_joiner : pegtl::seq<pegtl::sor<pegtl::two<'-'>, pegtl::one<'#'>>, pegtl::at<pegtl::identifier_other>> {
};

struct word_char
    : pegtl::sor<pegtl::identifier_other, pegtl::one<'$'>, pegtl::utf8::range<0x80, 0x10FFFF>, word_joiner> {
};

struct word : pegtl::seq<pegtl::star<pegtl::digit>, identifier_start, pegtl::star<word_char>> {
};

// Operators and punctuation. `<` and `>` stay single characters so that
// nested type brackets such as `ARRAY<MAP<INT,INT>>` close one level each.
struct operator_token
    : pegtl::sor<pegtl::string<':', ':'>,
                 pegtl::string<'<', '='>,
                 pegtl::string<'>', '='>,
                 pegtl::string<'<', '>'>,
                 pegtl::string<'!', '='>,
                 pegtl::string<'|', '|'>,
                 pegtl::one<'=', '+', '-', '*', '/', '%', '|', '&', '^', '~', '!', '@'>> {
};

struct punctuation : pegtl::one<'(', ')', ',', ';', '.', '<', '>', ':', '{', '}', '?'> {
};

struct token
    : pegtl::sor<whitespace,
                 comment,
                 string_literal,
                 double_quoted_identifier,
                 backtick_identifier,
                 array_dimension,
                 bracket_identifier,
                 number_literal,
                 word,
                 operator_token,
                 punctuation> {
};

struct ddl_text : pegtl::seq<pegtl::star<token>, pegtl::must<pegtl::eof>> {
};

}  // namespace schemer::parser::lex
