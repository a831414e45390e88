#pragma once
#include <tao/pegtl.hpp>

// Token-level PEGTL rules. The lexer matches one of these at its current
// position; the grammar of nested values lives in the hand-written parser.
namespace rson::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment_line : seq< two<'/'>, until< at< eolf >, any > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct blanks : plus< one<' ', '\t', '\r', '\n'> > {};

// Numbers: [+-]? digits ('.' digits)? ([eE] [+-]? digits)?
struct sign : one<'+', '-'> {};
struct fraction : seq< one<'.'>, plus< digit > > {};
struct exponent : seq< one<'e', 'E'>, opt< sign >, plus< digit > > {};
struct number : seq< opt< sign >, plus< digit >, opt< fraction >, opt< exponent > > {};

// Identifiers and keywords
struct word : seq< identifier_first, star< identifier_other > > {};

} // namespace rson::grammar
