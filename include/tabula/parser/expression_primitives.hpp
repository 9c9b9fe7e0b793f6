#pragma once

#include <tao/pegtl.hpp>

namespace tabula::parser::expr {

namespace pegtl = tao::pegtl;

struct optional_space : pegtl::star<pegtl::space> {
};

struct required_space : pegtl::plus<pegtl::space> {
};

struct string_literal_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct string_literal : pegtl::seq<pegtl::one<'\''>, pegtl::star<string_literal_char>, pegtl::one<'\''>> {
};

struct double_quoted_literal_char : pegtl::sor<pegtl::seq<pegtl::one<'"'>, pegtl::one<'"'>>, pegtl::not_one<'"'>> {
};

struct double_quoted_literal : pegtl::seq<pegtl::one<'"'>, pegtl::star<double_quoted_literal_char>, pegtl::one<'"'>> {
};

struct quoted_literal : pegtl::sor<string_literal, double_quoted_literal> {
};

struct fractional_part : pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>> {
};

struct numeric_literal : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>, pegtl::opt<fractional_part>> {
};

// Case-insensitive keyword that does not run into a following identifier character.
template <char... Chars>
struct keyword : pegtl::seq<pegtl::istring<Chars...>, pegtl::not_at<pegtl::identifier_other>> {
};

}  // namespace tabula::parser::expr
