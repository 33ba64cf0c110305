#pragma once

#include <tao/pegtl.hpp>

// Grammar for the PostgreSQL text output format of the types the codec
// normalizes. Rules only; the parse entry points live in pg_text_parser.hpp.
namespace sextant::value::pgtext {

namespace pegtl = tao::pegtl;

struct optional_space : pegtl::star<pegtl::space> {
};

// Arrays: {1,2,NULL}, {"a b","c\"d"}, {{1,2},{3,4}}, [0:1]={5,6}
struct array_open : pegtl::one<'{'> {
};

struct array_close : pegtl::one<'}'> {
};

struct element_separator : pegtl::one<','> {
};

struct quoted_char : pegtl::sor<pegtl::seq<pegtl::one<'\\'>, pegtl::any>, pegtl::not_one<'"', '\\'>> {
};

struct quoted_body : pegtl::star<quoted_char> {
};

struct quoted_element : pegtl::seq<pegtl::one<'"'>, quoted_body, pegtl::one<'"'>> {
};

struct unquoted_element : pegtl::plus<pegtl::not_one<',', '{', '}', '"'>> {
};

struct array_literal;

struct array_element : pegtl::seq<optional_space, pegtl::sor<array_literal, quoted_element, unquoted_element>, optional_space> {
};

struct element_list : pegtl::list<array_element, element_separator> {
};

struct array_literal : pegtl::seq<array_open, optional_space, pegtl::opt<element_list>, array_close> {
};

struct signed_digits : pegtl::seq<pegtl::opt<pegtl::one<'-'>>, pegtl::plus<pegtl::digit>> {
};

struct dimension_bound : pegtl::seq<pegtl::one<'['>, signed_digits, pegtl::one<':'>, signed_digits, pegtl::one<']'>> {
};

struct dimension_decoration : pegtl::seq<pegtl::plus<dimension_bound>, pegtl::one<'='>> {
};

struct array_grammar : pegtl::seq<optional_space, pegtl::opt<dimension_decoration>, array_literal, optional_space, pegtl::eof> {
};

// Temporal values: 2024-01-15 10:30:00.123456+05:30, 0044-03-15 BC
struct date_part : pegtl::seq<pegtl::plus<pegtl::digit>,
                               pegtl::one<'-'>,
                               pegtl::rep<2, pegtl::digit>,
                               pegtl::one<'-'>,
                               pegtl::rep<2, pegtl::digit>> {
};

struct fraction : pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>> {
};

struct time_part : pegtl::seq<pegtl::rep<2, pegtl::digit>,
                               pegtl::one<':'>,
                               pegtl::rep<2, pegtl::digit>,
                               pegtl::opt<pegtl::one<':'>, pegtl::rep<2, pegtl::digit>, pegtl::opt<fraction>>> {
};

struct zone_utc : pegtl::one<'Z', 'z'> {
};

struct zone_offset : pegtl::seq<pegtl::one<'+', '-'>,
                                 pegtl::rep<2, pegtl::digit>,
                                 pegtl::opt<pegtl::opt<pegtl::one<':'>>, pegtl::rep<2, pegtl::digit>>,
                                 pegtl::opt<pegtl::one<':'>, pegtl::rep<2, pegtl::digit>>> {
};

struct zone : pegtl::sor<zone_utc, zone_offset> {
};

struct era_bc : pegtl::seq<pegtl::plus<pegtl::blank>, pegtl::istring<'B', 'C'>> {
};

struct date_time_separator : pegtl::one<' ', 'T', 't'> {
};

struct timestamp_grammar : pegtl::seq<date_part,
                                       date_time_separator,
                                       time_part,
                                       pegtl::opt<pegtl::star<pegtl::blank>, zone>,
                                       pegtl::opt<era_bc>,
                                       pegtl::eof> {
};

struct date_grammar : pegtl::seq<date_part, pegtl::opt<era_bc>, pegtl::eof> {
};

struct time_grammar : pegtl::seq<time_part, pegtl::opt<zone>, pegtl::eof> {
};

struct infinity_word : pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>, pegtl::istring<'i', 'n', 'f', 'i', 'n', 'i', 't', 'y'>> {
};

struct infinity_grammar : pegtl::seq<infinity_word, pegtl::eof> {
};

// Identifiers and exact numbers
struct hex4 : pegtl::rep<4, pegtl::xdigit> {
};

struct uuid_grammar : pegtl::seq<pegtl::opt<pegtl::one<'{'>>,
                                  pegtl::sor<pegtl::seq<pegtl::rep<2, hex4>,
                                                        pegtl::one<'-'>,
                                                        hex4,
                                                        pegtl::one<'-'>,
                                                        hex4,
                                                        pegtl::one<'-'>,
                                                        hex4,
                                                        pegtl::one<'-'>,
                                                        pegtl::rep<3, hex4>>,
                                             pegtl::rep<8, hex4>>,
                                  pegtl::opt<pegtl::one<'}'>>,
                                  pegtl::eof> {
};

struct exponent : pegtl::seq<pegtl::one<'e', 'E'>, pegtl::opt<pegtl::one<'+', '-'>>, pegtl::plus<pegtl::digit>> {
};

struct decimal_digits : pegtl::sor<pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<pegtl::one<'.'>, pegtl::star<pegtl::digit>>>,
                                   pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>>> {
};

struct decimal_special : pegtl::sor<pegtl::istring<'n', 'a', 'n'>, infinity_word> {
};

struct decimal_grammar : pegtl::seq<pegtl::sor<decimal_special,
                                               pegtl::seq<pegtl::opt<pegtl::one<'+', '-'>>, decimal_digits, pegtl::opt<exponent>>>,
                                    pegtl::eof> {
};

}  // namespace sextant::value::pgtext
