/*
 * Splice - lexical token splicing and macro expansion toolkit
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include "splice/source_location.hpp"
#include "splice/stl/string.hpp"
#include "splice/stl/vector.hpp"

#include <string_view>
#include <utility>

/**
 * \file token.hpp
 * Token trees
 *
 * A token sequence is an ordered list of tokens where every delimited group
 * is a single token owning its children. All tokens carry the provenance tag
 * of the source region they were produced from.
 *
 * \ingroup tokens
 */


namespace spl {

enum class token_kind { ident, literal, punct, group };

enum class literal_kind {
  integer,     // 42, 0x1F, 7u8
  floating,    // 1.5, 2e10, 3f32
  string,      // "foo"
  raw_string,  // r"foo", r#"foo"#
  byte,        // b'a'
  byte_string, // b"foo", br"foo"
  character,   // 'a'
  c_string,    // c"foo", cr"foo"
};

enum class delimiter_kind {
  parenthesis, // ( ... )
  bracket,     // [ ... ]
  brace,       // { ... }
  none,        // invisible group left by macro substitution
};

/**
 * Whether a punctuation character is immediately followed by another one
 * (`::`, `->`, `[<`) or stands alone
 */
enum class punct_spacing { alone, joint };


struct token;

/**
 * Ordered sequence of tokens
 *
 * \ingroup tokens
 */
using token_stream = stl::vector<token>;


/**
 * Single token of a token tree
 *
 * Depending on kind, \ref text holds the identifier name, the verbatim
 * source text of a literal (quotes, escapes and suffix included), or the
 * punctuation character. Groups keep their delimiters in \ref delim and
 * own their \ref children.
 *
 * \ingroup tokens
 */
struct token {
  token_kind kind {token_kind::punct};
  stl::string text;
  literal_kind lit_kind {literal_kind::integer};
  punct_spacing spacing {punct_spacing::alone};
  delimiter_kind delim {delimiter_kind::none};
  token_stream children;
  source_location location;

  bool
  is_ident() const noexcept
  { return kind == token_kind::ident; }

  bool
  is_ident(std::string_view name) const noexcept
  { return kind == token_kind::ident and text == name; }

  bool
  is_literal() const noexcept
  { return kind == token_kind::literal; }

  bool
  is_punct(char c) const noexcept
  { return kind == token_kind::punct and text.size() == 1 and text[0] == c; }

  bool
  is_group() const noexcept
  { return kind == token_kind::group; }

  bool
  is_group(delimiter_kind d) const noexcept
  { return kind == token_kind::group and delim == d; }
}; // struct spl::token


[[nodiscard]] token
make_ident(std::string_view name, const source_location &location = {});

[[nodiscard]] token
make_literal(literal_kind kind, std::string_view text,
             const source_location &location = {});

[[nodiscard]] token
make_punct(char c, punct_spacing spacing = punct_spacing::alone,
           const source_location &location = {});

[[nodiscard]] token
make_group(delimiter_kind delim, token_stream children,
           const source_location &location = {});


/**
 * Structural equality of tokens
 *
 * Kinds, texts, literal kinds, delimiters and children are compared.
 * Provenance tags and punctuation spacing are not.
 */
[[nodiscard]] bool
equal(const token &a, const token &b) noexcept;

/**
 * Structural equality of token sequences
 *
 * \see equal(const token&, const token&)
 */
[[nodiscard]] bool
equal(const token_stream &a, const token_stream &b) noexcept;

inline bool
operator == (const token &a, const token &b) noexcept
{ return equal(a, b); }


/**
 * Total number of tokens in a tree, groups and all their descendants included
 */
[[nodiscard]] size_t
count_tokens(const token_stream &ts) noexcept;


std::string_view
token_kind_name(token_kind kind) noexcept;

std::string_view
literal_kind_name(literal_kind kind) noexcept;

/**
 * Opening and closing characters of a delimiter; NUL for invisible groups
 */
std::pair<char, char>
delimiter_chars(delimiter_kind delim) noexcept;

} // namespace spl
