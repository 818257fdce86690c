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


#include "splice/token.hpp"

#include <algorithm>


spl::token
spl::make_ident(std::string_view name, const source_location &location)
{
  token result;
  result.kind = token_kind::ident;
  result.text = stl::string {name};
  result.location = location;
  return result;
}


spl::token
spl::make_literal(literal_kind kind, std::string_view text,
                  const source_location &location)
{
  token result;
  result.kind = token_kind::literal;
  result.lit_kind = kind;
  result.text = stl::string {text};
  result.location = location;
  return result;
}


spl::token
spl::make_punct(char c, punct_spacing spacing, const source_location &location)
{
  token result;
  result.kind = token_kind::punct;
  result.text = stl::string(1, c);
  result.spacing = spacing;
  result.location = location;
  return result;
}


spl::token
spl::make_group(delimiter_kind delim, token_stream children,
                const source_location &location)
{
  token result;
  result.kind = token_kind::group;
  result.delim = delim;
  result.children = std::move(children);
  result.location = location;
  return result;
}


bool
spl::equal(const token &a, const token &b) noexcept
{
  if (a.kind != b.kind)
    return false;

  switch (a.kind)
  {
    case token_kind::ident:
    case token_kind::punct:
      return a.text == b.text;

    case token_kind::literal:
      return a.lit_kind == b.lit_kind and a.text == b.text;

    case token_kind::group:
      return a.delim == b.delim and equal(a.children, b.children);
  }
  return false;
}


bool
spl::equal(const token_stream &a, const token_stream &b) noexcept
{
  return std::ranges::equal(a, b, [](const token &x, const token &y) {
    return equal(x, y);
  });
}


size_t
spl::count_tokens(const token_stream &ts) noexcept
{
  size_t n = 0;
  for (const token &tok : ts)
    n += 1 + (tok.is_group() ? count_tokens(tok.children) : 0);
  return n;
}


std::string_view
spl::token_kind_name(token_kind kind) noexcept
{
  switch (kind)
  {
    case token_kind::ident: return "identifier";
    case token_kind::literal: return "literal";
    case token_kind::punct: return "punctuation";
    case token_kind::group: return "group";
  }
  return "token";
}


std::string_view
spl::literal_kind_name(literal_kind kind) noexcept
{
  switch (kind)
  {
    case literal_kind::integer: return "integer";
    case literal_kind::floating: return "float";
    case literal_kind::string: return "string";
    case literal_kind::raw_string: return "raw string";
    case literal_kind::byte: return "byte";
    case literal_kind::byte_string: return "byte string";
    case literal_kind::character: return "character";
    case literal_kind::c_string: return "C string";
  }
  return "literal";
}


std::pair<char, char>
spl::delimiter_chars(delimiter_kind delim) noexcept
{
  switch (delim)
  {
    case delimiter_kind::parenthesis: return {'(', ')'};
    case delimiter_kind::bracket: return {'[', ']'};
    case delimiter_kind::brace: return {'{', '}'};
    case delimiter_kind::none: break;
  }
  return {'\0', '\0'};
}
