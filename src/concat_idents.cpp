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


#include "splice/concat_idents.hpp"
#include "splice/format.hpp"
#include "splice/logging.hpp"


static const spl::token&
_expect_ident(const spl::token_stream &input, size_t index,
              const spl::source_location &fallback)
{
  using namespace spl;

  if (index >= input.size())
    throw expansion_error {"concat_idents: expected an identifier", fallback};
  const token &tok = input[index];
  if (not tok.is_ident())
  {
    throw expansion_error {
        std::format("concat_idents: expected an identifier, got {} `{}`",
                    token_kind_name(tok.kind), tok),
        tok.location};
  }
  return tok;
}


spl::token_stream
spl::concat_idents(const token_stream &input)
{
  const source_location whole =
      input.empty() ? source_location {}
                    : merge_locations(input.front().location,
                                      input.back().location);

  const token &a = _expect_ident(input, 0, whole);
  if (input.size() < 2 or not input[1].is_punct(','))
  {
    throw expansion_error {"concat_idents: expected `,` after the first identifier",
                           input.size() < 2 ? a.location : input[1].location};
  }
  const token &b = _expect_ident(input, 2, input[1].location);
  if (input.size() > 3)
  {
    throw expansion_error {"concat_idents: unexpected tokens after the second identifier",
                           merge_locations(input[3].location,
                                           input.back().location)};
  }

  stl::string text {a.text};
  text.append(b.text);
  debug("concat_idents: {} + {} -> {}", a.text, b.text, text);
  return {make_ident(text, b.location)};
}
