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


#include "splice/splice_scanner.hpp"
#include "splice/concatenation.hpp"
#include "splice/exceptions.hpp"
#include "splice/logging.hpp"
#include "splice/reassembler.hpp"

#include <algorithm>


bool
spl::is_splice_open(const token &tok) noexcept
{
  return tok.is_group(delimiter_kind::bracket) and not tok.children.empty() and
         tok.children.front().is_punct('<');
}


spl::splice_unit
spl::delimit_splice_unit(const token_stream &level, size_t index)
{
  const token &group = level.at(index);
  if (group.children.size() < 2 or not group.children.back().is_punct('>'))
    throw splice_error {splice_errc::malformed_splice_syntax,
                        "unterminated splice unit, expected `>]`",
                        group.location};
  return {index, &group};
}


bool
spl::contains_splice_units(const token_stream &ts) noexcept
{
  return std::ranges::any_of(ts, [](const token &tok) {
    return is_splice_open(tok) or
           (tok.is_group() and contains_splice_units(tok.children));
  });
}


spl::token_stream
spl::scan(const token_stream &input, const token_stream &invocation)
{
  stl::vector<replacement> replacements;

  for (size_t i = 0; i < input.size(); ++i)
  {
    const token &tok = input[i];
    if (is_splice_open(tok))
    {
      const splice_unit unit = delimit_splice_unit(input, i);
      const stl::vector<fragment> fragments =
          parse_fragments(unit.body(), tok.location);
      replacements.push_back(
          {i, i + 1, concatenate(fragments, tok.location, invocation)});
    }
    else if (tok.is_group() and contains_splice_units(tok.children))
    {
      // Resolve the group contents before the group itself is reassembled
      indent _;
      replacements.push_back(
          {i, i + 1,
           make_group(tok.delim, scan(tok.children, invocation), tok.location)});
    }
  }

  if (not replacements.empty())
    debug("resolved {} splice unit(s) and group(s) on a level of {} token(s)",
          replacements.size(), input.size());
  return reassemble(input, replacements);
}
