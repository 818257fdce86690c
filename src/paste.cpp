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


#include "splice/paste.hpp"
#include "splice/format.hpp"
#include "splice/logging.hpp"
#include "splice/reassembler.hpp"
#include "splice/splice_scanner.hpp"


static spl::token_stream
_flatten_tree(const spl::token_stream &level)
{
  using namespace spl;

  stl::vector<replacement> groups;
  for (size_t i = 0; i < level.size(); ++i)
  {
    const token &tok = level[i];
    if (tok.is_group())
      groups.push_back({i, i + 1,
                        make_group(tok.delim, _flatten_tree(tok.children),
                                   tok.location)});
  }
  return flatten_path_segments(reassemble(level, groups));
}


spl::token_stream
spl::paste(const token_stream &input)
{
  if (not contains_splice_units(input))
  {
    debug("paste: nothing to splice");
    return input;
  }

  debug("paste: {}", input);
  token_stream result = scan(input, input);
  if (not global_flags.contains("NoPathFlatten"))
    result = _flatten_tree(result);
  debug("paste result: {}", result);
  return result;
}
