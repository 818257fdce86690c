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


#include "splice/reassembler.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <stdexcept>


spl::token_stream
spl::reassemble(const token_stream &level,
                const stl::vector<replacement> &replacements)
{
  token_stream result;
  result.reserve(level.size());

  size_t cursor = 0;
  for (const replacement &r : replacements)
  {
    if (r.begin < cursor or r.begin >= r.end or r.end > level.size())
      throw std::invalid_argument {std::format(
          "invalid replacement of [{}, {}) in a level of {} token(s)", r.begin,
          r.end, level.size())};

    std::copy(level.begin() + cursor, level.begin() + r.begin,
              std::back_inserter(result));
    result.push_back(r.result);
    cursor = r.end;
  }
  std::copy(level.begin() + cursor, level.end(), std::back_inserter(result));

  return result;
}


static bool
_is_path_separator(const spl::token_stream &ts, size_t i) noexcept
{
  return i + 1 < ts.size() and ts[i].is_punct(':') and
         ts[i].spacing == spl::punct_spacing::joint and ts[i + 1].is_punct(':');
}


spl::token_stream
spl::flatten_path_segments(const token_stream &level)
{
  // Mark invisible groups touching a separator on either side
  stl::vector<bool> flatten(level.size(), false);
  for (size_t i = 0; i < level.size(); ++i)
  {
    if (not _is_path_separator(level, i))
      continue;
    if (i > 0 and level[i - 1].is_group(delimiter_kind::none))
      flatten[i - 1] = true;
    if (i + 2 < level.size() and level[i + 2].is_group(delimiter_kind::none))
      flatten[i + 2] = true;
  }

  token_stream result;
  for (size_t i = 0; i < level.size(); ++i)
  {
    if (flatten[i])
      std::ranges::copy(level[i].children, std::back_inserter(result));
    else
      result.push_back(level[i]);
  }
  return result;
}
