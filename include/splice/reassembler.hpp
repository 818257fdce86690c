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

#include "splice/token.hpp"


namespace spl {

/**
 * Replacement of the span `[begin, end)` of a level by a single token
 *
 * \ingroup splice
 */
struct replacement {
  size_t begin;
  size_t end;
  token result;
};

/**
 * Build a new level from \p level with every replacement applied
 *
 * Tokens outside of the replaced spans are copied in order.
 *
 * \param level Original tokens
 * \param replacements Non-overlapping replacements ordered by position
 * \throws std::invalid_argument if replacements overlap, are out of order or
 *         exceed the level
 */
[[nodiscard]] token_stream
reassemble(const token_stream &level, const stl::vector<replacement> &replacements);

/**
 * Splice invisible groups adjacent to a `::` path separator into the level
 *
 * Path segments can not contain invisible groups, so `<group>::x` and
 * `x::<group>` become plain paths.
 */
[[nodiscard]] token_stream
flatten_path_segments(const token_stream &level);

} // namespace spl
