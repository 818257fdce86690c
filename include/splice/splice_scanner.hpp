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

#include <span>

/**
 * \file splice_scanner.hpp
 * Recognition of splice units in token trees
 *
 * A splice unit is written `[< fragments... >]`: the open marker is a
 * bracket followed by `<`, the close marker is `>` followed by the matching
 * bracket. In a token tree the whole unit is therefore one bracket group
 * whose first and last children are the `<` and `>` punctuation.
 *
 * \ingroup splice
 */


namespace spl {

/**
 * Splice unit located on one level of a token tree
 *
 * \ingroup splice
 */
struct splice_unit {
  size_t index;       ///< position of the unit within its level
  const token *group; ///< the `[< ... >]` bracket group

  /**
   * Fragment tokens between the markers
   */
  std::span<const token>
  body() const noexcept
  { return {group->children.data() + 1, group->children.size() - 2}; }
};

/**
 * Check whether \p tok opens a splice unit, i.e. it is a bracket group
 * starting with `<`
 */
[[nodiscard]] bool
is_splice_open(const token &tok) noexcept;

/**
 * Delimit the splice unit opened by the token at \p index of \p level
 *
 * \pre `is_splice_open(level[index])`
 * \throws splice_error if the unit has no matching close marker
 */
[[nodiscard]] splice_unit
delimit_splice_unit(const token_stream &level, size_t index);

/**
 * Check whether a tree contains any splice marker at any depth
 */
[[nodiscard]] bool
contains_splice_units(const token_stream &ts) noexcept;

/**
 * Resolve all splice units of a token tree bottom-up
 *
 * Groups are rebuilt with their resolved children; every splice unit is
 * replaced by its concatenation result. Other tokens are copied unchanged.
 *
 * \param input Tree to rewrite
 * \param invocation Complete input of the expansion, which `span(<name>)`
 *        modifiers are resolved against
 * \throws splice_error on the first malformed unit; nothing is returned then
 */
[[nodiscard]] token_stream
scan(const token_stream &input, const token_stream &invocation);

} // namespace spl
