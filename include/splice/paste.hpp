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

/**
 * \file paste.hpp
 * The `paste` expander
 *
 * \ingroup splice
 */


namespace spl {

/**
 * Paste identifiers together
 *
 * Within the input, identifiers and literals written between `[<` and `>]`
 * are concatenated into a single identifier:
 * ```
 * fn [<some_ "foo" _fn 100>]() -> u32 { 100 }
 * ```
 * becomes
 * ```
 * fn some_foo_fn100() -> u32 { 100 }
 * ```
 *
 * Each fragment may carry modifiers, applied left to right:
 * - `lower`, `upper`: change the case of the fragment;
 * - `span`: give the pasted identifier the location of this fragment instead
 *   of the location of the `[< >]` group;
 * - `span(name)`: give the pasted identifier the location of the first
 *   identifier `name` of the input.
 *
 * When several case modifiers are attached to one fragment the last one
 * wins. Invisible groups next to a `::` path separator are flattened
 * afterwards, unless the `NoPathFlatten` global flag is set. Input without
 * any splice unit is returned as is.
 *
 * \param input Complete input of the invocation
 * \return Rewritten tokens, free of splice markers
 * \throws splice_error if any splice unit is malformed
 *
 * \ingroup splice
 */
[[nodiscard]] token_stream
paste(const token_stream &input);

} // namespace spl
