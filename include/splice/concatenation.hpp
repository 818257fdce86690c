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

#include "splice/exceptions.hpp"
#include "splice/token.hpp"

#include <optional>
#include <span>
#include <string_view>

/**
 * \file concatenation.hpp
 * Concatenation of splice unit fragments
 *
 * The body of a splice unit is a list of fragments: identifiers or literals,
 * each optionally followed by `:modifier` suffixes. Fragments are folded left
 * to right into the text of a single identifier.
 *
 * \ingroup splice
 */


namespace spl {

enum class modifier_kind {
  lower, // `:lower`, Unicode lowercase of the fragment text
  upper, // `:upper`, Unicode uppercase of the fragment text
  span,  // `:span` or `:span(<name>)`, provenance of the result
};

/**
 * Modifier attached to a fragment
 *
 * \ingroup splice
 */
struct modifier {
  modifier_kind kind;
  source_location location; ///< location of the modifier name
  std::optional<stl::string> reference; ///< argument of `span(<name>)`
};

/**
 * One concatenable piece of a splice unit
 *
 * \ingroup splice
 */
struct fragment {
  stl::string text; ///< contribution to the identifier, before modifiers
  source_location location;
  stl::vector<modifier> modifiers;
};


/**
 * Look up a modifier by name in the table of recognized modifiers
 *
 * \return Kind of the modifier, or nothing if the name is not recognized
 */
[[nodiscard]] std::optional<modifier_kind>
find_modifier(std::string_view name) noexcept;

std::string_view
modifier_name(modifier_kind kind) noexcept;


/**
 * Split the body of a splice unit into fragments
 *
 * Invisible groups contribute their own fragments in place.
 *
 * \param body Tokens between the `<` and `>` of the splice unit
 * \param unit_location Location of the whole `[< ... >]` group
 * \return Fragments in order of appearance; never empty
 * \throws splice_error on empty units, unsupported tokens and ill-formed or
 *         unknown modifiers
 */
[[nodiscard]] stl::vector<fragment>
parse_fragments(std::span<const token> body,
                const source_location &unit_location);

/**
 * Text a literal contributes to a pasted identifier
 *
 * Integer literals contribute their source text, string literals their
 * contents without quotes.
 *
 * \throws splice_error if the literal can not be rendered as identifier text
 */
[[nodiscard]] stl::string
literal_fragment_text(const token &literal);

/**
 * Check that \p text can be used as an identifier
 */
[[nodiscard]] bool
is_valid_identifier(std::string_view text) noexcept;

/**
 * Apply modifiers and fold fragments into a single identifier
 *
 * The identifier takes the provenance of the splice unit, unless one of the
 * fragments carries a `span` modifier.
 *
 * \param fragments Fragments of the unit, see parse_fragments()
 * \param unit_location Location of the whole `[< ... >]` group
 * \param invocation Complete input of the expansion, searched by
 *        `span(<name>)` modifiers
 * \throws splice_error
 */
[[nodiscard]] token
concatenate(const stl::vector<fragment> &fragments,
            const source_location &unit_location,
            const token_stream &invocation);

} // namespace spl
