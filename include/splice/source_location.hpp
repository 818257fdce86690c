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

#include <string>
#include <string_view>

/**
 * \file source_location.hpp
 * Provenance tags of tokens
 *
 * This file defines utilities for tracking and displaying the source
 * locations tokens originate from.
 *
 * \ingroup tokens
 */

namespace spl {

/**
 * Location of a token in the input stream
 *
 * The source name is held in a plain `std::string`: locations travel inside
 * exceptions, whose storage the collector does not scan.
 *
 * \ingroup tokens
 */
struct source_location {
  source_location() = default;

  source_location(std::string_view source_, size_t start, size_t end)
  : source {source_},
    start {start},
    end {end}
  { }

  bool
  operator == (const source_location &other) const noexcept
  { return source == other.source and start == other.start and end == other.end; }

  std::string source {"<unknown>"}; ///< Source name (filepath or "<string>")
  size_t start {0}; ///< Start offset in the input stream
  size_t end {0};   ///< End offset in the input stream
};

/**
 * Location covering both \p from and \p to
 *
 * \param from Location of the first token of the region
 * \param to Location of the last token of the region
 */
[[nodiscard]] source_location
merge_locations(const source_location &from, const source_location &to);

/**
 * Display a fragment of a file according to location with surrounding context
 * and highlighting of the location region
 *
 * \param location Source location to display
 * \param context_lines Number of context lines to show before and after the location
 * \return Formatted string with the file fragment and highlighting
 */
[[nodiscard]] std::string
display_location(const source_location &location, size_t context_lines = 2,
                 std::string_view hlstyle = "\e[38;5;1;1m",
                 std::string_view ctxstyle = "",
                 std::string_view endstyle = "\e[0m");

} // namespace spl
