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

#include "splice/expander.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/**
 * \file driver.hpp
 * Expansion of whole sources, as done by the `splice` command
 *
 * \ingroup expansion
 */


namespace spl {

struct output_options {
  bool dump_tokens = false; ///< Write the token tree instead of source text
  bool keep_going = false; ///< Report every failing invocation
}; // struct spl::output_options


/**
 * Copy the expanders named in \p names from \p from into \p into
 *
 * Names given more than once are added once.
 *
 * \throws expansion_error if \p from has no expander of some name
 *
 * \ingroup expansion
 */
void
select_expanders(const expander_table &from,
                 const std::vector<std::string> &names, expander_table &into);


/**
 * Expand all invocations of \p in and write the result into \p os
 *
 * With `keep_going`, every failing invocation is logged and expansion goes on
 * with the rest of the input; nothing is written if any of them failed.
 * Otherwise the first failure is thrown.
 *
 * \return Whether expansion succeeded
 *
 * \ingroup expansion
 */
[[nodiscard]] bool
expand_and_write(const token_stream &in, const expander_table &table,
                 const output_options &opts, std::ostream &os);


/**
 * Lex, expand and write a complete source
 *
 * Output is written to \p os only once expansion of the whole source has
 * succeeded.
 *
 * \return Whether expansion succeeded
 * \throws bad_code on invalid input, or on a failing invocation without
 * `keep_going`
 *
 * \ingroup expansion
 */
[[nodiscard]] bool
process_source(std::istream &in, const std::string &source_name,
               const expander_table &table, const output_options &opts,
               std::ostream &os);

} // namespace spl
