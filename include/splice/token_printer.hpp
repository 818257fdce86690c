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

#include <ostream>
#include <string>


namespace spl {

/**
 * Write tokens back as source text
 *
 * Tokens are separated by a single space, except after joint punctuation.
 * Invisible groups are written as their bare contents.
 *
 * \ingroup tokens
 */
void
print(std::ostream &os, const token_stream &ts);

void
print(std::ostream &os, const token &tok);

[[nodiscard]] std::string
to_string(const token_stream &ts);

[[nodiscard]] std::string
to_string(const token &tok);

/**
 * Write a structural view of a token tree, one bracketed entry per token
 *
 * \ingroup tokens
 */
void
dump(std::ostream &os, const token_stream &ts);

void
dump(std::ostream &os, const token &tok);

inline std::ostream&
operator << (std::ostream &os, const token &tok)
{
  print(os, tok);
  return os;
}

} // namespace spl
