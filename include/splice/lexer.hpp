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

#include <istream>
#include <string>
#include <string_view>

/**
 * \file lexer.hpp
 * Lexer producing token trees
 *
 * The lexical grammar follows Rust: identifiers (raw ones included),
 * numeric, string, raw string, byte, character and C string literals with
 * optional suffixes, single-character punctuation, line and (nested) block
 * comments, and the three kinds of delimited groups.
 *
 * \ingroup lexer
 */


namespace spl {

/**
 * Exception class for lexer errors
 *
 * \ingroup lexer
 */
struct parse_error: public bad_code {
  parse_error(std::string_view what, const source_location &location,
              bool incomplete = false)
  : bad_code(what, location), m_incomplete {incomplete}
  { }

  /**
   * Whether the error is due to the input ending in the middle of a group or
   * a literal, so that more input could make it valid
   */
  bool
  incomplete() const noexcept
  { return m_incomplete; }

  private:
  bool m_incomplete;
}; // struct spl::parse_error


/**
 * Lexer for source text
 *
 * \ingroup lexer
 */
class lexer {
  public:
  // Tokenize the input string into a token tree
  token_stream
  tokenize(std::string_view input, const std::string &source_name = "<string>");

  // Tokenize the input stream into a token tree
  token_stream
  tokenize(std::istream &input, const std::string &source_name = "<stream>");

  static bool
  is_ident_start(char c) noexcept;

  static bool
  is_ident_continue(char c) noexcept;

  static bool
  is_punct_char(char c) noexcept;
}; // class spl::lexer

} // namespace spl
