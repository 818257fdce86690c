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

#include "splice/lexer.hpp"
#include "splice/token.hpp"
#include "splice/stl/deque.hpp"

#include <string>

/**
 * \file source_reader.hpp
 * Gradual reading of source text
 *
 * \ingroup lexer
 */


namespace spl {

/**
 * Utility class accumulating lines of text until they form complete token
 * trees
 *
 * Input ending inside a group, a literal or a block comment is kept until the
 * following lines complete it.
 *
 * \ingroup lexer
 */
class source_reader {
  public:
  source_reader(lexer &lex, std::string source_name = "<stdin>");

  /**
   * Feed a line of text
   *
   * \throws parse_error if the accumulated text can not be completed into a
   *         valid token tree; the text is discarded then
   */
  void
  operator << (const std::string &line);

  bool
  operator >> (token_stream &result);

  /**
   * Whether there is accumulated text waiting for more input
   */
  bool
  pending() const noexcept
  { return not m_buffer.empty(); }

  private:
  lexer &m_lexer;
  std::string m_source_name;
  std::string m_buffer;
  stl::deque<token_stream> m_streams;
}; // class spl::source_reader

} // namespace spl
