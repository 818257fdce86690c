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


#include "splice/source_reader.hpp"
#include "splice/logging.hpp"


spl::source_reader::source_reader(lexer &lex, std::string source_name)
: m_lexer {lex}, m_source_name {std::move(source_name)}
{ }


void
spl::source_reader::operator << (const std::string &line)
{
  m_buffer.append(line).push_back('\n');

  try
  {
    token_stream ts = m_lexer.tokenize(m_buffer, m_source_name);
    if (not ts.empty())
      m_streams.push_back(std::move(ts));
    m_buffer.clear();
  }
  catch (const parse_error &exn)
  {
    if (exn.incomplete())
    {
      debug("waiting for more input: {}", exn.what());
      return;
    }
    m_buffer.clear();
    throw;
  }
}


bool
spl::source_reader::operator >> (token_stream &result)
{
  if (m_streams.empty())
    return false;
  result = std::move(m_streams.front());
  m_streams.pop_front();
  return true;
}
