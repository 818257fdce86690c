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


#include "splice/token_printer.hpp"

#include <sstream>


void
spl::print(std::ostream &os, const token_stream &ts)
{
  bool glue = true;
  for (const token &tok : ts)
  {
    // Empty invisible groups must not leave a dangling separator
    if (tok.is_group(delimiter_kind::none) and tok.children.empty())
      continue;

    if (not glue)
      os << ' ';
    print(os, tok);
    glue = tok.kind == token_kind::punct and tok.spacing == punct_spacing::joint;
  }
}


void
spl::print(std::ostream &os, const token &tok)
{
  if (tok.kind != token_kind::group)
  {
    os << tok.text;
    return;
  }

  const auto [open, close] = delimiter_chars(tok.delim);
  if (open)
    os << open;
  print(os, tok.children);
  if (close)
    os << close;
}


std::string
spl::to_string(const token_stream &ts)
{
  std::ostringstream buf;
  print(buf, ts);
  return buf.str();
}


std::string
spl::to_string(const token &tok)
{
  std::ostringstream buf;
  print(buf, tok);
  return buf.str();
}


void
spl::dump(std::ostream &os, const token_stream &ts)
{
  for (size_t i = 0; i < ts.size(); ++i)
  {
    if (i > 0)
      os << ' ';
    dump(os, ts[i]);
  }
}


void
spl::dump(std::ostream &os, const token &tok)
{
  switch (tok.kind)
  {
    case token_kind::ident:
      os << "[ident " << tok.text << "]";
      break;

    case token_kind::literal:
      os << "[lit " << literal_kind_name(tok.lit_kind) << " " << tok.text << "]";
      break;

    case token_kind::punct:
      os << "[punct " << tok.text
         << (tok.spacing == punct_spacing::joint ? " joint]" : "]");
      break;

    case token_kind::group: {
      const auto [open, close] = delimiter_chars(tok.delim);
      os << "[group " << (open ? open : '~');
      if (not tok.children.empty())
      {
        os << ' ';
        dump(os, tok.children);
      }
      os << ' ' << (close ? close : '~') << "]";
      break;
    }
  }
}
