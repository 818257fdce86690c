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


#include "splice/driver.hpp"
#include "splice/lexer.hpp"
#include "splice/logging.hpp"
#include "splice/token_printer.hpp"
#include "splice/utilities/execution_timer.hpp"

#include <format>
#include <ostream>
#include <sstream>


void
spl::select_expanders(const expander_table &from,
                      const std::vector<std::string> &names,
                      expander_table &into)
{
  for (const std::string &name : names)
  {
    if (not from.contains(name))
      throw expansion_error {std::format("unknown macro `{}`", name)};
    if (not into.contains(name))
      into.add(name, from.at(name));
  }
}


bool
spl::expand_and_write(const token_stream &in, const expander_table &table,
                      const output_options &opts, std::ostream &os)
{
  size_t nfailures = 0;
  token_stream out;
  {
    execution_timer _ {"expansion"};
    if (opts.keep_going)
    {
      out = table(in, [&](const bad_code &exn) {
        error("{}", exn.display());
        nfailures += 1;
      });
    }
    else
      out = table(in);
  }

  if (nfailures > 0)
  {
    error("{} invocation(s) failed to expand", nfailures);
    return false;
  }

  if (opts.dump_tokens)
    dump(os, out);
  else
    print(os, out);
  os << std::endl;
  return true;
}


bool
spl::process_source(std::istream &in, const std::string &source_name,
                    const expander_table &table, const output_options &opts,
                    std::ostream &os)
{
  token_stream ts;
  {
    execution_timer _ {"lexing"};
    ts = lexer {}.tokenize(in, source_name);
  }
  info("read {} tokens from {}", count_tokens(ts), source_name);

  std::ostringstream buffer;
  if (not expand_and_write(ts, table, opts, buffer))
    return false;
  os << buffer.str();
  return true;
}
