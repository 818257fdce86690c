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

#include "splice/source_location.hpp"
#include "splice/token.hpp"
#include "splice/token_printer.hpp"

#include <algorithm>
#include <format>
#include <sstream>

/**
 * \file format.hpp
 * Formatting utilities
 *
 * `std::format` support for tokens, token sequences and source locations.
 * Tokens and sequences are written as source text by default; the `d`
 * specifier selects the structural dump instead.
 *
 * \ingroup utils
 */


namespace spl::detail {

/**
 * Shared parser for `{}` and `{:d}` specifiers
 *
 * \ingroup utils
 */
struct token_formatter_base {
  bool dump = false;

  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() and *it == 'd')
    {
      dump = true;
      it++;
    }
    if (it != ctx.end() and *it != '}')
      throw std::format_error {"Invalid format arguments for spl::token"};
    return it;
  }

  template <typename T, class FmtContext>
  FmtContext::iterator
  write(const T &x, FmtContext &ctx) const
  {
    std::ostringstream buffer;
    if (dump)
      spl::dump(buffer, x);
    else
      spl::print(buffer, x);
    return std::ranges::copy(std::move(buffer).str(), ctx.out()).out;
  }
}; // struct spl::detail::token_formatter_base

} // namespace spl::detail


namespace std {

template <>
struct formatter<spl::token, char>: spl::detail::token_formatter_base {
  template <class FmtContext>
  FmtContext::iterator
  format(const spl::token &x, FmtContext &ctx) const
  { return write(x, ctx); }
};

template <>
struct formatter<spl::token_stream, char>: spl::detail::token_formatter_base {
  template <class FmtContext>
  FmtContext::iterator
  format(const spl::token_stream &x, FmtContext &ctx) const
  { return write(x, ctx); }
};

template <>
struct formatter<spl::source_location, char> {
  template <class ParseContext>
  constexpr ParseContext::iterator
  parse(ParseContext &ctx)
  { return ctx.begin(); }

  template <class FmtContext>
  FmtContext::iterator
  format(const spl::source_location &x, FmtContext &ctx) const
  { return std::format_to(ctx.out(), "{}:{}-{}", x.source, x.start, x.end); }
};

} // namespace std
