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

#include <format>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <sys/types.h>


namespace spl {

extern
std::set<std::string> global_flags;


enum class loglevel: int {
  silent,
  error,
  warning,
  info,
  debug,
};

inline std::string_view
loglevel_name(loglevel lvl)
{
  switch (lvl)
  {
    case loglevel::silent: return "silent";
    case loglevel::error: return "error";
    case loglevel::warning: return "warning";
    case loglevel::info: return "info";
    case loglevel::debug: return "debug";
  }
  std::terminate();
}

inline loglevel
parse_loglevel(std::string_view name)
{
  if (name == "silent")
    return loglevel::silent;
  if (name == "error")
    return loglevel::error;
  if (name == "warning")
    return loglevel::warning;
  if (name == "info")
    return loglevel::info;
  if (name == "debug")
    return loglevel::debug;
  throw std::runtime_error {std::format("Invalid loglevel name ({})", name)};
}


inline bool
operator >= (loglevel a, loglevel b)
{ return static_cast<int>(a) >= static_cast<int>(b); }


extern size_t logging_indent;

extern loglevel loglevel;


struct add_indent {
  add_indent(size_t indent): m_indent {indent} { }

  inline friend std::ostream&
  operator << (std::ostream &os, const add_indent &self) noexcept
  {
    for (size_t i = 1; i < self.m_indent; ++i)
      os << "\e[2m¦\e[0m ";
    if (self.m_indent > 0)
      os << "| ";
    return os;
  }

  private:
  size_t m_indent;
};


/**
 * Insert indentation for each line of multiline string except for the first
 * one, which is preceded by the log header instead
 */
[[nodiscard]] inline std::string
indent_lines(const add_indent &indent, const std::string &string)
{
  std::istringstream input {string};
  std::ostringstream output;
  std::string line;
  for (bool first = true; std::getline(input, line); first = false)
  {
    if (not first)
      output << indent;
    output << line << "\n";
  }
  return output.str();
}


namespace detail {

template <typename... Args> void
log(std::string_view header, size_t header_width,
    std::format_string<Args...> fmt, Args &&...args)
{
  const std::string message = std::format(fmt, std::forward<Args>(args)...);
  const add_indent indent {logging_indent + header_width};
  std::cerr << "splice " << header << " " << indent_lines(indent, message);
}

} // namespace spl::detail


template <typename... Args> void
debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args &&...args)
{
#ifndef SPLICE_RELEASE_BUILD
  if (loglevel >= loglevel::debug)
    detail::log("\e[7;1mdebug\e[0m", 7, fmt, std::forward<Args>(args)...);
#endif
}


template <typename... Args> void
info(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::info)
    detail::log("info", 6, fmt, std::forward<Args>(args)...);
}


template <typename... Args> void
warning(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::warning)
    detail::log("\e[38;5;3;1mwarning\e[0m", 9, fmt, std::forward<Args>(args)...);
}


template <typename... Args> void
error(std::format_string<Args...> fmt, Args &&...args)
{
  if (loglevel >= loglevel::error)
    detail::log("\e[38;5;1;1merror\e[0m", 7, fmt, std::forward<Args>(args)...);
}


struct indent {
  indent(ssize_t inc = 1)
  : m_inc {inc}
  { logging_indent += m_inc; }

  ~indent()
  { logging_indent -= m_inc; }

  indent(const indent&) = delete;
  void operator = (const indent&) = delete;

  private:
  ssize_t m_inc;
}; // struct spl::indent

} // namespace spl
