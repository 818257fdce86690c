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
#include "splice/stl/map.hpp"

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file expander.hpp
 * Registry of named expanders and expansion of their invocations
 *
 * An expander is a function from a token sequence to a token sequence. Source
 * text invokes it with the usual macro syntax: `name!(...)`, `name![...]` or
 * `name!{...}`, optionally behind a path (`kernel::macros::paste!{...}`).
 *
 * \ingroup expansion
 */


namespace spl {

template <typename T>
concept expansion = requires(const T t, const token_stream &ts)
{
  { t(ts) } -> std::convertible_to<token_stream>;
};

using expander = std::function<token_stream(const token_stream&)>;


/**
 * Exception thrown when an invocation can not be expanded
 *
 * \ingroup expansion
 */
struct expansion_error: public bad_code {
  using bad_code::bad_code;
}; // struct spl::expansion_error


/**
 * Table of expanders applied to every invocation found in a token tree
 *
 * Usage example:
 * ```
 * expander_table table;
 * table.add("twice", [](const token_stream &ts) {
 *   token_stream result = ts;
 *   result.insert(result.end(), ts.begin(), ts.end());
 *   return result;
 * });
 *
 * // `twice!(x y)` becomes `x y x y`
 * token_stream result = table(lexer {}.tokenize("twice!(x y)"));
 * ```
 *
 * Expansion results are rescanned for further invocations. Each invocation is
 * replaced with an invisible group holding its expansion.
 *
 * \ingroup expansion
 */
class expander_table {
  public:
  using error_handler = std::function<void(const bad_code&)>;

  /** Limit on invocations expanded inside the output of other invocations */
  static constexpr size_t recursion_limit = 64;

  expander_table() = default;
  expander_table(const expander_table&) = delete;
  expander_table(expander_table&&) = delete;
  expander_table& operator = (const expander_table&) = delete;
  expander_table& operator = (expander_table&&) = delete;

  /**
   * Register expander under \p name
   *
   * \throws std::invalid_argument if \p name is already registered
   */
  void
  add(std::string_view name, const expander &exp);

  bool
  contains(std::string_view name) const noexcept;

  /**
   * \throws expansion_error if \p name is not registered
   */
  const expander&
  at(std::string_view name) const;

  /**
   * Names of registered expanders in lexicographical order
   */
  std::vector<std::string>
  names() const;

  /**
   * Expand all invocations in a token tree
   *
   * \throws bad_code on the first failing invocation
   */
  token_stream
  operator () (const token_stream &ts) const;

  /**
   * Expand all invocations in a token tree, reporting failures to \p handler
   *
   * A failing invocation is left in place as written and expansion goes on
   * with the rest of the tree.
   */
  token_stream
  operator () (const token_stream &ts, const error_handler &handler) const;

  private:
  token_stream
  _expand(const token_stream &level, size_t depth,
          const error_handler *handler) const;

  stl::map<stl::string, expander, std::less<>> m_expanders;
}; // class spl::expander_table
static_assert(expansion<expander_table>);


/**
 * Table preloaded with `paste` and `concat_idents`
 *
 * \ingroup expansion
 */
struct builtin_expanders: public expander_table {
  builtin_expanders();
}; // struct spl::builtin_expanders

} // namespace spl
