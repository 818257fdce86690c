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

#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string_view>


namespace spl {

/**
 * Base of all errors reported against a piece of input
 *
 * \ingroup diagnostics
 */
struct bad_code: std::runtime_error {
  bad_code(std::string_view what): runtime_error(std::string(what)) { }
  bad_code(std::string_view what, const source_location &location);

  const std::optional<source_location>&
  location() const noexcept
  { return m_location; }

  void
  display(std::ostream &os) const noexcept;

  std::string
  display() const
  {
    std::ostringstream buf;
    display(buf);
    return buf.str();
  }

  private:
  std::optional<source_location> m_location;
}; // struct spl::bad_code


/**
 * Kinds of failures detected by the splice engine
 *
 * \ingroup diagnostics
 */
enum class splice_errc {
  malformed_splice_syntax,    ///< unmatched or nested splice markers, misplaced modifier
  empty_splice_unit,          ///< `[< >]` with no fragments
  unsupported_fragment_kind,  ///< token that can not be rendered as identifier text
  unknown_modifier,           ///< modifier name outside of the recognized set
  unresolved_span_reference,  ///< `span(<name>)` naming no token of the invocation
};

std::string_view
splice_errc_name(splice_errc code) noexcept;


/**
 * Failure of the splice engine
 *
 * \ingroup diagnostics
 */
struct splice_error: bad_code {
  splice_error(splice_errc code, std::string_view what,
               const source_location &location);

  splice_errc
  code() const noexcept
  { return m_code; }

  private:
  splice_errc m_code;
}; // struct spl::splice_error

} // namespace spl
