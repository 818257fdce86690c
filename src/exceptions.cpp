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


#include "splice/exceptions.hpp"

#include <format>


spl::bad_code::bad_code(std::string_view what, const source_location &location)
: runtime_error(std::string(what)), m_location {location}
{ }


void
spl::bad_code::display(std::ostream &os) const noexcept
{
  // Write basic error report
  os << what();

  // Write location if available
  if (m_location)
    os << "\n" << display_location(m_location.value());
}


std::string_view
spl::splice_errc_name(splice_errc code) noexcept
{
  switch (code)
  {
    case splice_errc::malformed_splice_syntax: return "malformed splice syntax";
    case splice_errc::empty_splice_unit: return "empty splice unit";
    case splice_errc::unsupported_fragment_kind: return "unsupported fragment kind";
    case splice_errc::unknown_modifier: return "unknown modifier";
    case splice_errc::unresolved_span_reference: return "unresolved span reference";
  }
  return "splice error";
}


spl::splice_error::splice_error(splice_errc code, std::string_view what,
                                const source_location &location)
: bad_code(std::format("{}: {}", splice_errc_name(code), what), location),
  m_code {code}
{ }
