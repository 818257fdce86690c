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


#include "splice/concatenation.hpp"
#include "splice/lexer.hpp"
#include "splice/logging.hpp"
#include "splice/splice_scanner.hpp"
#include "splice/token_printer.hpp"

#include <boost/locale.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <locale>
#include <string>


namespace {

using namespace spl;

// Identifiers may hold any Unicode letters; fold them as UTF-8 text
const std::locale&
_text_locale()
{
  static const std::locale locale = boost::locale::generator {}("en_US.UTF-8");
  return locale;
}

void
_to_lower(stl::string &text)
{
  const std::string folded =
      boost::locale::to_lower(text.data(), text.data() + text.size(),
                              _text_locale());
  text.assign(folded.begin(), folded.end());
}

void
_to_upper(stl::string &text)
{
  const std::string folded =
      boost::locale::to_upper(text.data(), text.data() + text.size(),
                              _text_locale());
  text.assign(folded.begin(), folded.end());
}


struct modifier_entry {
  std::string_view name;
  modifier_kind kind;
  void (*transform_text)(stl::string &); // nullptr for provenance modifiers
};

constexpr std::array<modifier_entry, 3> modifier_table {{
  {"lower", modifier_kind::lower, _to_lower},
  {"upper", modifier_kind::upper, _to_upper},
  {"span", modifier_kind::span, nullptr},
}};

const modifier_entry&
_entry(modifier_kind kind) noexcept
{
  return *std::ranges::find(modifier_table, kind, &modifier_entry::kind);
}


std::string_view
_strip_raw_prefix(std::string_view name) noexcept
{ return name.starts_with("r#") ? name.substr(2) : name; }


// First identifier named `name`, depth-first in document order. Splice units
// are not searched: identifiers inside them do not survive expansion.
const token*
_find_reference(const token_stream &ts, std::string_view name) noexcept
{
  for (const token &tok : ts)
  {
    if (tok.is_ident(name))
      return &tok;
    if (tok.is_group() and not is_splice_open(tok))
    {
      if (const token *found = _find_reference(tok.children, name))
        return found;
    }
  }
  return nullptr;
}


void
_collect_fragments(std::span<const token> body, stl::vector<fragment> &out)
{
  for (size_t i = 0; i < body.size(); ++i)
  {
    const token &tok = body[i];
    switch (tok.kind)
    {
      case token_kind::ident:
        out.push_back({stl::string {_strip_raw_prefix(tok.text)}, tok.location, {}});
        break;

      case token_kind::literal:
        out.push_back({literal_fragment_text(tok), tok.location, {}});
        break;

      case token_kind::group:
        if (tok.is_group(delimiter_kind::none))
          _collect_fragments(tok.children, out);
        else if (is_splice_open(tok))
          throw splice_error {splice_errc::malformed_splice_syntax,
                              "splice units can not be nested", tok.location};
        else
          throw splice_error {
              splice_errc::unsupported_fragment_kind,
              std::format("group `{}` can not be pasted", to_string(tok)),
              tok.location};
        break;

      case token_kind::punct: {
        if (not tok.is_punct(':'))
          throw splice_error {
              splice_errc::unsupported_fragment_kind,
              std::format("punctuation `{}` can not be pasted", tok.text),
              tok.location};
        if (out.empty())
          throw splice_error {splice_errc::malformed_splice_syntax,
                              "modifier must follow an identifier or a literal",
                              tok.location};
        if (i + 1 >= body.size() or not body[i + 1].is_ident())
          throw splice_error {splice_errc::malformed_splice_syntax,
                              "expected modifier name after `:`",
                              tok.location};

        const token &name = body[++i];
        const std::optional<modifier_kind> kind = find_modifier(name.text);
        if (not kind)
          throw splice_error {splice_errc::unknown_modifier,
                              std::format("`{}`", name.text), name.location};

        modifier mod {*kind, name.location, std::nullopt};
        if (*kind == modifier_kind::span and i + 1 < body.size() and
            body[i + 1].is_group(delimiter_kind::parenthesis))
        {
          const token &arg = body[++i];
          if (arg.children.size() != 1 or not arg.children.front().is_ident())
            throw splice_error {splice_errc::malformed_splice_syntax,
                                "`span` expects a single identifier argument",
                                arg.location};
          mod.reference = arg.children.front().text;
        }
        out.back().modifiers.push_back(std::move(mod));
        break;
      }
    }
  }
}

} // anonymous namespace


std::optional<spl::modifier_kind>
spl::find_modifier(std::string_view name) noexcept
{
  const auto it = std::ranges::find(modifier_table, name, &modifier_entry::name);
  if (it == modifier_table.end())
    return std::nullopt;
  return it->kind;
}


std::string_view
spl::modifier_name(modifier_kind kind) noexcept
{ return _entry(kind).name; }


spl::stl::vector<spl::fragment>
spl::parse_fragments(std::span<const token> body,
                     const source_location &unit_location)
{
  stl::vector<fragment> fragments;
  _collect_fragments(body, fragments);
  if (fragments.empty())
    throw splice_error {splice_errc::empty_splice_unit,
                        "nothing to paste between `[<` and `>]`",
                        unit_location};
  return fragments;
}


spl::stl::string
spl::literal_fragment_text(const token &literal)
{
  const std::string_view text = literal.text;
  switch (literal.lit_kind)
  {
    case literal_kind::integer:
      return stl::string {text};

    case literal_kind::string: {
      const bool plain = text.size() >= 2 and text.front() == '"' and
                         text.back() == '"';
      const std::string_view contents =
          plain ? text.substr(1, text.size() - 2) : std::string_view {};
      if (plain and std::ranges::all_of(contents, lexer::is_ident_continue))
        return stl::string {contents};
      throw splice_error {
          splice_errc::unsupported_fragment_kind,
          std::format("string literal {} is not identifier text", text),
          literal.location};
    }

    default:
      throw splice_error {
          splice_errc::unsupported_fragment_kind,
          std::format("{} literal `{}` can not be pasted",
                      literal_kind_name(literal.lit_kind), text),
          literal.location};
  }
}


bool
spl::is_valid_identifier(std::string_view text) noexcept
{
  return not text.empty() and lexer::is_ident_start(text.front()) and
         std::ranges::all_of(text, lexer::is_ident_continue);
}


spl::token
spl::concatenate(const stl::vector<fragment> &fragments,
                 const source_location &unit_location,
                 const token_stream &invocation)
{
  stl::string text;
  std::optional<source_location> span;

  for (const fragment &frag : fragments)
  {
    stl::string piece = frag.text;
    for (const modifier &mod : frag.modifiers)
    {
      const modifier_entry &entry = _entry(mod.kind);
      if (entry.transform_text)
      {
        try { entry.transform_text(piece); }
        catch (const boost::locale::conv::conversion_error&)
        {
          throw splice_error {
              splice_errc::unsupported_fragment_kind,
              std::format("`{}` can not be applied to `{}`: not UTF-8 text",
                          entry.name, piece),
              mod.location};
        }
        continue;
      }

      if (span)
        throw splice_error {
            splice_errc::malformed_splice_syntax,
            std::format("`{}` may appear at most once per splice unit",
                        modifier_name(mod.kind)),
            mod.location};
      if (mod.reference)
      {
        const token *target = _find_reference(invocation, *mod.reference);
        if (target == nullptr)
          throw splice_error {
              splice_errc::unresolved_span_reference,
              std::format("no identifier `{}` in the invocation", *mod.reference),
              mod.location};
        span = target->location;
      }
      else
        span = frag.location;
    }
    text += piece;
  }

  if (not is_valid_identifier(text))
    throw splice_error {
        splice_errc::unsupported_fragment_kind,
        std::format("pasted text `{}` is not a valid identifier", text),
        unit_location};

  debug("pasted `{}` from {} fragment(s)", text, fragments.size());
  return make_ident(text, span.value_or(unit_location));
}
