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


#include "splice/expander.hpp"
#include "splice/concat_idents.hpp"
#include "splice/format.hpp"
#include "splice/logging.hpp"
#include "splice/paste.hpp"
#include "splice/reassembler.hpp"

#include <stdexcept>


void
spl::expander_table::add(std::string_view name, const expander &exp)
{
  if (not m_expanders.emplace(stl::string {name}, exp).second)
  {
    throw std::invalid_argument {
        std::format("expander `{}` is already registered", name)};
  }
}


bool
spl::expander_table::contains(std::string_view name) const noexcept
{ return m_expanders.find(name) != m_expanders.end(); }


const spl::expander&
spl::expander_table::at(std::string_view name) const
{
  const auto it = m_expanders.find(name);
  if (it == m_expanders.end())
    throw expansion_error {std::format("no expander named `{}`", name)};
  return it->second;
}


std::vector<std::string>
spl::expander_table::names() const
{
  std::vector<std::string> result;
  for (const auto &[name, _] : m_expanders)
    result.emplace_back(name);
  return result;
}


spl::token_stream
spl::expander_table::operator () (const token_stream &ts) const
{ return _expand(ts, 0, nullptr); }


spl::token_stream
spl::expander_table::operator () (const token_stream &ts,
                                  const error_handler &handler) const
{ return _expand(ts, 0, &handler); }


static bool
_is_path_separator(const spl::token_stream &level, size_t end)
{
  // `::` ending right before `end`
  return end >= 2 and level[end - 1].is_punct(':') and
         level[end - 2].is_punct(':') and
         level[end - 2].spacing == spl::punct_spacing::joint;
}


/**
 * Find the first token of the path leading to the invocation name at \p name
 *
 * Leading `::` and `segment::` prefixes belong to the invocation. Tokens
 * before \p floor are already taken by another replacement.
 */
static size_t
_path_begin(const spl::token_stream &level, size_t name, size_t floor)
{
  size_t begin = name;
  while (begin >= floor + 2 and _is_path_separator(level, begin))
  {
    begin -= 2;
    if (begin > floor and level[begin - 1].is_ident())
      begin -= 1;
    else
      break;
  }
  return begin;
}


/**
 * Check for a `macro_rules! name { ... }` definition at \p i
 *
 * The body of a definition is a pattern over `$` metavariables, not code,
 * and is left for the expansion of the macro itself.
 */
static bool
_is_macro_definition(const spl::token_stream &level, size_t i)
{
  return i + 3 < level.size() and level[i].is_ident("macro_rules") and
         level[i + 1].is_punct('!') and level[i + 2].is_ident() and
         level[i + 3].is_group();
}


static bool
_is_invocation_group(const spl::token &tok)
{
  using spl::delimiter_kind;
  return tok.is_group(delimiter_kind::parenthesis) or
         tok.is_group(delimiter_kind::bracket) or
         tok.is_group(delimiter_kind::brace);
}


spl::token_stream
spl::expander_table::_expand(const token_stream &level, size_t depth,
                             const error_handler *handler) const
{
  stl::vector<replacement> replacements;
  size_t floor = 0;

  for (size_t i = 0; i < level.size(); ++i)
  {
    const token &tok = level[i];

    if (_is_macro_definition(level, i))
    {
      debug("skipping definition of {}!", level[i + 2].text);
      floor = i + 4;
      i += 3;
    }
    else if (i + 2 < level.size() and tok.is_ident() and contains(tok.text) and
        level[i + 1].is_punct('!') and _is_invocation_group(level[i + 2]))
    {
      const token &args = level[i + 2];
      const size_t begin = _path_begin(level, i, floor);
      const source_location location =
          merge_locations(level[begin].location, args.location);

      try
      {
        if (depth >= recursion_limit)
        {
          throw expansion_error {
              std::format("recursion limit reached while expanding `{}!`",
                          tok.text),
              location};
        }

        debug("expanding {}! at {}", tok.text, location);
        indent _;
        const token_stream output = at(tok.text)(args.children);
        replacements.push_back({begin, i + 3,
                                make_group(delimiter_kind::none,
                                           _expand(output, depth + 1, handler),
                                           location)});
      }
      catch (const bad_code &exn)
      {
        if (handler == nullptr)
          throw;
        (*handler)(exn);
      }

      floor = i + 3;
      i += 2;
    }
    else if (tok.is_group())
    {
      token_stream children = _expand(tok.children, depth, handler);
      if (not equal(children, tok.children))
      {
        replacements.push_back({i, i + 1,
                                make_group(tok.delim, std::move(children),
                                           tok.location)});
      }
      floor = i + 1;
    }
  }

  if (replacements.empty())
    return level;
  return reassemble(level, replacements);
}


spl::builtin_expanders::builtin_expanders()
{
  add("paste", paste);
  add("concat_idents", concat_idents);
}
