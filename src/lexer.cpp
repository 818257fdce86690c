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


#include "splice/lexer.hpp"
#include "splice/logging.hpp"

#include <cctype>
#include <format>
#include <iterator>


namespace {

using namespace spl;

/**
 * Group that is still being read
 */
struct open_group {
  delimiter_kind delim;
  size_t start;
  token_stream children;
};


size_t
_utf8_length(char lead) noexcept
{
  const unsigned char c = lead;
  if (c < 0x80)
    return 1;
  if ((c & 0xE0) == 0xC0)
    return 2;
  if ((c & 0xF0) == 0xE0)
    return 3;
  if ((c & 0xF8) == 0xF0)
    return 4;
  return 1;
}


class scanner {
  public:
  scanner(std::string_view input, const std::string &source)
  : m_in {input}, m_source {source}
  { }

  bool
  eof() const noexcept
  { return m_pos >= m_in.size(); }

  char
  peek(size_t k = 0) const noexcept
  { return m_pos + k < m_in.size() ? m_in[m_pos + k] : '\0'; }

  size_t
  pos() const noexcept
  { return m_pos; }

  void
  advance(size_t n = 1) noexcept
  { m_pos += n; }

  source_location
  location(size_t start) const
  { return {m_source, start, m_pos}; }

  source_location
  location(size_t start, size_t end) const
  { return {m_source, start, end}; }

  std::string_view
  text(size_t start) const noexcept
  { return m_in.substr(start, m_pos - start); }

  void
  skip_blanks()
  {
    while (not eof())
    {
      if (std::isspace(static_cast<unsigned char>(peek())))
        advance();
      else if (peek() == '/' and peek(1) == '/')
      {
        while (not eof() and peek() != '\n')
          advance();
      }
      else if (peek() == '/' and peek(1) == '*')
        skip_block_comment();
      else
        break;
    }
  }

  void
  skip_identifier() noexcept
  {
    while (not eof() and lexer::is_ident_continue(peek()))
      advance();
  }

  void
  skip_digits(bool hex = false) noexcept
  {
    while (not eof() and
           (std::isdigit(static_cast<unsigned char>(peek())) or peek() == '_' or
            (hex and std::isxdigit(static_cast<unsigned char>(peek())))))
      advance();
  }

  // Cursor is at the opening quote
  void
  skip_quoted(char quote, size_t start, std::string_view what)
  {
    advance();
    while (not eof())
    {
      const char c = peek();
      if (c == '\\')
        advance(2);
      else if (c == quote)
      {
        advance();
        return;
      }
      else
        advance();
    }
    throw parse_error {std::format("unterminated {} literal", what),
                       location(start, m_in.size()), true};
  }

  // Cursor is at the `r` of a raw string
  void
  skip_raw(size_t start)
  {
    advance();
    size_t nhashes = 0;
    while (peek() == '#')
    {
      advance();
      nhashes++;
    }
    if (peek() != '"')
      throw parse_error {"invalid raw string literal, expected '\"'",
                         location(start)};
    advance();

    const std::string terminator = "\"" + std::string(nhashes, '#');
    const size_t end = m_in.find(terminator, m_pos);
    if (end == std::string_view::npos)
      throw parse_error {"unterminated raw string literal",
                         location(start, m_in.size()), true};
    m_pos = end + terminator.size();
  }

  private:
  void
  skip_block_comment()
  {
    const size_t start = m_pos;
    size_t depth = 0;
    do {
      if (eof())
        throw parse_error {"unterminated block comment",
                           location(start, start + 2), true};
      if (peek() == '/' and peek(1) == '*')
      {
        depth++;
        advance(2);
      }
      else if (peek() == '*' and peek(1) == '/')
      {
        depth--;
        advance(2);
      }
      else
        advance();
    } while (depth > 0);
  }

  std::string_view m_in;
  const std::string &m_source;
  size_t m_pos {0};
}; // class scanner


bool
_starts_raw_string(char a, char b) noexcept
{ return a == '"' or (a == '#' and (b == '"' or b == '#')); }


token
_read_number(scanner &sc)
{
  const size_t start = sc.pos();
  literal_kind kind = literal_kind::integer;

  if (sc.peek() == '0' and (sc.peek(1) == 'x' or sc.peek(1) == 'o' or sc.peek(1) == 'b'))
  {
    const bool hex = sc.peek(1) == 'x';
    sc.advance(2);
    sc.skip_digits(hex);
  }
  else
  {
    sc.skip_digits();

    // Fractional part, but neither a range `1..2` nor a method call `1.max(2)`
    if (sc.peek() == '.' and sc.peek(1) != '.' and
        not lexer::is_ident_start(sc.peek(1)))
    {
      kind = literal_kind::floating;
      sc.advance();
      sc.skip_digits();
    }

    // Exponent
    const auto digit = [](char c) {
      return std::isdigit(static_cast<unsigned char>(c)) != 0;
    };
    if ((sc.peek() == 'e' or sc.peek() == 'E') and
        (digit(sc.peek(1)) or
         ((sc.peek(1) == '+' or sc.peek(1) == '-') and digit(sc.peek(2)))))
    {
      kind = literal_kind::floating;
      sc.advance(2);
      sc.skip_digits();
    }
  }

  // Suffix
  if (lexer::is_ident_start(sc.peek()))
  {
    const size_t suffix_start = sc.pos();
    sc.skip_identifier();
    if (sc.text(suffix_start).starts_with('f') and kind == literal_kind::integer
        and sc.text(start).find_first_of("xob") == std::string_view::npos)
      kind = literal_kind::floating;
  }

  return make_literal(kind, sc.text(start), sc.location(start));
}


void
_skip_suffix(scanner &sc) noexcept
{
  if (lexer::is_ident_start(sc.peek()))
    sc.skip_identifier();
}


void
_push(stl::vector<open_group> &stack, token tok)
{ stack.back().children.push_back(std::move(tok)); }

} // anonymous namespace


bool
spl::lexer::is_ident_start(char c) noexcept
{
  return std::isalpha(static_cast<unsigned char>(c)) or c == '_' or
         static_cast<unsigned char>(c) >= 0x80;
}


bool
spl::lexer::is_ident_continue(char c) noexcept
{ return is_ident_start(c) or std::isdigit(static_cast<unsigned char>(c)); }


bool
spl::lexer::is_punct_char(char c) noexcept
{
  static constexpr std::string_view punctuation = "~!@#$%^&*-=+|;:,.<>/?";
  return c != '\0' and punctuation.find(c) != std::string_view::npos;
}


spl::token_stream
spl::lexer::tokenize(std::istream &input, const std::string &source_name)
{
  const std::string text {std::istreambuf_iterator<char>(input),
                          std::istreambuf_iterator<char>()};
  return tokenize(text, source_name);
}


spl::token_stream
spl::lexer::tokenize(std::string_view input, const std::string &source_name)
{
  scanner sc {input, source_name};
  stl::vector<open_group> stack;
  stack.push_back({delimiter_kind::none, 0, {}});

  while (sc.skip_blanks(), not sc.eof())
  {
    const size_t start = sc.pos();
    const char c = sc.peek();
    const char c1 = sc.peek(1);
    const char c2 = sc.peek(2);

    // Groups
    if (c == '(' or c == '[' or c == '{')
    {
      const delimiter_kind delim = c == '(' ? delimiter_kind::parenthesis
                                 : c == '[' ? delimiter_kind::bracket
                                            : delimiter_kind::brace;
      stack.push_back({delim, start, {}});
      sc.advance();
      continue;
    }
    if (c == ')' or c == ']' or c == '}')
    {
      if (stack.size() == 1)
        throw parse_error {std::format("unexpected closing delimiter `{}`", c),
                           sc.location(start, start + 1)};

      open_group group = std::move(stack.back());
      stack.pop_back();
      const char expected = delimiter_chars(group.delim).second;
      if (c != expected)
        throw parse_error {
            std::format("mismatched closing delimiter `{}`, expected `{}`", c,
                        expected),
            sc.location(start, start + 1)};

      sc.advance();
      _push(stack, make_group(group.delim, std::move(group.children),
                              sc.location(group.start)));
      continue;
    }

    // Prefixed literals and raw identifiers
    if (c == 'r' and _starts_raw_string(c1, c2))
    {
      sc.skip_raw(start);
      _skip_suffix(sc);
      _push(stack, make_literal(literal_kind::raw_string, sc.text(start),
                                sc.location(start)));
      continue;
    }
    if (c == 'r' and c1 == '#' and is_ident_start(c2))
    {
      sc.advance(2);
      sc.skip_identifier();
      _push(stack, make_ident(sc.text(start), sc.location(start)));
      continue;
    }
    if ((c == 'b' or c == 'c') and (c1 == '"' or (c == 'b' and c1 == '\'')))
    {
      const literal_kind kind = c == 'c'     ? literal_kind::c_string
                              : c1 == '"'    ? literal_kind::byte_string
                                             : literal_kind::byte;
      sc.advance();
      sc.skip_quoted(c1, start, literal_kind_name(kind));
      _skip_suffix(sc);
      _push(stack, make_literal(kind, sc.text(start), sc.location(start)));
      continue;
    }
    if ((c == 'b' or c == 'c') and c1 == 'r' and _starts_raw_string(c2, sc.peek(3)))
    {
      const literal_kind kind =
          c == 'c' ? literal_kind::c_string : literal_kind::byte_string;
      sc.advance();
      sc.skip_raw(start);
      _skip_suffix(sc);
      _push(stack, make_literal(kind, sc.text(start), sc.location(start)));
      continue;
    }

    // Identifiers
    if (is_ident_start(c))
    {
      sc.skip_identifier();
      _push(stack, make_ident(sc.text(start), sc.location(start)));
      continue;
    }

    // Numbers
    if (std::isdigit(static_cast<unsigned char>(c)))
    {
      _push(stack, _read_number(sc));
      continue;
    }

    // Strings
    if (c == '"')
    {
      sc.skip_quoted('"', start, "string");
      _skip_suffix(sc);
      _push(stack, make_literal(literal_kind::string, sc.text(start),
                                sc.location(start)));
      continue;
    }

    // Characters and lifetimes
    if (c == '\'')
    {
      const size_t len = _utf8_length(c1);
      if (c1 == '\\' or (c1 != '\'' and c1 != '\0' and sc.peek(1 + len) == '\''))
      {
        sc.skip_quoted('\'', start, "character");
        _skip_suffix(sc);
        _push(stack, make_literal(literal_kind::character, sc.text(start),
                                  sc.location(start)));
        continue;
      }
      if (is_ident_start(c1))
      {
        sc.advance();
        _push(stack, make_punct('\'', punct_spacing::joint, sc.location(start)));
        continue;
      }
      throw parse_error {"unterminated character literal",
                         sc.location(start, start + 1), c1 == '\0'};
    }

    // Punctuation
    if (is_punct_char(c))
    {
      sc.advance();
      const bool comment_follows = c1 == '/' and (c2 == '/' or c2 == '*');
      const punct_spacing spacing = is_punct_char(c1) and not comment_follows
                                  ? punct_spacing::joint
                                  : punct_spacing::alone;
      _push(stack, make_punct(c, spacing, sc.location(start)));
      continue;
    }

    throw parse_error {std::format("unexpected character `{}`", c),
                       sc.location(start, start + 1)};
  }

  if (stack.size() > 1)
  {
    const open_group &unclosed = stack.back();
    throw parse_error {
        std::format("unclosed delimiter `{}`",
                    delimiter_chars(unclosed.delim).first),
        sc.location(unclosed.start, unclosed.start + 1), true};
  }

  debug("tokenized {} tokens from {}", count_tokens(stack.front().children),
        source_name);
  return std::move(stack.front().children);
}
