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


#include "splice/source_location.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <vector>


spl::source_location
spl::merge_locations(const source_location &from, const source_location &to)
{
  return {from.source, std::min(from.start, to.start),
          std::max(from.end, to.end)};
}


static std::string_view
_safe_substr(std::string_view str, size_t start, size_t len)
{
  start = std::min(start, str.size());
  return str.substr(start, len);
}

static std::string_view
_safe_substr(std::string_view str, size_t start)
{
  start = std::min(start, str.size());
  return str.substr(start);
}

std::string
spl::display_location(const source_location &location, size_t context_lines,
                      std::string_view hlstyle, std::string_view ctxstyle,
                      std::string_view endstyle)
{
  // If the source is not a file, there is nothing to quote
  if (location.source.empty() or location.source[0] == '<')
    return std::format("in {}: offset {} to {}", location.source,
                       location.start, location.end);

  std::ifstream file {location.source, std::ios_base::binary};
  if (not file.is_open())
    return std::format("Could not open file: {}", location.source);

  const std::string content {std::istreambuf_iterator<char>(file),
                             std::istreambuf_iterator<char>()};
  file.close();

  // Find line and column information
  std::vector<size_t> line_offsets;
  line_offsets.push_back(0);
  for (size_t i = 0; i < content.size(); ++i)
  {
    if (content[i] == '\n')
      line_offsets.push_back(i + 1);
  }

  // Find the line containing the start position
  const auto line_of = [&](size_t offset) -> size_t {
    const auto it =
        std::upper_bound(line_offsets.begin(), line_offsets.end(), offset);
    return std::distance(line_offsets.begin(), it) - 1;
  };
  if (location.start > content.size())
    return std::format("<invalid location in {}>", location.source);
  const size_t start_line = line_of(location.start);
  const size_t end_line = line_of(std::max(location.start, location.end));

  // Expand line range with context lines
  const size_t display_start =
      start_line > context_lines ? start_line - context_lines : 0;
  const size_t display_end =
      std::min(end_line + context_lines, line_offsets.size() - 1);

  std::ostringstream output;
  output << std::format("in {}:{}:{} to {}:{}\n", location.source,
                        start_line + 1,
                        location.start - line_offsets[start_line] + 1,
                        end_line + 1, location.end - line_offsets[end_line] + 1);

  for (size_t i = display_start; i <= display_end; ++i)
  {
    size_t line_end =
        (i + 1 < line_offsets.size()) ? line_offsets[i + 1] - 1 : content.size();
    if (line_end > line_offsets[i] and content[line_end - 1] == '\r')
      line_end--;

    const std::string_view line = _safe_substr(
        content, line_offsets[i], line_end - line_offsets[i]);

    output << std::format("{:4d} | ", i + 1) << ctxstyle;

    if (i < start_line or i > end_line)
    {
      output << line << endstyle << "\n";
      continue;
    }

    // Columns of the highlighted region within this line
    const size_t hlstart =
        i == start_line ? location.start - line_offsets[i] : 0;
    const size_t hlend =
        i == end_line ? location.end - line_offsets[i] : line.size();

    output << _safe_substr(line, 0, hlstart);
    output << endstyle << hlstyle;
    output << _safe_substr(line, hlstart, hlend - std::min(hlstart, hlend));
    output << endstyle << ctxstyle;
    output << _safe_substr(line, hlend);
    output << endstyle << "\n";
  }

  return output.str();
}
