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


#include "repl.hpp"

#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// Readline headers
#include <readline/readline.h>
#include <readline/history.h>


static constexpr const char *history_file = ".splice_history";

// Names of registered macros for autocompletion
static std::vector<std::string> completion_names;


bool
prompt_line(const std::string &prompt, std::string &line)
{
  char *input = readline(prompt.c_str());

  // EOF
  if (not input)
    return false;

  line = input;
  if (not line.empty())
    add_history(input);

  free(input);
  return true;
}


static char *
_macro_generator(const char *text, int state)
{
  static size_t index;

  if (state == 0)
    index = 0;

  const size_t textlen = strlen(text);
  while (index < completion_names.size())
  {
    const std::string &name = completion_names[index++];
    if (name.compare(0, textlen, text) == 0)
      return strdup(name.c_str());
  }

  return nullptr;
}


static char **
_splice_completion(const char *text, [[maybe_unused]] int start,
                   [[maybe_unused]] int end)
{
  // No filename completion
  rl_attempted_completion_over = 1;
  return rl_completion_matches(text, _macro_generator);
}


void
init_readline(const std::vector<std::string> &macro_names)
{
  completion_names = macro_names;

  rl_readline_name = "splice";
  rl_attempted_completion_function = _splice_completion;
  rl_bind_key('\t', rl_complete);

  read_history(history_file);
}


void
cleanup_readline()
{
  write_history(history_file);
  history_truncate_file(history_file, 500);
}
