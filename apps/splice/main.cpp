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

#include "splice/driver.hpp"
#include "splice/expander.hpp"
#include "splice/lexer.hpp"
#include "splice/logging.hpp"
#include "splice/source_reader.hpp"
#include "splice/utilities/execution_timer.hpp"

#include <boost/program_options.hpp>

#include <gc.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace std {
namespace fs = std::filesystem;
}


static int
process_file(const std::fs::path &inputpath, const std::string &opath,
             const spl::expander_table &table,
             const spl::output_options &opts)
{
  using namespace spl;

  std::ifstream inputfile {inputpath, std::ios::binary};
  if (not inputfile.is_open())
  {
    error("could not open input file '{}'", inputpath.c_str());
    return EXIT_FAILURE;
  }

  std::ostringstream buffer;
  if (not process_source(inputfile, inputpath.string(), table, opts, buffer))
    return EXIT_FAILURE;

  if (opath.empty())
  {
    std::cout << buffer.str();
    return EXIT_SUCCESS;
  }

  std::ofstream outfile {opath, std::ios::binary};
  if (not outfile.is_open())
  {
    error("could not open output file '{}'", opath);
    return EXIT_FAILURE;
  }
  outfile << buffer.str();
  return EXIT_SUCCESS;
}


static void
read_eval_print_loop(const spl::expander_table &table,
                     const spl::output_options &opts)
{
  using namespace spl;

  init_readline(table.names());

  lexer lex;
  source_reader reader {lex};
  for (std::string line; prompt_line(reader.pending() ? ". " : "> ", line);
       line.clear())
  {
    try
    {
      reader << line;

      token_stream ts;
      while (reader >> ts)
      {
        if (not expand_and_write(ts, table, opts, std::cout))
          warning("input dropped");
      }
    }
    catch (const bad_code &exn)
    {
      std::cout << exn.display() << std::endl;
    }
  }

  cleanup_readline();
}


int
main(int argc, char **argv)
{
  namespace po = boost::program_options;
  using namespace spl;

  GC_INIT();

  std::string verbosity;
  std::vector<std::string> flags;
  std::vector<std::string> macros;
  std::string opath;
  output_options opts;

  po::options_description desc {"Allowed options"};
  desc.add_options()
    ("help,h", "produce help message")
    ("input-file", po::value<std::fs::path>(), "input file to process")
    ("output,o", po::value<std::string>(&opath), "write expanded source to the specified file")
    ("verbosity,v", po::value<std::string>(&verbosity)->implicit_value("debug"), "verbosity (silent, error, warning, info, debug)")
    ("flag,f", po::value<std::vector<std::string>>(&flags), "flags")
    ("macro,m", po::value<std::vector<std::string>>(&macros), "expand only the named macro (repeatable)")
    ("dump-tokens", po::bool_switch(&opts.dump_tokens), "print the token tree instead of source text")
    ("keep-going", po::bool_switch(&opts.keep_going), "report every failing invocation")
    ("stats", "report time spent in each phase");

  po::positional_options_description posdesc;
  posdesc.add("input-file", 1);

  po::variables_map varmap;
  try
  {
    auto parsedopts = po::command_line_parser(argc, argv)
                          .options(desc)
                          .positional(posdesc)
                          .run();
    po::store(parsedopts, varmap);
    po::notify(varmap);
  }
  catch (const po::error &e)
  {
    error("{}", e.what());
    std::cerr << desc << std::endl;
    return EXIT_FAILURE;
  }

  if (varmap.contains("help"))
  {
    std::cout << "Usage: " << argv[0] << " [options] [input-file]" << std::endl;
    std::cout << desc << std::endl;
    return EXIT_SUCCESS;
  }

  // Set global log-level: environment first, command line on top of it
  if (const char *envlevel = std::getenv("SPLICE_LOGLEVEL"))
  {
    try { loglevel = parse_loglevel(envlevel); }
    catch (const std::runtime_error &exn)
    { warning("ignoring SPLICE_LOGLEVEL: {}", exn.what()); }
  }
  try
  {
    if (not verbosity.empty())
      loglevel = parse_loglevel(verbosity);
  }
  catch (const std::runtime_error &exn)
  {
    error("{}", exn.what());
    return EXIT_FAILURE;
  }

  for (const std::string &flag : flags)
    global_flags.emplace(flag);

  // Select expanders
  builtin_expanders builtins;
  expander_table selected;
  const expander_table *table = &builtins;
  if (not macros.empty())
  {
    try
    {
      select_expanders(builtins, macros, selected);
    }
    catch (const expansion_error &exn)
    {
      error("{}", exn.what());
      return EXIT_FAILURE;
    }
    table = &selected;
  }
  for (const std::string &name : table->names())
    debug("expanding {}!", name);

  int status = EXIT_SUCCESS;
  if (varmap.contains("input-file"))
  {
    const std::fs::path inputpath = varmap["input-file"].as<std::fs::path>();
    try
    {
      status = process_file(inputpath, opath, *table, opts);
    }
    catch (const bad_code &exn)
    {
      error("{}", exn.display());
      status = EXIT_FAILURE;
    }
  }
  else
    read_eval_print_loop(*table, opts);

  if (varmap.contains("stats"))
    execution_timer::report_global_stats();

  return status;
}
