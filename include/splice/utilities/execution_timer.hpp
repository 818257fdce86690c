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

#include <chrono>
#include <string>
#include <string_view>

/**
 * \file execution_timer.hpp
 * Timing of processing phases
 *
 * \ingroup utils
 */


namespace spl {

/**
 * Scoped timer accumulating the duration of a named phase
 *
 * All timers sharing a name contribute to the same process-wide record, which
 * report_global_stats() prints.
 *
 * \ingroup utils
 */
class execution_timer {
  public:
  using clock = std::chrono::steady_clock;

  /**
   * \param name Name of the phase being timed
   * \param auto_start Whether to start timing immediately
   */
  explicit execution_timer(std::string_view name, bool auto_start = true);

  ~execution_timer();

  execution_timer(const execution_timer&) = delete;
  execution_timer& operator = (const execution_timer&) = delete;

  void
  start();

  /**
   * Stop the timer and add the elapsed time to the global record
   */
  void
  stop();

  std::chrono::nanoseconds
  elapsed() const noexcept
  { return m_elapsed; }

  /**
   * Log total, maximal duration and number of runs of every phase, slowest
   * phase first
   */
  static void
  report_global_stats();

  private:
  std::string m_name;
  bool m_running {false};
  clock::time_point m_start_time;
  std::chrono::nanoseconds m_elapsed {0};
}; // class spl::execution_timer

/**
 * Human readable rendering of a duration: `μs`, `ms` or `s`
 */
std::string
format_duration(std::chrono::nanoseconds duration);

} // namespace spl
