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


#include "splice/utilities/execution_timer.hpp"
#include "splice/logging.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <map>


namespace {

struct phase_stats {
  std::chrono::nanoseconds total {0};
  std::chrono::nanoseconds max {0};
  size_t runs {0};
};

std::map<std::string, phase_stats, std::less<>> g_phases;

} // anonymous namespace


spl::execution_timer::execution_timer(std::string_view name, bool auto_start)
: m_name {name}
{
  if (auto_start)
    start();
}


spl::execution_timer::~execution_timer()
{
  if (m_running)
    stop();
}


void
spl::execution_timer::start()
{
  if (not m_running)
  {
    m_start_time = clock::now();
    m_running = true;
  }
}


void
spl::execution_timer::stop()
{
  if (not m_running)
    return;

  const auto duration =
      std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() -
                                                           m_start_time);
  m_elapsed += duration;
  m_running = false;

  phase_stats &stats = g_phases[m_name];
  stats.total += duration;
  stats.max = std::max(stats.max, duration);
  stats.runs += 1;
}


std::string
spl::format_duration(std::chrono::nanoseconds duration)
{
  const double ms = std::chrono::duration<double, std::milli>(duration).count();
  if (ms < 1.0)
    return std::format("{:.3f} μs", ms * 1000.0);
  else if (ms < 1000.0)
    return std::format("{:.3f} ms", ms);
  else
    return std::format("{:.3f} s", ms / 1000.0);
}


void
spl::execution_timer::report_global_stats()
{
  std::multimap<std::chrono::nanoseconds, std::string, std::greater<>> entries;
  for (const auto &[name, stats] : g_phases)
  {
    entries.emplace(stats.total,
                    std::format("\e[1m{:20}\e[0m - total: {}, max: {}, runs: {}",
                                name, format_duration(stats.total),
                                format_duration(stats.max), stats.runs));
  }

  for (const auto &[_, text] : entries)
    info("{}", text);
}
