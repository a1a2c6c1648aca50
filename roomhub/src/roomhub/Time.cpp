/*
 * Copyright (C) 2026 The roomhub Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#include <roomhub/Time.hpp>

#include <regex>
#include <stdexcept>

namespace roomhub {
namespace time {

//==============================================================================
ClockFunction system_clock()
{
  return []() { return Clock::now(); };
}

//==============================================================================
Duration from_minutes(const long minutes)
{
  return std::chrono::duration_cast<Duration>(std::chrono::minutes(minutes));
}

//==============================================================================
long to_minutes(const Duration duration)
{
  return static_cast<long>(
    std::chrono::duration_cast<std::chrono::minutes>(duration).count());
}

//==============================================================================
Duration parse_time_of_day(const std::string& hh_mm)
{
  static const std::regex pattern(R"(^(\d{1,2}):(\d{2})$)");
  std::smatch match;
  if (std::regex_match(hh_mm, match, pattern))
  {
    const int hours = std::stoi(match[1].str());
    const int minutes = std::stoi(match[2].str());

    // 24:00 is accepted so that a window may close at midnight
    if ((hours < 24 && minutes < 60) || (hours == 24 && minutes == 0))
      return std::chrono::hours(hours) + std::chrono::minutes(minutes);
  }

  throw std::invalid_argument(
    "[roomhub::time::parse_time_of_day] Invalid time of day [" + hh_mm
    + "], expected HH:MM");
}

} // namespace time
} // namespace roomhub
