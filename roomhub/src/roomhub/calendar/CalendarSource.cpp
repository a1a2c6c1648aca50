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

#include <roomhub/calendar/CalendarSource.hpp>

namespace roomhub {
namespace calendar {

//==============================================================================
calendar_error::calendar_error(
  const std::string& calendar,
  const std::string& what)
: std::runtime_error(what),
  _calendar(calendar)
{
  // Do nothing
}

//==============================================================================
const std::string& calendar_error::calendar() const
{
  return _calendar;
}

} // namespace calendar
} // namespace roomhub
