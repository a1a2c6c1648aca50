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

#include <roomhub/calendar/InMemoryCalendar.hpp>

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace roomhub {
namespace calendar {

//==============================================================================
class InMemoryCalendar::Implementation
{
public:

  using Events = std::map<std::string, availability::ReservationRecord>;

  mutable std::shared_mutex mutex;
  std::unordered_map<std::string, Events> calendars;
  std::atomic_uint64_t next_event{0};

  std::string make_event_id()
  {
    return "evt-" + std::to_string(next_event++);
  }

  Events& events(const std::string& calendar, const char* caller)
  {
    const auto it = calendars.find(calendar);
    if (it == calendars.end())
      throw unknown(calendar, caller);

    return it->second;
  }

  const Events& events(const std::string& calendar, const char* caller) const
  {
    const auto it = calendars.find(calendar);
    if (it == calendars.end())
      throw unknown(calendar, caller);

    return it->second;
  }

  static calendar_error unknown(const std::string& calendar, const char* caller)
  {
    return calendar_error(
      calendar,
      std::string("[InMemoryCalendar::") + caller + "] Unknown calendar ["
      + calendar + "]");
  }
};

//==============================================================================
InMemoryCalendar::InMemoryCalendar()
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
void InMemoryCalendar::add_calendar(const std::string& calendar)
{
  std::unique_lock<std::shared_mutex> lock(_pimpl->mutex);
  _pimpl->calendars.insert({calendar, {}});
}

//==============================================================================
std::string InMemoryCalendar::add_record(
  const std::string& calendar,
  availability::ReservationRecord record)
{
  std::unique_lock<std::shared_mutex> lock(_pimpl->mutex);
  auto& events = _pimpl->events(calendar, "add_record");
  if (record.event_id.empty())
    record.event_id = _pimpl->make_event_id();

  const std::string id = record.event_id;
  events[id] = std::move(record);
  return id;
}

//==============================================================================
std::size_t InMemoryCalendar::count(const std::string& calendar) const
{
  std::shared_lock<std::shared_mutex> lock(_pimpl->mutex);
  return _pimpl->events(calendar, "count").size();
}

//==============================================================================
std::vector<availability::ReservationRecord> InMemoryCalendar::list(
  const std::string& calendar,
  const Time start,
  const Time finish)
{
  std::shared_lock<std::shared_mutex> lock(_pimpl->mutex);
  const auto& events = _pimpl->events(calendar, "list");

  std::vector<availability::ReservationRecord> output;
  for (const auto& [_, record] : events)
  {
    if (record.finish <= start || finish <= record.start)
      continue;

    output.push_back(record);
  }

  std::stable_sort(output.begin(), output.end(),
    [](const auto& a, const auto& b) { return a.start < b.start; });

  return output;
}

//==============================================================================
std::string InMemoryCalendar::insert(
  const std::string& calendar,
  const Event& event)
{
  if (!(event.start < event.finish))
  {
    // *INDENT-OFF*
    throw calendar_error(
      calendar,
      "[InMemoryCalendar::insert] An event must start before it finishes");
    // *INDENT-ON*
  }

  std::unique_lock<std::shared_mutex> lock(_pimpl->mutex);
  auto& events = _pimpl->events(calendar, "insert");

  const std::string id = _pimpl->make_event_id();
  events[id] = availability::ReservationRecord{
    event.start, event.finish, event.summary, id};

  return id;
}

//==============================================================================
void InMemoryCalendar::remove(
  const std::string& calendar,
  const std::string& event_id)
{
  std::unique_lock<std::shared_mutex> lock(_pimpl->mutex);
  auto& events = _pimpl->events(calendar, "remove");
  if (events.erase(event_id) == 0)
  {
    // *INDENT-OFF*
    throw calendar_error(
      calendar,
      "[InMemoryCalendar::remove] Event [" + event_id + "] does not exist");
    // *INDENT-ON*
  }
}

} // namespace calendar
} // namespace roomhub
