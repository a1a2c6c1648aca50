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

#ifndef ROOMHUB__CALENDAR__INMEMORYCALENDAR_HPP
#define ROOMHUB__CALENDAR__INMEMORYCALENDAR_HPP

#include <roomhub/calendar/CalendarSource.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <cstddef>

namespace roomhub {
namespace calendar {

//==============================================================================
/// A CalendarSource that keeps its calendars in process memory. It is safe to
/// use from multiple threads.
class InMemoryCalendar : public CalendarSource
{
public:

  /// Create an empty set of calendars.
  InMemoryCalendar();

  /// Add a calendar with no events. Only known calendars can be used; calls
  /// that name an unknown calendar throw calendar_error.
  void add_calendar(const std::string& calendar);

  /// Add an existing reservation to a calendar. If the record has no event
  /// id, one is assigned.
  ///
  /// \return the event id of the stored record.
  std::string add_record(
    const std::string& calendar,
    availability::ReservationRecord record);

  /// The number of events stored in a calendar.
  std::size_t count(const std::string& calendar) const;

  // Documentation inherited
  std::vector<availability::ReservationRecord> list(
    const std::string& calendar,
    Time start,
    Time finish) final;

  // Documentation inherited
  std::string insert(const std::string& calendar, const Event& event) final;

  // Documentation inherited
  void remove(const std::string& calendar, const std::string& event_id) final;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace calendar
} // namespace roomhub

#endif // ROOMHUB__CALENDAR__INMEMORYCALENDAR_HPP
