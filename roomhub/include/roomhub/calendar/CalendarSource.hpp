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

#ifndef ROOMHUB__CALENDAR__CALENDARSOURCE_HPP
#define ROOMHUB__CALENDAR__CALENDARSOURCE_HPP

#include <roomhub/Time.hpp>
#include <roomhub/availability/ReservationRecord.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace roomhub {
namespace calendar {

//==============================================================================
/// Thrown by a CalendarSource when the calendar could not complete a request.
class calendar_error : public std::runtime_error
{
public:

  calendar_error(const std::string& calendar, const std::string& what);

  /// The calendar that reported the failure.
  const std::string& calendar() const;

private:
  std::string _calendar;
};

//==============================================================================
/// A new event to be written to a calendar.
struct Event
{
  Time start;
  Time finish;
  std::string summary;

  /// The time zone that the calendar should display the event in.
  std::string time_zone;
};

//==============================================================================
/// A pure abstract interface to the calendars that hold the reservations of
/// each room. Implementations must allow concurrent calls.
class CalendarSource
{
public:

  /// List the events of a calendar that overlap [start, finish), ordered by
  /// start time. Recurring events are expected to be expanded into their
  /// single occurrences.
  ///
  /// \throws calendar_error if the calendar could not be read.
  virtual std::vector<availability::ReservationRecord> list(
    const std::string& calendar,
    Time start,
    Time finish) = 0;

  /// Add an event to a calendar.
  ///
  /// \return the identity of the new event.
  ///
  /// \throws calendar_error if the event was not created.
  virtual std::string insert(const std::string& calendar, const Event& event)
  = 0;

  /// Delete an event from a calendar.
  ///
  /// \throws calendar_error if the event was not deleted.
  virtual void remove(const std::string& calendar, const std::string& event_id)
  = 0;

  // Virtual destructor
  virtual ~CalendarSource() = default;
};

} // namespace calendar
} // namespace roomhub

#endif // ROOMHUB__CALENDAR__CALENDARSOURCE_HPP
