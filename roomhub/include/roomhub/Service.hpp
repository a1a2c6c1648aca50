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

#ifndef ROOMHUB__SERVICE_HPP
#define ROOMHUB__SERVICE_HPP

#include <roomhub/Configuration.hpp>
#include <roomhub/Time.hpp>
#include <roomhub/availability/BookingWindow.hpp>
#include <roomhub/availability/Cache.hpp>
#include <roomhub/availability/DetectConflict.hpp>
#include <roomhub/availability/Snapshot.hpp>
#include <roomhub/calendar/CalendarSource.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace roomhub {

//==============================================================================
/// Thrown when a request is missing required fields or names something that
/// does not exist. Nothing has been sent to the calendars when this is thrown.
class invalid_request : public std::invalid_argument
{
public:

  explicit invalid_request(const std::string& what);
};

//==============================================================================
/// Serves availability reads and reservation changes for the configured rooms.
///
/// Reads are answered from the cache while it holds a fresh value for the
/// date. Otherwise the calendars of all rooms are loaded concurrently and the
/// result is cached. A room whose calendar fails to load is reported with an
/// error, without affecting the other rooms.
///
/// Reservation changes are written to the calendar first. Only once the
/// calendar reports success is the cached availability of the affected date
/// invalidated.
class Service
{
public:

  /// A request to reserve a room.
  struct BookingRequest
  {
    /// Name of the configured room.
    std::string room;

    /// The start time that was selected.
    std::optional<Time> start;

    /// Requested length of the booking in minutes. A length equal to the whole
    /// booking window books the entire day from the opening time.
    long duration_minutes = 0;

    /// Who the room is booked for. Stored as the event summary "[label]".
    std::string label;
  };

  /// The result of a booking request that reached the conflict check.
  struct BookingOutcome
  {
    /// True if the reservation was written to the calendar.
    bool accepted = false;

    /// The identity of the new event, when accepted.
    std::string event_id;

    /// The interval that was (or would have been) reserved.
    Time start;
    Time finish;

    /// The calendar date of the reservation.
    std::string date;

    /// The earliest existing block that overlaps the request, when rejected.
    std::optional<availability::DetectConflict::Conflict> conflict;

    /// A human readable description of the outcome.
    std::string message;
  };

  /// A request to cancel a reservation.
  struct RemovalRequest
  {
    /// Name of the configured room.
    std::string room;

    /// Identity of the event in the room's calendar.
    std::string event_id;

    /// The start of the reservation, if known. It determines which date's
    /// cached availability is invalidated. Without it the whole cache is
    /// cleared.
    std::optional<Time> start;
  };

  /// Constructor
  ///
  /// \param[in] config
  ///   The deployment settings. They are validated on every request, so an
  ///   invalid configuration fails requests rather than construction.
  ///
  /// \param[in] source
  ///   The calendars that hold the room reservations.
  ///
  /// \param[in] cache
  ///   The availability cache. If nullptr, a cache is created using the
  ///   configured time-to-live and the given clock.
  ///
  /// \param[in] clock
  ///   The source of the current time.
  Service(
    Configuration config,
    std::shared_ptr<calendar::CalendarSource> source,
    std::shared_ptr<availability::Cache> cache = nullptr,
    ClockFunction clock = time::system_clock());

  /// Get the availability of every room on a date.
  ///
  /// \param[in] date
  ///   A "YYYY-MM-DD" date in the operating time zone. Today if omitted.
  ///
  /// \throws invalid_request if the date is malformed.
  /// \throws configuration_error if the configuration cannot serve requests.
  availability::ConstDayAvailabilityPtr availability(
    const std::optional<std::string>& date = std::nullopt);

  /// Reserve a room. Bookings of the same room are checked and written one
  /// at a time, so two overlapping requests can never both be accepted.
  ///
  /// \throws invalid_request if a required field is missing, the room is
  /// unknown, or the reservation does not fit inside the booking window.
  /// \throws configuration_error if the configuration cannot serve requests.
  /// \throws calendar::calendar_error if the calendar could not be read or
  /// did not accept the reservation. The cache is left untouched.
  BookingOutcome book(const BookingRequest& request);

  /// Cancel a reservation.
  ///
  /// \throws invalid_request if a required field is missing or the room is
  /// unknown.
  /// \throws configuration_error if the configuration cannot serve requests.
  /// \throws calendar::calendar_error if the calendar did not delete the
  /// event. The cache is left untouched.
  void remove(const RemovalRequest& request);

  /// The booking window of a date in the operating time zone.
  ///
  /// \throws invalid_request if the date is malformed.
  availability::BookingWindow window(const std::string& date) const;

  /// The deployment settings.
  const Configuration& configuration() const;

  /// The availability cache used by this service.
  const std::shared_ptr<availability::Cache>& cache() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace roomhub

#endif // ROOMHUB__SERVICE_HPP
