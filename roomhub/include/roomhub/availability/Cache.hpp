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

#ifndef ROOMHUB__AVAILABILITY__CACHE_HPP
#define ROOMHUB__AVAILABILITY__CACHE_HPP

#include <roomhub/Time.hpp>
#include <roomhub/availability/Snapshot.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <cstdint>
#include <string>

namespace roomhub {
namespace availability {

//==============================================================================
/// A memory resident store of computed availability, keyed by calendar date.
/// Entries expire once they are older than the time-to-live, and they can be
/// dropped early with invalidate() when a reservation changes.
///
/// All member functions may be called concurrently. Values are shared
/// immutable objects, so a reader always sees either a complete old value or a
/// complete new value.
///
/// Writers that compute a value from remote data can guard against storing a
/// stale result by taking a ticket before they start loading and passing it to
/// set(). If the date was invalidated after the ticket was issued, the write
/// is discarded.
class Cache
{
public:

  /// Monotonic stamp used to order cache writes against invalidations.
  using Version = uint64_t;

  /// The time-to-live used by a default constructed cache: 60 seconds.
  static Duration default_ttl();

  /// Constructor
  ///
  /// \param[in] ttl
  ///   How long an entry stays valid after it was stored.
  ///
  /// \param[in] clock
  ///   The source of the current time, used for both storing and expiring.
  Cache(
    Duration ttl = default_ttl(),
    ClockFunction clock = time::system_clock());

  /// Get the value stored for a date if it has not expired. A nullptr is
  /// returned on a miss.
  ConstDayAvailabilityPtr get(const std::string& date) const;

  /// Store a value for a date, replacing any previous value.
  void set(const std::string& date, ConstDayAvailabilityPtr value);

  /// Get a ticket to pass to the guarded overload of set(). Take the ticket
  /// before loading the data that the value will be computed from.
  Version ticket() const;

  /// Store a value for a date unless the date has been invalidated, or a
  /// value computed from newer data has been stored, since the ticket was
  /// issued.
  ///
  /// \return true if the value was stored.
  bool set(
    const std::string& date,
    ConstDayAvailabilityPtr value,
    Version ticket);

  /// Remove the entry for a date immediately, regardless of its age.
  void invalidate(const std::string& date);

  /// Remove every entry.
  void invalidate_all();

  /// The number of entries currently held, including expired entries that
  /// have not been swept yet.
  std::size_t size() const;

  /// The number of per-date invalidations still being tracked. An
  /// invalidation is tracked for one time-to-live, after which tickets
  /// issued before it are rejected for every date.
  std::size_t invalidations() const;

  /// The time-to-live of this cache.
  Duration ttl() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__CACHE_HPP
