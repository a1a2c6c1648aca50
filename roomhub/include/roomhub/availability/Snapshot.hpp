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

#ifndef ROOMHUB__AVAILABILITY__SNAPSHOT_HPP
#define ROOMHUB__AVAILABILITY__SNAPSHOT_HPP

#include <roomhub/availability/BookingWindow.hpp>
#include <roomhub/availability/BusyBlock.hpp>
#include <roomhub/availability/ReservationRecord.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace roomhub {
namespace availability {

//==============================================================================
/// The computed availability of one room for one date.
struct Snapshot
{
  std::string room;
  BusyBlocks busy_blocks;
  bool free_now = false;
  std::optional<Time> next_available;

  /// Set when the room's reservations could not be loaded. The rest of the
  /// snapshot is then empty and the room is reported as not free.
  std::optional<std::string> error;

  /// Run the availability pipeline over the raw records of one room:
  /// normalize, merge, then evaluate the status at the given instant.
  static Snapshot compute(
    std::string room,
    const std::vector<ReservationRecord>& records,
    const BookingWindow& window,
    Time now);

  /// A snapshot for a room whose reservations could not be loaded.
  static Snapshot failed(std::string room, std::string error);
};

//==============================================================================
/// The availability of every configured room for one date.
struct DayAvailability
{
  std::string date;
  std::vector<Snapshot> rooms;

  /// Find the snapshot of a room, or nullptr if the room is not present.
  const Snapshot* find(const std::string& room) const;
};

using ConstDayAvailabilityPtr = std::shared_ptr<const DayAvailability>;

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__SNAPSHOT_HPP
