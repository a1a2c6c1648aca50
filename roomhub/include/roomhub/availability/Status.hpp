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

#ifndef ROOMHUB__AVAILABILITY__STATUS_HPP
#define ROOMHUB__AVAILABILITY__STATUS_HPP

#include <roomhub/availability/BookingWindow.hpp>
#include <roomhub/availability/BusyBlock.hpp>

#include <optional>

namespace roomhub {
namespace availability {

//==============================================================================
/// Whether a room is free at a given instant.
struct Status
{
  /// True if the room can be used right now.
  bool free_now = false;

  /// When the room is occupied right now, the instant at which the current
  /// block ends. Absent otherwise.
  std::optional<Time> next_available;
};

//==============================================================================
/// Derive the status of a room from its merged busy blocks.
///
/// The status is only meaningful while now is inside the booking window. For
/// any other instant (a different day, or outside of operating hours) the room
/// is reported as not free with no next available time.
///
/// \param[in] blocks
///   Busy blocks as produced by merge(): sorted and pairwise disjoint.
///
/// \param[in] window
///   The booking window that the blocks belong to.
///
/// \param[in] now
///   The instant to evaluate.
Status evaluate(
  const BusyBlocks& blocks,
  const BookingWindow& window,
  Time now);

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__STATUS_HPP
