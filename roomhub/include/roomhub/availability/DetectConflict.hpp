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

#ifndef ROOMHUB__AVAILABILITY__DETECTCONFLICT_HPP
#define ROOMHUB__AVAILABILITY__DETECTCONFLICT_HPP

#include <roomhub/availability/BookingWindow.hpp>
#include <roomhub/availability/BusyBlock.hpp>

#include <optional>

namespace roomhub {
namespace availability {

//==============================================================================
class DetectConflict
{
public:

  /// The interval that a booking request would actually occupy.
  struct Proposal
  {
    Time start;
    Time finish;

    /// True if the request asked for the entire booking window.
    bool whole_day;
  };

  struct Conflict
  {
    /// Index of the conflicting block in the merged block list.
    std::size_t index;

    /// The conflicting block.
    BusyBlock block;
  };

  /// Work out the interval that a request would occupy.
  ///
  /// If the requested duration equals the full length of the window, the
  /// booking is for the whole day and it always starts when the window opens,
  /// no matter which start time was requested.
  ///
  /// \param[in] window
  ///   The booking window of the day being booked.
  ///
  /// \param[in] requested_start
  ///   The start time that was selected.
  ///
  /// \param[in] duration_minutes
  ///   The requested length of the booking in minutes.
  ///
  /// \throws std::invalid_argument if duration_minutes is not positive.
  static Proposal propose(
    const BookingWindow& window,
    Time requested_start,
    long duration_minutes);

  /// Find the earliest busy block that overlaps the proposal.
  ///
  /// \param[in] proposal
  ///   The interval to check.
  ///
  /// \param[in] blocks
  ///   Busy blocks as produced by merge(). Because they are sorted, the first
  ///   overlapping block is also the earliest starting one.
  ///
  /// \return the earliest conflict, or a nullopt if the proposal is clear.
  static std::optional<Conflict> between(
    const Proposal& proposal,
    const BusyBlocks& blocks);

  /// Alternative signature that builds the proposal first.
  static std::optional<Conflict> between(
    const BookingWindow& window,
    Time requested_start,
    long duration_minutes,
    const BusyBlocks& blocks);
};

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__DETECTCONFLICT_HPP
