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

#ifndef ROOMHUB__AVAILABILITY__SLOTGRID_HPP
#define ROOMHUB__AVAILABILITY__SLOTGRID_HPP

#include <roomhub/TimeZone.hpp>
#include <roomhub/availability/BookingWindow.hpp>
#include <roomhub/availability/BusyBlock.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <optional>
#include <string>
#include <vector>

namespace roomhub {
namespace availability {

//==============================================================================
/// Divides a booking window into fixed width slots and maps busy blocks onto
/// them for presentation and click targeting.
///
/// Slot i spans [window.start + i*width, window.start + (i+1)*width). When the
/// window length is not a whole number of slots, the remainder at the end of
/// the window does not belong to any slot.
class SlotGrid
{
public:

  /// The placement of one busy block on the grid.
  struct Span
  {
    /// Index of the block in the merged block list.
    std::size_t block;

    /// The slot in which the block's effective start falls.
    std::size_t first_slot;

    /// The number of slots the block covers, at least one.
    std::size_t slot_count;

    bool operator==(const Span& other) const
    {
      return block == other.block
        && first_slot == other.first_slot
        && slot_count == other.slot_count;
    }
  };

  /// The width of a presentation slot.
  static Duration default_slot_width();

  /// Constructor
  ///
  /// \param[in] window
  ///   The booking window to divide.
  ///
  /// \param[in] slot_width
  ///   The width of each slot. Must be positive.
  ///
  /// \throws std::invalid_argument if slot_width is not positive.
  SlotGrid(
    BookingWindow window,
    Duration slot_width = default_slot_width());

  /// The window being divided.
  const BookingWindow& window() const;

  /// The width of each slot.
  Duration slot_width() const;

  /// The number of slots in the grid.
  std::size_t size() const;

  /// The instant at which slot i begins.
  ///
  /// \throws std::out_of_range if i >= size()
  Time slot_start(std::size_t i) const;

  /// The instant at which slot i ends.
  ///
  /// \throws std::out_of_range if i >= size()
  Time slot_finish(std::size_t i) const;

  /// The slot that contains t, if any.
  std::optional<std::size_t> slot_of(Time t) const;

  /// Returns true if the block overlaps slot i.
  bool overlaps(const BusyBlock& block, std::size_t i) const;

  /// Get the index of the first block that overlaps slot i, if any.
  std::optional<std::size_t> block_at(
    std::size_t i,
    const BusyBlocks& blocks) const;

  /// For every slot, the index of the first block that overlaps it.
  std::vector<std::optional<std::size_t>> occupancy(
    const BusyBlocks& blocks) const;

  /// Place each block that overlaps the grid exactly once. Blocks are
  /// identified by their index in the list, never by their timestamps.
  std::vector<Span> spans(const BusyBlocks& blocks) const;

  /// Returns true if a new booking may begin at slot i. The slot must be free
  /// and must not be the last slot of the day.
  bool bookable(std::size_t i, const BusyBlocks& blocks) const;

  /// The hour label of slot i on a 12 hour clock, e.g. "9.00" or "1.00".
  /// Slots that do not start on the hour have an empty label.
  std::string label(std::size_t i, const TimeZone& zone) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__SLOTGRID_HPP
