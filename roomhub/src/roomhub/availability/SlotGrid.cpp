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

#include <roomhub/availability/SlotGrid.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace roomhub {
namespace availability {

//==============================================================================
class SlotGrid::Implementation
{
public:

  BookingWindow window;
  Duration width;
  std::size_t size;

  Implementation(BookingWindow window_, Duration width_)
  : window(std::move(window_)),
    width(width_),
    size(0)
  {
    if (width <= Duration::zero())
    {
      // *INDENT-OFF*
      throw std::invalid_argument(
        "[SlotGrid::SlotGrid] The slot width must be positive");
      // *INDENT-ON*
    }

    size = static_cast<std::size_t>(window.length() / width);
  }

  void check(const std::size_t i, const char* caller) const
  {
    if (i < size)
      return;

    throw std::out_of_range(
      std::string("[SlotGrid::") + caller + "] Slot index ["
      + std::to_string(i) + "] is outside of a grid with ["
      + std::to_string(size) + "] slots");
  }

  Time start(const std::size_t i) const
  {
    return window.start() + static_cast<Duration::rep>(i) * width;
  }
};

//==============================================================================
Duration SlotGrid::default_slot_width()
{
  return std::chrono::minutes(30);
}

//==============================================================================
SlotGrid::SlotGrid(BookingWindow window, const Duration slot_width)
: _pimpl(rmf_utils::make_impl<Implementation>(std::move(window), slot_width))
{
  // Do nothing
}

//==============================================================================
const BookingWindow& SlotGrid::window() const
{
  return _pimpl->window;
}

//==============================================================================
Duration SlotGrid::slot_width() const
{
  return _pimpl->width;
}

//==============================================================================
std::size_t SlotGrid::size() const
{
  return _pimpl->size;
}

//==============================================================================
Time SlotGrid::slot_start(const std::size_t i) const
{
  _pimpl->check(i, "slot_start");
  return _pimpl->start(i);
}

//==============================================================================
Time SlotGrid::slot_finish(const std::size_t i) const
{
  _pimpl->check(i, "slot_finish");
  return _pimpl->start(i + 1);
}

//==============================================================================
std::optional<std::size_t> SlotGrid::slot_of(const Time t) const
{
  if (t < _pimpl->window.start())
    return std::nullopt;

  const auto i = static_cast<std::size_t>(
    (t - _pimpl->window.start()) / _pimpl->width);
  if (i >= _pimpl->size)
    return std::nullopt;

  return i;
}

//==============================================================================
bool SlotGrid::overlaps(const BusyBlock& block, const std::size_t i) const
{
  return block.start < slot_finish(i) && block.finish > slot_start(i);
}

//==============================================================================
std::optional<std::size_t> SlotGrid::block_at(
  const std::size_t i,
  const BusyBlocks& blocks) const
{
  for (std::size_t b = 0; b < blocks.size(); ++b)
  {
    if (overlaps(blocks[b], i))
      return b;
  }

  return std::nullopt;
}

//==============================================================================
std::vector<std::optional<std::size_t>> SlotGrid::occupancy(
  const BusyBlocks& blocks) const
{
  std::vector<std::optional<std::size_t>> cells;
  cells.reserve(_pimpl->size);
  for (std::size_t i = 0; i < _pimpl->size; ++i)
    cells.push_back(block_at(i, blocks));

  return cells;
}

//==============================================================================
std::vector<SlotGrid::Span> SlotGrid::spans(const BusyBlocks& blocks) const
{
  std::vector<Span> output;
  std::vector<bool> placed(blocks.size(), false);

  const Time window_start = _pimpl->window.start();
  const Duration width = _pimpl->width;

  for (std::size_t i = 0; i < _pimpl->size; ++i)
  {
    const auto b = block_at(i, blocks);
    if (!b.has_value() || placed[*b])
      continue;

    placed[*b] = true;
    const BusyBlock& block = blocks[*b];
    const Time effective_start = std::max(block.start, window_start);
    const std::size_t first =
      slot_of(effective_start).value_or(i);

    // Round the covered duration up to whole slots
    const Duration covered = block.finish - effective_start;
    std::size_t count = static_cast<std::size_t>(
      (covered + width - Duration(1)) / width);

    count = std::max<std::size_t>(count, 1);
    count = std::min(count, _pimpl->size - first);

    output.push_back(Span{*b, first, count});
  }

  return output;
}

//==============================================================================
bool SlotGrid::bookable(const std::size_t i, const BusyBlocks& blocks) const
{
  _pimpl->check(i, "bookable");
  if (i + 1 == _pimpl->size)
    return false;

  return !block_at(i, blocks).has_value();
}

//==============================================================================
std::string SlotGrid::label(const std::size_t i, const TimeZone& zone) const
{
  const auto tod = zone.time_of_day(slot_start(i));
  const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(tod);
  if (minutes.count() % 60 != 0)
    return std::string();

  auto hour = minutes.count() / 60;
  if (hour > 12)
    hour -= 12;

  return std::to_string(hour) + ".00";
}

} // namespace availability
} // namespace roomhub
