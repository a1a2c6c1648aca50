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

#include <roomhub/availability/DetectConflict.hpp>

#include <stdexcept>
#include <string>

namespace roomhub {
namespace availability {

//==============================================================================
auto DetectConflict::propose(
  const BookingWindow& window,
  const Time requested_start,
  const long duration_minutes) -> Proposal
{
  if (duration_minutes <= 0)
  {
    // *INDENT-OFF*
    throw std::invalid_argument(
      "[DetectConflict::propose] Booking duration must be positive, but ["
      + std::to_string(duration_minutes) + "] minutes was requested");
    // *INDENT-ON*
  }

  const Duration duration = time::from_minutes(duration_minutes);
  const bool whole_day = duration == window.length();

  // A whole day booking always begins at the opening of the window.
  const Time start = whole_day ? window.start() : requested_start;
  return Proposal{start, start + duration, whole_day};
}

//==============================================================================
auto DetectConflict::between(
  const Proposal& proposal,
  const BusyBlocks& blocks) -> std::optional<Conflict>
{
  for (std::size_t i = 0; i < blocks.size(); ++i)
  {
    const auto& block = blocks[i];
    if (proposal.finish <= block.start)
    {
      // Every remaining block starts even later
      break;
    }

    if (block.start < proposal.finish && block.finish > proposal.start)
      return Conflict{i, block};
  }

  return std::nullopt;
}

//==============================================================================
auto DetectConflict::between(
  const BookingWindow& window,
  const Time requested_start,
  const long duration_minutes,
  const BusyBlocks& blocks) -> std::optional<Conflict>
{
  return between(propose(window, requested_start, duration_minutes), blocks);
}

} // namespace availability
} // namespace roomhub
