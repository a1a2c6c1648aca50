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

#include <roomhub/availability/Status.hpp>

#include <algorithm>
#include <iterator>

namespace roomhub {
namespace availability {

//==============================================================================
Status evaluate(
  const BusyBlocks& blocks,
  const BookingWindow& window,
  const Time now)
{
  if (!window.contains(now))
    return Status{false, std::nullopt};

  // The only block that can contain now is the last one that starts at or
  // before now.
  const auto after = std::upper_bound(blocks.begin(), blocks.end(), now,
      [](const Time t, const BusyBlock& block)
      {
        return t < block.start;
      });

  if (after == blocks.begin())
    return Status{true, std::nullopt};

  const auto& candidate = *std::prev(after);
  if (now < candidate.finish)
    return Status{false, candidate.finish};

  return Status{true, std::nullopt};
}

} // namespace availability
} // namespace roomhub
