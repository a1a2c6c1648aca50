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

#include <roomhub/availability/Normalize.hpp>

#include <algorithm>

namespace roomhub {
namespace availability {

//==============================================================================
BusyBlocks normalize(
  const std::vector<ReservationRecord>& records,
  const BookingWindow& window)
{
  BusyBlocks clipped;
  clipped.reserve(records.size());

  for (const auto& record : records)
  {
    const Time start = std::max(record.start, window.start());
    const Time finish = std::min(record.finish, window.finish());

    // Records outside of the window, or with no length, are dropped
    if (!(start < finish))
      continue;

    clipped.push_back(BusyBlock{start, finish, record.label, 1});
  }

  return clipped;
}

} // namespace availability
} // namespace roomhub
