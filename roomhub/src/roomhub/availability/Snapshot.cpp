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

#include <roomhub/availability/Snapshot.hpp>
#include <roomhub/availability/Merge.hpp>
#include <roomhub/availability/Normalize.hpp>
#include <roomhub/availability/Status.hpp>

#include <utility>

namespace roomhub {
namespace availability {

//==============================================================================
Snapshot Snapshot::compute(
  std::string room,
  const std::vector<ReservationRecord>& records,
  const BookingWindow& window,
  const Time now)
{
  Snapshot snapshot;
  snapshot.room = std::move(room);
  snapshot.busy_blocks = merge(normalize(records, window));

  const auto status = evaluate(snapshot.busy_blocks, window, now);
  snapshot.free_now = status.free_now;
  snapshot.next_available = status.next_available;
  return snapshot;
}

//==============================================================================
Snapshot Snapshot::failed(std::string room, std::string error)
{
  Snapshot snapshot;
  snapshot.room = std::move(room);
  snapshot.free_now = false;
  snapshot.error = std::move(error);
  return snapshot;
}

//==============================================================================
const Snapshot* DayAvailability::find(const std::string& room) const
{
  for (const auto& snapshot : rooms)
  {
    if (snapshot.room == room)
      return &snapshot;
  }

  return nullptr;
}

} // namespace availability
} // namespace roomhub
