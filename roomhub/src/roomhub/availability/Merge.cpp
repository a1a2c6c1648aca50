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

#include <roomhub/availability/Merge.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace roomhub {
namespace availability {

//==============================================================================
BusyBlocks merge(BusyBlocks intervals)
{
  if (intervals.empty())
    return intervals;

  std::stable_sort(intervals.begin(), intervals.end(),
    [](const BusyBlock& a, const BusyBlock& b)
    {
      return a.start < b.start;
    });

  BusyBlocks merged;
  merged.reserve(intervals.size());
  merged.push_back(std::move(intervals.front()));

  for (auto it = std::next(intervals.begin()); it != intervals.end(); ++it)
  {
    BusyBlock& current = merged.back();
    if (it->start <= current.finish)
    {
      // Touching intervals are merged too. The current block keeps its label.
      current.finish = std::max(current.finish, it->finish);
      current.merged_count += it->merged_count;
      continue;
    }

    merged.push_back(std::move(*it));
  }

  return merged;
}

} // namespace availability
} // namespace roomhub
