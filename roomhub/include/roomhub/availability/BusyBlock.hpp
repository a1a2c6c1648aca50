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

#ifndef ROOMHUB__AVAILABILITY__BUSYBLOCK_HPP
#define ROOMHUB__AVAILABILITY__BUSYBLOCK_HPP

#include <roomhub/Time.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace roomhub {
namespace availability {

//==============================================================================
/// A span of time during which a room is reserved.
///
/// Blocks produced by merge() for one room and date are sorted by start time,
/// pairwise disjoint and contained in the booking window.
struct BusyBlock
{
  Time start;
  Time finish;

  /// The label of the earliest reservation that contributed to this block.
  std::string label;

  /// How many clipped reservations were folded into this block.
  std::size_t merged_count = 1;

  Duration length() const
  {
    return finish - start;
  }

  bool operator==(const BusyBlock& other) const
  {
    return start == other.start
      && finish == other.finish
      && label == other.label
      && merged_count == other.merged_count;
  }

  bool operator!=(const BusyBlock& other) const
  {
    return !(*this == other);
  }
};

using BusyBlocks = std::vector<BusyBlock>;

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__BUSYBLOCK_HPP
