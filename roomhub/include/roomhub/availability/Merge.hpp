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

#ifndef ROOMHUB__AVAILABILITY__MERGE_HPP
#define ROOMHUB__AVAILABILITY__MERGE_HPP

#include <roomhub/availability/BusyBlock.hpp>

namespace roomhub {
namespace availability {

//==============================================================================
/// Merge intervals that overlap or touch into maximal busy blocks.
///
/// The intervals are stably sorted by start time. When two intervals are
/// folded together the block keeps the label of the one that starts first
/// (the earlier one in the input if they start together) and the
/// merged_count of both is summed.
///
/// The output is sorted by start time and pairwise disjoint. Merging an
/// already merged list returns it unchanged.
BusyBlocks merge(BusyBlocks intervals);

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__MERGE_HPP
