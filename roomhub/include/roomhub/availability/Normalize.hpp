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

#ifndef ROOMHUB__AVAILABILITY__NORMALIZE_HPP
#define ROOMHUB__AVAILABILITY__NORMALIZE_HPP

#include <roomhub/availability/BookingWindow.hpp>
#include <roomhub/availability/BusyBlock.hpp>
#include <roomhub/availability/ReservationRecord.hpp>

#include <vector>

namespace roomhub {
namespace availability {

//==============================================================================
/// Clip each record to the booking window and drop the records that do not
/// leave a positive length inside it. Labels are carried over unchanged. The
/// order of the output is unspecified.
BusyBlocks normalize(
  const std::vector<ReservationRecord>& records,
  const BookingWindow& window);

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__NORMALIZE_HPP
