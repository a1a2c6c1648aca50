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

#ifndef ROOMHUB__AVAILABILITY__RESERVATIONRECORD_HPP
#define ROOMHUB__AVAILABILITY__RESERVATIONRECORD_HPP

#include <roomhub/Time.hpp>

#include <string>

namespace roomhub {
namespace availability {

//==============================================================================
/// A single concrete reservation as reported by an external calendar. Records
/// are owned by the calendar and are never modified by roomhub.
struct ReservationRecord
{
  Time start;
  Time finish;

  /// The human readable summary of the reservation.
  std::string label;

  /// The identity of the reservation inside the external calendar.
  std::string event_id;
};

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__RESERVATIONRECORD_HPP
