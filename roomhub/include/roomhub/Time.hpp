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

#ifndef ROOMHUB__TIME_HPP
#define ROOMHUB__TIME_HPP

#include <chrono>
#include <functional>
#include <string>

namespace roomhub {

/// Reservations are exchanged with external calendars as wall-clock instants,
/// so roomhub works on the system clock rather than a steady clock.
using Clock = std::chrono::system_clock;
using Time = Clock::time_point;
using Duration = Clock::duration;

/// A source of the current instant. Components that depend on "now" accept
/// one of these so that tests can control the passage of time.
using ClockFunction = std::function<Time()>;

namespace time {

//==============================================================================
/// Get the default clock function, which reads the system clock.
ClockFunction system_clock();

//==============================================================================
/// Build a duration out of a number of minutes.
Duration from_minutes(long minutes);

//==============================================================================
/// Convert a duration into a count of whole minutes, rounding toward zero.
long to_minutes(Duration duration);

//==============================================================================
/// Build a time-of-day duration out of an "HH:MM" string.
///
/// \throws std::invalid_argument if the string is not a valid time of day.
Duration parse_time_of_day(const std::string& hh_mm);

} // namespace time

} // namespace roomhub

#endif // ROOMHUB__TIME_HPP
