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

#ifndef ROOMHUB__TIMEZONE_HPP
#define ROOMHUB__TIMEZONE_HPP

#include <roomhub/Time.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <string>

namespace roomhub {

//==============================================================================
/// The operating time zone of a deployment. Calendar dates are always
/// expressed as "YYYY-MM-DD" strings in this zone.
class TimeZone
{
public:

  /// Construct a time zone from a POSIX time zone specification, e.g.
  /// "NZST+12NZDT,M9.5.0/02:00,M4.1.0/03:00".
  ///
  /// \note The UTC offset is written the way Boost.DateTime reads it: the
  /// amount of time added to UTC to get local time. This is the opposite sign
  /// of the TZ environment variable convention.
  ///
  /// \throws std::invalid_argument if the specification cannot be parsed.
  explicit TimeZone(const std::string& posix_spec);

  /// The UTC time zone.
  static TimeZone utc();

  /// The specification this zone was constructed from.
  const std::string& spec() const;

  /// Get the instant at which the given wall-clock time of day occurs on the
  /// given date in this zone.
  ///
  /// \param[in] date
  ///   A "YYYY-MM-DD" calendar date.
  ///
  /// \param[in] time_of_day
  ///   Offset from local midnight.
  ///
  /// \throws std::invalid_argument if the date is malformed or the local time
  /// does not exist (or is ambiguous) in this zone.
  Time at(const std::string& date, Duration time_of_day) const;

  /// Get the calendar date of an instant in this zone.
  std::string date_of(Time t) const;

  /// Get the local time of day of an instant in this zone.
  Duration time_of_day(Time t) const;

  /// Format the local time of an instant as "h:mm" on a 12 hour clock.
  std::string clock_label(Time t) const;

  /// Get the calendar date that is "today" according to the given instant.
  std::string today(Time now) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

namespace date {

//==============================================================================
/// Returns true if the string is a "YYYY-MM-DD" calendar date that exists.
bool is_valid(const std::string& date);

//==============================================================================
/// Get the date that is the given number of days after (or before, if
/// negative) the given date.
///
/// \throws std::invalid_argument if the date is malformed.
std::string add_days(const std::string& date, int days);

} // namespace date

//==============================================================================
/// Format an instant as an ISO-8601 UTC string, e.g. "2026-10-19T09:30:00Z".
std::string to_iso_string(Time t);

//==============================================================================
/// Parse an ISO-8601 instant. A trailing "Z" or a numeric "+hh:mm" offset is
/// accepted. A string with no offset is read as UTC.
///
/// \throws std::invalid_argument if the string cannot be parsed.
Time from_iso_string(const std::string& text);

} // namespace roomhub

#endif // ROOMHUB__TIMEZONE_HPP
