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

#ifndef ROOMHUB__AVAILABILITY__BOOKINGWINDOW_HPP
#define ROOMHUB__AVAILABILITY__BOOKINGWINDOW_HPP

#include <roomhub/Time.hpp>
#include <roomhub/TimeZone.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <string>

namespace roomhub {
namespace availability {

//==============================================================================
/// The open-to-close range of a single calendar day during which rooms may be
/// reserved.
class BookingWindow
{
public:

  /// Constructor
  ///
  /// \param[in] date
  ///   The calendar date that this window belongs to.
  ///
  /// \param[in] start
  ///   The instant at which the window opens.
  ///
  /// \param[in] finish
  ///   The instant at which the window closes.
  ///
  /// \throws std::invalid_argument if start is not before finish.
  BookingWindow(std::string date, Time start, Time finish);

  /// Build the window for a date from the configured open and close times of
  /// day, interpreted in the operating time zone.
  ///
  /// \throws std::invalid_argument if the date is malformed or the resulting
  /// window is empty.
  static BookingWindow for_date(
    const TimeZone& zone,
    const std::string& date,
    Duration open,
    Duration close);

  /// The calendar date of this window.
  const std::string& date() const;

  /// The instant at which the window opens.
  Time start() const;

  /// The instant at which the window closes.
  Time finish() const;

  /// The length of the window.
  Duration length() const;

  /// Returns true if t is inside [start, finish).
  bool contains(Time t) const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace availability
} // namespace roomhub

#endif // ROOMHUB__AVAILABILITY__BOOKINGWINDOW_HPP
