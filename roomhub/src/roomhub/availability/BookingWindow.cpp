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

#include <roomhub/availability/BookingWindow.hpp>

#include <stdexcept>
#include <utility>

namespace roomhub {
namespace availability {

//==============================================================================
class BookingWindow::Implementation
{
public:

  std::string date;
  Time start;
  Time finish;

};

//==============================================================================
BookingWindow::BookingWindow(std::string date, Time start, Time finish)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{std::move(date), start, finish}))
{
  if (!(_pimpl->start < _pimpl->finish))
  {
    // *INDENT-OFF*
    throw std::invalid_argument(
      "[BookingWindow::BookingWindow] The window for [" + _pimpl->date
      + "] must open before it closes");
    // *INDENT-ON*
  }
}

//==============================================================================
BookingWindow BookingWindow::for_date(
  const TimeZone& zone,
  const std::string& date,
  const Duration open,
  const Duration close)
{
  return BookingWindow(date, zone.at(date, open), zone.at(date, close));
}

//==============================================================================
const std::string& BookingWindow::date() const
{
  return _pimpl->date;
}

//==============================================================================
Time BookingWindow::start() const
{
  return _pimpl->start;
}

//==============================================================================
Time BookingWindow::finish() const
{
  return _pimpl->finish;
}

//==============================================================================
Duration BookingWindow::length() const
{
  return _pimpl->finish - _pimpl->start;
}

//==============================================================================
bool BookingWindow::contains(const Time t) const
{
  return _pimpl->start <= t && t < _pimpl->finish;
}

} // namespace availability
} // namespace roomhub
