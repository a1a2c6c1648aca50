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

#include <roomhub/TimeZone.hpp>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>

#include <iomanip>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace roomhub {

namespace {

//==============================================================================
const boost::posix_time::ptime& epoch()
{
  static const boost::posix_time::ptime value(
    boost::gregorian::date(1970, 1, 1));
  return value;
}

//==============================================================================
Time to_time(const boost::posix_time::ptime& p)
{
  const auto us = std::chrono::microseconds((p - epoch()).total_microseconds());
  return Time(std::chrono::duration_cast<Duration>(us));
}

//==============================================================================
boost::posix_time::ptime to_ptime(const Time t)
{
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
    t.time_since_epoch()).count();
  return epoch() + boost::posix_time::microseconds(us);
}

//==============================================================================
boost::posix_time::time_duration to_time_duration(const Duration d)
{
  const auto us =
    std::chrono::duration_cast<std::chrono::microseconds>(d).count();
  return boost::posix_time::microseconds(us);
}

//==============================================================================
Duration to_duration(const boost::posix_time::time_duration& d)
{
  return std::chrono::duration_cast<Duration>(
    std::chrono::microseconds(d.total_microseconds()));
}

//==============================================================================
std::optional<boost::gregorian::date> try_parse_date(const std::string& text)
{
  static const std::regex pattern(R"(^(\d{4})-(\d{2})-(\d{2})$)");
  std::smatch match;
  if (!std::regex_match(text, match, pattern))
    return std::nullopt;

  try
  {
    return boost::gregorian::date(
      static_cast<unsigned short>(std::stoi(match[1].str())),
      static_cast<unsigned short>(std::stoi(match[2].str())),
      static_cast<unsigned short>(std::stoi(match[3].str())));
  }
  catch (const std::out_of_range&)
  {
    // The fields are numeric but do not name a real day, e.g. 2026-02-30.
    return std::nullopt;
  }
}

//==============================================================================
boost::gregorian::date parse_date(const std::string& text)
{
  const auto d = try_parse_date(text);
  if (!d)
  {
    throw std::invalid_argument(
      "[roomhub::parse_date] Invalid calendar date [" + text + "], expected "
      "a real day written as YYYY-MM-DD");
  }

  return *d;
}

} // anonymous namespace

//==============================================================================
class TimeZone::Implementation
{
public:

  std::string spec;
  boost::local_time::time_zone_ptr zone;

  boost::local_time::local_date_time local(const Time t) const
  {
    return boost::local_time::local_date_time(to_ptime(t), zone);
  }
};

//==============================================================================
TimeZone::TimeZone(const std::string& posix_spec)
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  _pimpl->spec = posix_spec;
  try
  {
    _pimpl->zone =
      boost::make_shared<boost::local_time::posix_time_zone>(posix_spec);
  }
  catch (const std::exception& e)
  {
    throw std::invalid_argument(
      "[TimeZone::TimeZone] Unable to parse time zone specification ["
      + posix_spec + "]: " + e.what());
  }
}

//==============================================================================
TimeZone TimeZone::utc()
{
  return TimeZone("UTC+00");
}

//==============================================================================
const std::string& TimeZone::spec() const
{
  return _pimpl->spec;
}

//==============================================================================
Time TimeZone::at(const std::string& date, const Duration time_of_day) const
{
  const auto d = parse_date(date);
  try
  {
    const boost::local_time::local_date_time local(
      d, to_time_duration(time_of_day), _pimpl->zone,
      boost::local_time::local_date_time::EXCEPTION_ON_ERROR);

    return to_time(local.utc_time());
  }
  catch (const std::logic_error& e)
  {
    // ambiguous_result and time_label_invalid are both logic errors
    throw std::invalid_argument(
      "[TimeZone::at] Local time on [" + date + "] cannot be resolved in zone ["
      + _pimpl->spec + "]: " + e.what());
  }
}

//==============================================================================
std::string TimeZone::date_of(const Time t) const
{
  return boost::gregorian::to_iso_extended_string(
    _pimpl->local(t).local_time().date());
}

//==============================================================================
Duration TimeZone::time_of_day(const Time t) const
{
  return to_duration(_pimpl->local(t).local_time().time_of_day());
}

//==============================================================================
std::string TimeZone::clock_label(const Time t) const
{
  const auto tod = _pimpl->local(t).local_time().time_of_day();
  const auto hours = tod.hours() % 12 == 0 ? 12 : tod.hours() % 12;

  std::stringstream str;
  str << hours << ":" << std::setw(2) << std::setfill('0') << tod.minutes();
  return str.str();
}

//==============================================================================
std::string TimeZone::today(const Time now) const
{
  return date_of(now);
}

namespace date {

//==============================================================================
bool is_valid(const std::string& date)
{
  return try_parse_date(date).has_value();
}

//==============================================================================
std::string add_days(const std::string& date, const int days)
{
  const auto d = parse_date(date) + boost::gregorian::days(days);
  return boost::gregorian::to_iso_extended_string(d);
}

} // namespace date

//==============================================================================
std::string to_iso_string(const Time t)
{
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
    t.time_since_epoch()).count();
  const auto p = epoch() + boost::posix_time::seconds(seconds);
  return boost::posix_time::to_iso_extended_string(p) + "Z";
}

//==============================================================================
Time from_iso_string(const std::string& text)
{
  static const std::regex pattern(
    R"(^(\d{4}-\d{2}-\d{2})T(\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,6})\d*)?)?)"
    R"((Z|([+-])(\d{2}):?(\d{2}))?$)");

  std::smatch match;
  if (!std::regex_match(text, match, pattern))
  {
    throw std::invalid_argument(
      "[roomhub::from_iso_string] Invalid ISO-8601 instant [" + text + "]");
  }

  const auto d = parse_date(match[1].str());
  const int hours = std::stoi(match[2].str());
  const int minutes = std::stoi(match[3].str());
  const int seconds = match[4].matched ? std::stoi(match[4].str()) : 0;
  if (hours > 23 || minutes > 59 || seconds > 59)
  {
    throw std::invalid_argument(
      "[roomhub::from_iso_string] Time of day out of range in [" + text + "]");
  }

  long micros = 0;
  if (match[5].matched)
  {
    std::string fraction = match[5].str();
    fraction.resize(6, '0');
    micros = std::stol(fraction);
  }

  boost::posix_time::ptime p(
    d,
    boost::posix_time::hours(hours) + boost::posix_time::minutes(minutes)
    + boost::posix_time::seconds(seconds)
    + boost::posix_time::microseconds(micros));

  if (match[7].matched)
  {
    const auto offset = boost::posix_time::hours(std::stoi(match[8].str()))
      + boost::posix_time::minutes(std::stoi(match[9].str()));

    // Local = UTC + offset, so UTC = local - offset
    if (match[7].str() == "+")
      p -= offset;
    else
      p += offset;
  }

  return to_time(p);
}

} // namespace roomhub
