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

#include <roomhub/Service.hpp>
#include <roomhub/TimeZone.hpp>
#include <roomhub/availability/Merge.hpp>
#include <roomhub/availability/Normalize.hpp>

#include "internal_Logging.hpp"

#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace roomhub {

namespace {

using Records = std::vector<availability::ReservationRecord>;

//==============================================================================
const std::string& default_label()
{
  static const std::string label = "Booked";
  return label;
}

//==============================================================================
const std::string& load_error()
{
  static const std::string message = "Could not load calendar data";
  return message;
}

//==============================================================================
// Load the records of one calendar on a thread of its own. The thread holds a
// reference to the source, so a caller that stops waiting may safely return
// before the load completes.
std::future<Records> launch_fetch(
  std::shared_ptr<calendar::CalendarSource> source,
  std::string calendar,
  const Time start,
  const Time finish)
{
  std::packaged_task<Records()> task(
    [source = std::move(source), calendar = std::move(calendar), start,
    finish]()
    {
      Records records = source->list(calendar, start, finish);
      for (auto& record : records)
      {
        if (record.label.empty())
          record.label = default_label();
      }

      return records;
    });

  auto future = task.get_future();
  std::thread(std::move(task)).detach();
  return future;
}

} // anonymous namespace

//==============================================================================
invalid_request::invalid_request(const std::string& what)
: std::invalid_argument(what)
{
  // Do nothing
}

//==============================================================================
class Service::Implementation
{
public:

  Configuration config;
  std::shared_ptr<calendar::CalendarSource> source;
  std::shared_ptr<availability::Cache> cache;
  ClockFunction clock;

  // Held from the conflict check until the cache is invalidated, so that two
  // bookings of one room cannot both pass the check.
  std::unordered_map<std::string, std::mutex> booking_mutex;

  Implementation(
    Configuration config_,
    std::shared_ptr<calendar::CalendarSource> source_,
    std::shared_ptr<availability::Cache> cache_,
    ClockFunction clock_)
  : config(std::move(config_)),
    source(std::move(source_)),
    cache(std::move(cache_)),
    clock(std::move(clock_))
  {
    if (!cache)
      cache = std::make_shared<availability::Cache>(config.cache_ttl(), clock);

    for (const auto& room : config.rooms())
      booking_mutex.try_emplace(room.name);
  }

  availability::BookingWindow window(const std::string& date) const
  {
    if (!date::is_valid(date))
    {
      throw invalid_request(
        "[Service] Invalid date [" + date + "], expected YYYY-MM-DD");
    }

    return availability::BookingWindow::for_date(
      config.time_zone(), date, config.window_open(), config.window_close());
  }

  const Configuration::Room& room(
    const std::string& name,
    const char* caller) const
  {
    const auto* room = config.find_room(name);
    if (!room)
    {
      throw invalid_request(
        std::string("[Service::") + caller + "] Unknown room [" + name + "]");
    }

    return *room;
  }

  availability::ConstDayAvailabilityPtr compute(const std::string& date)
  {
    // Take the ticket before loading anything so that a reservation change
    // that lands while we are loading prevents this result from being cached.
    const auto ticket = cache->ticket();
    const auto window = this->window(date);

    struct Pending
    {
      const Configuration::Room* room;
      std::optional<std::future<Records>> records;
    };

    std::vector<Pending> pending;
    for (const auto& room : config.rooms())
    {
      Pending p{&room, std::nullopt};
      try
      {
        p.records = launch_fetch(
          source, room.calendar, window.start(), window.finish());
      }
      catch (const std::exception& e)
      {
        logger()->error(
          "[Service::availability] Unable to start loading calendar [{}] of "
          "room [{}]: {}", room.calendar, room.name, e.what());
      }

      pending.push_back(std::move(p));
    }

    const auto deadline =
      std::chrono::steady_clock::now() + config.fetch_timeout();

    auto day = std::make_shared<availability::DayAvailability>();
    day->date = date;
    for (auto& p : pending)
    {
      day->rooms.push_back(collect(p.room->name, p.records, window, deadline));
    }

    if (!cache->set(date, day, ticket))
    {
      logger()->debug(
        "[Service::availability] Availability of [{}] changed while it was "
        "being loaded. The result was not cached.", date);
    }

    return day;
  }

  availability::Snapshot collect(
    const std::string& room,
    std::optional<std::future<Records>>& records,
    const availability::BookingWindow& window,
    const std::chrono::steady_clock::time_point deadline)
  {
    if (!records.has_value())
      return availability::Snapshot::failed(room, load_error());

    if (records->wait_until(deadline) != std::future_status::ready)
    {
      logger()->error(
        "[Service::availability] Timed out loading the calendar of room [{}] "
        "for [{}]", room, window.date());
      return availability::Snapshot::failed(room, load_error());
    }

    try
    {
      return availability::Snapshot::compute(
        room, records->get(), window, clock());
    }
    catch (const std::exception& e)
    {
      logger()->error(
        "[Service::availability] Unable to load the calendar of room [{}] "
        "for [{}]: {}", room, window.date(), e.what());
    }

    return availability::Snapshot::failed(room, load_error());
  }
};

//==============================================================================
Service::Service(
  Configuration config,
  std::shared_ptr<calendar::CalendarSource> source,
  std::shared_ptr<availability::Cache> cache,
  ClockFunction clock)
: _pimpl(rmf_utils::make_unique_impl<Implementation>(
      std::move(config), std::move(source), std::move(cache), std::move(clock)))
{
  // Do nothing
}

//==============================================================================
availability::ConstDayAvailabilityPtr Service::availability(
  const std::optional<std::string>& date)
{
  const std::string day = date.has_value() && !date->empty() ?
    *date : _pimpl->config.time_zone().today(_pimpl->clock());

  if (!date::is_valid(day))
  {
    throw invalid_request(
      "[Service::availability] Invalid date [" + day + "], expected "
      "YYYY-MM-DD");
  }

  if (auto cached = _pimpl->cache->get(day))
  {
    logger()->debug("[Service::availability] Cache hit for [{}]", day);
    return cached;
  }

  logger()->debug("[Service::availability] Cache miss for [{}]", day);
  _pimpl->config.validate();
  return _pimpl->compute(day);
}

//==============================================================================
auto Service::book(const BookingRequest& request) -> BookingOutcome
{
  if (request.room.empty() || !request.start.has_value()
    || request.duration_minutes <= 0 || request.label.empty())
  {
    // *INDENT-OFF*
    throw invalid_request(
      "[Service::book] A booking needs a room, a start time, a positive "
      "duration and a label");
    // *INDENT-ON*
  }

  const auto& room = _pimpl->room(request.room, "book");
  _pimpl->config.validate();

  const auto& zone = _pimpl->config.time_zone();
  const auto window = _pimpl->window(zone.date_of(*request.start));
  const auto proposal = availability::DetectConflict::propose(
    window, *request.start, request.duration_minutes);

  if (proposal.start < window.start() || window.finish() < proposal.finish)
  {
    throw invalid_request(
      "[Service::book] The requested booking from ["
      + to_iso_string(proposal.start) + "] to ["
      + to_iso_string(proposal.finish) + "] does not fit inside the booking "
      "window of [" + window.date() + "]");
  }

  BookingOutcome outcome;
  outcome.start = proposal.start;
  outcome.finish = proposal.finish;
  outcome.date = zone.date_of(proposal.start);

  std::lock_guard<std::mutex> lock(_pimpl->booking_mutex.at(room.name));
  const auto records =
    _pimpl->source->list(room.calendar, window.start(), window.finish());
  const auto blocks =
    availability::merge(availability::normalize(records, window));

  outcome.conflict = availability::DetectConflict::between(proposal, blocks);
  if (outcome.conflict.has_value())
  {
    outcome.accepted = false;
    outcome.message = room.display_name + " is booked from "
      + zone.clock_label(outcome.conflict->block.start);

    logger()->info(
      "[Service::book] Rejected booking of room [{}] for [{}]: {}",
      room.name, request.label, outcome.message);
    return outcome;
  }

  calendar::Event event;
  event.start = proposal.start;
  event.finish = proposal.finish;
  event.summary = "[" + request.label + "]";
  event.time_zone = zone.spec();

  outcome.event_id = _pimpl->source->insert(room.calendar, event);
  outcome.accepted = true;
  outcome.message = room.display_name + " is booked from "
    + zone.clock_label(proposal.start) + " to "
    + zone.clock_label(proposal.finish);

  _pimpl->cache->invalidate(outcome.date);
  logger()->info(
    "[Service::book] Booked room [{}] for [{}] as event [{}]; invalidated "
    "cached availability of [{}]",
    room.name, request.label, outcome.event_id, outcome.date);

  return outcome;
}

//==============================================================================
void Service::remove(const RemovalRequest& request)
{
  if (request.room.empty() || request.event_id.empty())
  {
    // *INDENT-OFF*
    throw invalid_request(
      "[Service::remove] A removal needs a room and an event id");
    // *INDENT-ON*
  }

  const auto& room = _pimpl->room(request.room, "remove");
  _pimpl->config.validate();

  _pimpl->source->remove(room.calendar, request.event_id);

  if (request.start.has_value())
  {
    const auto date = _pimpl->config.time_zone().date_of(*request.start);
    _pimpl->cache->invalidate(date);
    logger()->info(
      "[Service::remove] Removed event [{}] from room [{}]; invalidated "
      "cached availability of [{}]", request.event_id, room.name, date);
    return;
  }

  // Without the start of the reservation we cannot tell which date changed.
  _pimpl->cache->invalidate_all();
  logger()->info(
    "[Service::remove] Removed event [{}] from room [{}]; cleared all cached "
    "availability", request.event_id, room.name);
}

//==============================================================================
availability::BookingWindow Service::window(const std::string& date) const
{
  return _pimpl->window(date);
}

//==============================================================================
const Configuration& Service::configuration() const
{
  return _pimpl->config;
}

//==============================================================================
const std::shared_ptr<availability::Cache>& Service::cache() const
{
  return _pimpl->cache;
}

} // namespace roomhub
