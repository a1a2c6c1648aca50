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

#include <rmf_utils/catch.hpp>

#include <roomhub/Service.hpp>
#include <roomhub/calendar/InMemoryCalendar.hpp>

#include "utils_Availability.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>

using namespace roomhub;
using roomhub::test::at;
using roomhub::test::record;

namespace {

//==============================================================================
/// Wraps an InMemoryCalendar so that tests can count remote calls and make
/// individual calendars fail or stall.
class InstrumentedSource : public calendar::CalendarSource
{
public:

  calendar::InMemoryCalendar inner;
  std::atomic_size_t lists{0};
  std::atomic_size_t inserts{0};
  std::atomic_size_t removes{0};
  std::atomic_bool fail_writes{false};

  void fail(const std::string& calendar)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _failing.insert(calendar);
  }

  void stall(const std::string& calendar, std::shared_future<void> gate)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stalled = calendar;
    _gate = std::move(gate);
  }

  std::vector<availability::ReservationRecord> list(
    const std::string& calendar,
    const Time start,
    const Time finish) final
  {
    ++lists;

    std::shared_future<void> gate;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_failing.count(calendar) > 0)
        throw calendar::calendar_error(calendar, "Service unavailable");

      if (calendar == _stalled)
        gate = _gate;
    }

    if (gate.valid())
      gate.wait();

    return inner.list(calendar, start, finish);
  }

  std::string insert(
    const std::string& calendar,
    const calendar::Event& event) final
  {
    ++inserts;
    if (fail_writes)
      throw calendar::calendar_error(calendar, "Write rejected");

    return inner.insert(calendar, event);
  }

  void remove(const std::string& calendar, const std::string& event_id) final
  {
    ++removes;
    if (fail_writes)
      throw calendar::calendar_error(calendar, "Write rejected");

    inner.remove(calendar, event_id);
  }

private:
  std::mutex _mutex;
  std::set<std::string> _failing;
  std::string _stalled;
  std::shared_future<void> _gate;
};

//==============================================================================
Configuration make_config()
{
  Configuration config;
  config.time_zone(TimeZone::utc())
  .add_room({"talking", "talking-cal", "Talking Room"})
  .add_room({"thinking", "thinking-cal", "Thinking Room"})
  .credentials(
    Configuration::Credentials{"roomhub@example.com", "secret", ""});

  return config;
}

//==============================================================================
struct Harness
{
  std::shared_ptr<Time> now = std::make_shared<Time>(at("10:00"));
  std::shared_ptr<InstrumentedSource> source =
    std::make_shared<InstrumentedSource>();

  Harness()
  {
    source->inner.add_calendar("talking-cal");
    source->inner.add_calendar("thinking-cal");
  }

  ClockFunction clock() const
  {
    auto t = now;
    return [t]() { return *t; };
  }

  Service service(Configuration config = make_config()) const
  {
    return Service(std::move(config), source, nullptr, clock());
  }
};

//==============================================================================
Service::BookingRequest request(
  const std::string& room,
  const Time start,
  const long minutes,
  const std::string& label = "Baker")
{
  Service::BookingRequest r;
  r.room = room;
  r.start = start;
  r.duration_minutes = minutes;
  r.label = label;
  return r;
}

} // anonymous namespace

SCENARIO("Reading availability")
{
  Harness h;
  auto service = h.service();
  const std::string date = roomhub::test::test_date();

  h.source->inner.add_record("talking-cal", record("09:30", "10:30", "[Hunch]"));
  h.source->inner.add_record("talking-cal", record("10:00", "11:00", ""));

  GIVEN("A date with reservations")
  {
    const auto day = service.availability(date);

    THEN("Every room is reported in configured order")
    {
      REQUIRE(day != nullptr);
      CHECK(day->date == date);
      REQUIRE(day->rooms.size() == 2);
      CHECK(day->rooms[0].room == "talking");
      CHECK(day->rooms[1].room == "thinking");
    }

    THEN("Busy blocks and status are computed")
    {
      const auto* talking = day->find("talking");
      REQUIRE(talking != nullptr);
      REQUIRE(talking->busy_blocks.size() == 1);
      CHECK(talking->busy_blocks[0].start == at("09:30"));
      CHECK(talking->busy_blocks[0].finish == at("11:00"));
      CHECK(talking->busy_blocks[0].label == "[Hunch]");
      CHECK_FALSE(talking->free_now);
      CHECK(talking->next_available == at("11:00"));

      const auto* thinking = day->find("thinking");
      REQUIRE(thinking != nullptr);
      CHECK(thinking->free_now);
      CHECK(thinking->busy_blocks.empty());
    }

    THEN("Each room's calendar is read once")
    {
      CHECK(h.source->lists.load() == 2);
    }
  }

  GIVEN("A reservation with no summary")
  {
    service.availability(date);
    h.source->inner.add_record(
      "thinking-cal", record("15:00", "16:00", "", "untitled"));
    *h.now += std::chrono::minutes(5);

    THEN("It is labelled as booked")
    {
      const auto later = service.availability(date);
      const auto* thinking = later->find("thinking");
      REQUIRE(thinking != nullptr);
      REQUIRE(thinking->busy_blocks.size() == 1);
      CHECK(thinking->busy_blocks[0].label == "Booked");
    }
  }

  GIVEN("Repeated reads of the same date")
  {
    const auto first = service.availability(date);
    *h.now += std::chrono::seconds(30);
    const auto second = service.availability(date);

    THEN("Reads inside the time-to-live do not reach the calendars")
    {
      CHECK(first == second);
      CHECK(h.source->lists.load() == 2);
    }

    WHEN("The time-to-live passes")
    {
      *h.now += std::chrono::seconds(30);
      const auto third = service.availability(date);

      THEN("The calendars are read again")
      {
        CHECK(third != first);
        CHECK(h.source->lists.load() == 4);
      }
    }
  }

  GIVEN("No date")
  {
    const auto day = service.availability();

    THEN("Today is used")
    {
      CHECK(day->date == date);
    }
  }

  GIVEN("A malformed date")
  {
    THEN("The request is rejected without reading the calendars")
    {
      CHECK_THROWS_AS(service.availability("2026-02-30"), invalid_request);
      CHECK_THROWS_AS(service.availability("19-10-2026"), invalid_request);
      CHECK(h.source->lists.load() == 0);
    }
  }

  GIVEN("A calendar that fails")
  {
    h.source->fail("thinking-cal");
    const auto day = service.availability(date);

    THEN("Only that room reports an error")
    {
      const auto* thinking = day->find("thinking");
      REQUIRE(thinking != nullptr);
      REQUIRE(thinking->error.has_value());
      CHECK(*thinking->error == "Could not load calendar data");
      CHECK_FALSE(thinking->free_now);

      const auto* talking = day->find("talking");
      REQUIRE(talking != nullptr);
      CHECK_FALSE(talking->error.has_value());
      CHECK(talking->busy_blocks.size() == 1);
    }
  }

  GIVEN("A calendar that does not answer in time")
  {
    std::promise<void> release;
    h.source->stall("thinking-cal", release.get_future().share());

    auto config = make_config();
    config.fetch_timeout(std::chrono::milliseconds(500));
    auto slow_service = h.service(config);

    const auto day = slow_service.availability(date);
    release.set_value();

    THEN("Only that room reports an error")
    {
      const auto* thinking = day->find("thinking");
      REQUIRE(thinking != nullptr);
      CHECK(thinking->error.has_value());

      const auto* talking = day->find("talking");
      REQUIRE(talking != nullptr);
      CHECK_FALSE(talking->error.has_value());
    }
  }

  GIVEN("A reservation made while a read is still loading")
  {
    std::promise<void> release;
    h.source->stall("talking-cal", release.get_future().share());

    availability::ConstDayAvailabilityPtr loading;
    std::thread reader([&]() { loading = service.availability(date); });

    // Both rooms have started loading and the talking room is held up
    while (h.source->lists.load() < 2)
      std::this_thread::yield();

    const auto outcome = service.book(request("thinking", at("15:00"), 30));
    release.set_value();
    reader.join();

    THEN("The result of that read is not cached")
    {
      REQUIRE(outcome.accepted);
      REQUIRE(loading != nullptr);

      const auto after = service.availability(date);
      CHECK(after != loading);
      CHECK(h.source->lists.load() == 5);

      const auto* thinking = after->find("thinking");
      REQUIRE(thinking != nullptr);
      REQUIRE(thinking->busy_blocks.size() == 1);
      CHECK(thinking->busy_blocks[0].start == at("15:00"));
    }
  }

  GIVEN("A deployment without credentials")
  {
    auto config = make_config();
    config.credentials(std::nullopt);
    auto unconfigured = h.service(config);

    THEN("Requests fail without reaching the calendars")
    {
      CHECK_THROWS_AS(unconfigured.availability(date), configuration_error);
      CHECK_THROWS_AS(
        unconfigured.book(request("talking", at("12:00"), 30)),
        configuration_error);
      CHECK(h.source->lists.load() == 0);
      CHECK(h.source->inserts.load() == 0);
    }
  }
}

SCENARIO("Booking a room")
{
  Harness h;
  auto service = h.service();
  const std::string date = roomhub::test::test_date();

  h.source->inner.add_record(
    "talking-cal", record("09:30", "10:00", "[Hunch]", "standup"));

  GIVEN("A free interval")
  {
    const auto before = service.availability(date);
    const auto outcome = service.book(request("talking", at("11:00"), 30));

    THEN("The reservation is written with the label as its summary")
    {
      CHECK(outcome.accepted);
      CHECK_FALSE(outcome.conflict.has_value());
      CHECK_FALSE(outcome.event_id.empty());
      CHECK(outcome.start == at("11:00"));
      CHECK(outcome.finish == at("11:30"));
      CHECK(outcome.date == date);
      CHECK(outcome.message == "Talking Room is booked from 11:00 to 11:30");

      const auto records =
        h.source->inner.list("talking-cal", at("11:00"), at("11:30"));
      REQUIRE(records.size() == 1);
      CHECK(records[0].label == "[Baker]");
    }

    THEN("The next read recomputes the date")
    {
      const auto after = service.availability(date);
      CHECK(after != before);
      CHECK(h.source->lists.load() == 5);

      const auto* talking = after->find("talking");
      REQUIRE(talking != nullptr);
      CHECK(talking->busy_blocks.size() == 2);
    }
  }

  GIVEN("An interval that overlaps an existing reservation")
  {
    const auto before = service.availability(date);
    const auto outcome = service.book(request("talking", at("09:00"), 60));

    THEN("The earliest conflicting reservation is reported")
    {
      CHECK_FALSE(outcome.accepted);
      REQUIRE(outcome.conflict.has_value());
      CHECK(outcome.conflict->block.start == at("09:30"));
      CHECK(outcome.message == "Talking Room is booked from 9:30");
      CHECK(outcome.event_id.empty());
    }

    THEN("Nothing is written and the cache is kept")
    {
      CHECK(h.source->inserts.load() == 0);
      CHECK(service.availability(date) == before);
    }
  }

  GIVEN("Two requests for the same hour at the same time")
  {
    std::promise<void> release;
    h.source->stall("talking-cal", release.get_future().share());

    Service::BookingOutcome alpha;
    Service::BookingOutcome beta;
    std::thread first(
      [&]()
      {
        alpha = service.book(request("talking", at("10:00"), 60, "Alpha"));
      });
    std::thread second(
      [&]()
      {
        beta = service.book(request("talking", at("10:00"), 60, "Beta"));
      });

    // Hold one request inside the conflict check long enough for the other to
    // reach the same room.
    while (h.source->lists.load() < 1)
      std::this_thread::yield();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    release.set_value();
    first.join();
    second.join();

    THEN("Exactly one of them is accepted")
    {
      CHECK(alpha.accepted != beta.accepted);
      CHECK(h.source->inserts.load() == 1);
      CHECK(h.source->lists.load() == 2);

      const auto& rejected = alpha.accepted ? beta : alpha;
      REQUIRE(rejected.conflict.has_value());
      CHECK(rejected.conflict->block.start == at("10:00"));
      CHECK(rejected.message == "Talking Room is booked from 10:00");

      const auto records =
        h.source->inner.list("talking-cal", at("10:00"), at("11:00"));
      CHECK(records.size() == 1);
    }
  }

  GIVEN("A request for the whole day")
  {
    const auto outcome =
      service.book(request("thinking", at("14:00"), 540, "Offsite"));

    THEN("It starts when the window opens")
    {
      CHECK(outcome.accepted);
      CHECK(outcome.start == at("09:00"));
      CHECK(outcome.finish == at("18:00"));
    }
  }

  GIVEN("A request that does not fit in the window")
  {
    THEN("It is rejected without writing")
    {
      CHECK_THROWS_AS(
        service.book(request("thinking", at("17:30"), 60)), invalid_request);
      CHECK_THROWS_AS(
        service.book(request("thinking", at("08:00"), 30)), invalid_request);
      CHECK(h.source->inserts.load() == 0);
    }
  }

  GIVEN("Requests with missing or invalid fields")
  {
    auto missing_start = request("talking", at("12:00"), 30);
    missing_start.start = std::nullopt;

    THEN("They are rejected without reaching the calendars")
    {
      CHECK_THROWS_AS(
        service.book(request("", at("12:00"), 30)), invalid_request);
      CHECK_THROWS_AS(service.book(missing_start), invalid_request);
      CHECK_THROWS_AS(
        service.book(request("talking", at("12:00"), 0)), invalid_request);
      CHECK_THROWS_AS(
        service.book(request("talking", at("12:00"), 30, "")), invalid_request);
      CHECK_THROWS_AS(
        service.book(request("cooking", at("12:00"), 30)), invalid_request);
      CHECK(h.source->lists.load() == 0);
      CHECK(h.source->inserts.load() == 0);
    }
  }

  GIVEN("A calendar that rejects the write")
  {
    const auto before = service.availability(date);
    h.source->fail_writes = true;

    THEN("The error is reported and the cache is kept")
    {
      CHECK_THROWS_AS(
        service.book(request("talking", at("12:00"), 30)),
        calendar::calendar_error);
      CHECK(service.cache()->get(date) == before);
    }
  }
}

SCENARIO("Cancelling a reservation")
{
  Harness h;
  auto service = h.service();
  const std::string today = roomhub::test::test_date();
  const std::string tomorrow = date::add_days(today, 1);

  const auto id = h.source->inner.add_record(
    "talking-cal", record("12:00", "13:00", "[Baker]"));

  service.availability(today);
  service.availability(tomorrow);
  REQUIRE(service.cache()->size() == 2);

  GIVEN("A removal that knows when the reservation started")
  {
    Service::RemovalRequest removal{"talking", id, at("12:00")};
    service.remove(removal);

    THEN("Only that date is invalidated")
    {
      CHECK(h.source->inner.count("talking-cal") == 0);
      CHECK(service.cache()->get(today) == nullptr);
      CHECK(service.cache()->get(tomorrow) != nullptr);
    }
  }

  GIVEN("A removal without a start time")
  {
    Service::RemovalRequest removal{"talking", id, std::nullopt};
    service.remove(removal);

    THEN("Every date is invalidated")
    {
      CHECK(service.cache()->get(today) == nullptr);
      CHECK(service.cache()->get(tomorrow) == nullptr);
    }
  }

  GIVEN("A calendar that rejects the removal")
  {
    h.source->fail_writes = true;
    Service::RemovalRequest removal{"talking", id, at("12:00")};

    THEN("The error is reported and the cache is kept")
    {
      CHECK_THROWS_AS(service.remove(removal), calendar::calendar_error);
      CHECK(service.cache()->get(today) != nullptr);
    }
  }

  GIVEN("Requests with missing fields")
  {
    THEN("They are rejected without reaching the calendars")
    {
      CHECK_THROWS_AS(
        service.remove(Service::RemovalRequest{"talking", "", std::nullopt}),
        invalid_request);
      CHECK_THROWS_AS(
        service.remove(Service::RemovalRequest{"", id, std::nullopt}),
        invalid_request);
      CHECK_THROWS_AS(
        service.remove(Service::RemovalRequest{"cooking", id, std::nullopt}),
        invalid_request);
      CHECK(h.source->removes.load() == 0);
    }
  }
}
