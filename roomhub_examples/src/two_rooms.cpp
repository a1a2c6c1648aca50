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
#include <roomhub/availability/SlotGrid.hpp>
#include <roomhub/calendar/InMemoryCalendar.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <yaml-cpp/yaml.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using roomhub::availability::SlotGrid;

//==============================================================================
// Fill the calendars of the configured rooms with the events of a fixture
// file, and return the date that the fixture describes.
std::string load_events(
  const std::string& path,
  const roomhub::Configuration& config,
  roomhub::calendar::InMemoryCalendar& source)
{
  const YAML::Node fixture = YAML::LoadFile(path);
  const std::string date = fixture["date"].as<std::string>();
  const auto& zone = config.time_zone();

  for (const auto& room : config.rooms())
    source.add_calendar(room.calendar);

  for (const auto& entry : fixture["events"])
  {
    const std::string name = entry.first.as<std::string>();
    const auto* room = config.find_room(name);
    if (!room)
    {
      throw std::runtime_error(
        "[load_events] Fixture names unknown room [" + name + "]");
    }

    for (const auto& event : entry.second)
    {
      source.add_record(
        room->calendar,
        roomhub::availability::ReservationRecord{
          zone.at(date, roomhub::time::parse_time_of_day(
            event["start"].as<std::string>())),
          zone.at(date, roomhub::time::parse_time_of_day(
            event["finish"].as<std::string>())),
          event["summary"] ? event["summary"].as<std::string>() : "",
          ""
        });
    }
  }

  return date;
}

//==============================================================================
void print_grid(
  const roomhub::Service& service,
  const roomhub::availability::DayAvailability& day)
{
  const auto& config = service.configuration();
  const auto& zone = config.time_zone();
  const SlotGrid grid(service.window(day.date));

  std::cout << "\n" << day.date << "\n      ";
  for (const auto& room : config.rooms())
    std::cout << std::left << std::setw(20) << room.display_name;
  std::cout << "\n";

  // For each room and slot, the text of the cell
  std::vector<std::vector<std::string>> cells;
  for (const auto& snapshot : day.rooms)
  {
    std::vector<std::string> column(grid.size());
    if (snapshot.error)
    {
      column.assign(grid.size(), "(" + *snapshot.error + ")");
      cells.push_back(std::move(column));
      continue;
    }

    for (std::size_t i = 0; i < grid.size(); ++i)
      column[i] = grid.bookable(i, snapshot.busy_blocks) ? "." : "";

    for (const auto& span : grid.spans(snapshot.busy_blocks))
    {
      const auto& block = snapshot.busy_blocks[span.block];
      column[span.first_slot] = "# " + block.label;
      for (std::size_t k = 1; k < span.slot_count; ++k)
        column[span.first_slot + k] = "|";
    }

    cells.push_back(std::move(column));
  }

  for (std::size_t i = 0; i < grid.size(); ++i)
  {
    std::cout << std::left << std::setw(6) << grid.label(i, zone);
    for (const auto& column : cells)
      std::cout << std::left << std::setw(20) << column[i];
    std::cout << "\n";
  }

  for (const auto& snapshot : day.rooms)
  {
    std::cout << snapshot.room << ": ";
    if (snapshot.free_now)
      std::cout << "free now";
    else if (snapshot.next_available)
      std::cout << "busy until " << zone.clock_label(*snapshot.next_available);
    else
      std::cout << "not available";
    std::cout << "\n";
  }
}

//==============================================================================
int main(int argc, char* argv[])
{
  if (argc < 3)
  {
    std::cerr << "Usage: " << argv[0] << " <config.yaml> <events.yaml>"
              << std::endl;
    return 1;
  }

  auto log = spdlog::stdout_color_mt("roomhub");
  log->set_level(spdlog::level::debug);

  try
  {
    auto config = roomhub::Configuration::from_file(argv[1]);
    config.apply_environment();

    auto source = std::make_shared<roomhub::calendar::InMemoryCalendar>();
    const std::string date = load_events(argv[2], config, *source);

    // Pretend that it is half past ten on the day of the fixture
    const roomhub::Time now = config.time_zone().at(
      date, roomhub::time::parse_time_of_day("10:30"));

    roomhub::Service service(
      config, source, nullptr, [now]() { return now; });

    print_grid(service, *service.availability(date));

    // Book the first free hour of the first room
    const auto& room = config.rooms().front();
    const auto first = service.availability(date)->find(room.name);
    const SlotGrid grid(service.window(date));

    for (std::size_t i = 0; i < grid.size(); ++i)
    {
      if (!grid.bookable(i, first->busy_blocks))
        continue;

      roomhub::Service::BookingRequest request;
      request.room = room.name;
      request.start = grid.slot_start(i);
      request.duration_minutes = 60;
      request.label = "Planning";

      const auto outcome = service.book(request);
      std::cout << "\n" << outcome.message << "\n";
      if (outcome.accepted)
        break;
    }

    print_grid(service, *service.availability(date));
  }
  catch (const std::exception& e)
  {
    log->error("{}", e.what());
    return 1;
  }

  return 0;
}
