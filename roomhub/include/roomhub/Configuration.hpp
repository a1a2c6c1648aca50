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

#ifndef ROOMHUB__CONFIGURATION_HPP
#define ROOMHUB__CONFIGURATION_HPP

#include <roomhub/Time.hpp>
#include <roomhub/TimeZone.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML {
class Node;
} // namespace YAML

namespace roomhub {

//==============================================================================
/// Thrown when the configuration or credentials of a deployment are missing
/// or malformed.
class configuration_error : public std::runtime_error
{
public:

  explicit configuration_error(const std::string& what);
};

//==============================================================================
/// The settings of a roomhub deployment.
class Configuration
{
public:

  /// A bookable room and the external calendar that holds its reservations.
  struct Room
  {
    /// The identity used by requests, e.g. "talking".
    std::string name;

    /// The identity of the external calendar.
    std::string calendar;

    /// The name shown to people, e.g. "Talking Room".
    std::string display_name;
  };

  /// The account used to access the external calendars.
  struct Credentials
  {
    std::string client_email;
    std::string private_key;

    /// An optional account to act on behalf of.
    std::string subject;
  };

  /// The default operating zone, New Zealand time.
  static const std::string& default_time_zone();

  /// Construct a configuration with default values and no rooms.
  Configuration();

  /// Parse a configuration from a YAML document.
  ///
  /// \throws configuration_error if the document is malformed.
  static Configuration from_yaml(const YAML::Node& node);

  /// Load and parse a YAML configuration file.
  ///
  /// \throws configuration_error if the file cannot be read or is malformed.
  static Configuration from_file(const std::string& path);

  /// Override settings with the TIMEZONE, BOOKING_WINDOW_START and
  /// BOOKING_WINDOW_END environment variables, when they are set.
  ///
  /// \throws configuration_error if a variable holds an invalid value.
  Configuration& apply_environment();

  /// The operating time zone.
  const TimeZone& time_zone() const;
  Configuration& time_zone(TimeZone zone);

  /// The time of day when rooms open.
  Duration window_open() const;
  Configuration& window_open(Duration open);

  /// The time of day when rooms close.
  Duration window_close() const;
  Configuration& window_close(Duration close);

  /// How long computed availability stays cached.
  Duration cache_ttl() const;
  Configuration& cache_ttl(Duration ttl);

  /// How long to wait for one calendar to answer before giving up.
  Duration fetch_timeout() const;
  Configuration& fetch_timeout(Duration timeout);

  /// The configured rooms, in display order.
  const std::vector<Room>& rooms() const;
  Configuration& add_room(Room room);

  /// Find a room by name.
  const Room* find_room(const std::string& name) const;

  /// The calendar credentials, if any were given.
  const std::optional<Credentials>& credentials() const;
  Configuration& credentials(std::optional<Credentials> credentials);

  /// Check that the configuration can serve requests.
  ///
  /// \throws configuration_error if no rooms are configured, the window is
  /// empty, or the credentials are missing or malformed.
  void validate() const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace roomhub

#endif // ROOMHUB__CONFIGURATION_HPP
