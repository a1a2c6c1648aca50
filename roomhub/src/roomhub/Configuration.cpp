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

#include <roomhub/Configuration.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <unordered_set>
#include <utility>

namespace roomhub {

namespace {

//==============================================================================
std::string scalar(const YAML::Node& node, const std::string& key)
{
  const YAML::Node value = node[key];
  if (!value || !value.IsScalar())
  {
    throw configuration_error(
      "[Configuration::from_yaml] Expected a value for [" + key + "]");
  }

  return value.as<std::string>();
}

//==============================================================================
std::string optional_scalar(
  const YAML::Node& node,
  const std::string& key,
  const std::string& fallback)
{
  if (!node[key])
    return fallback;

  return scalar(node, key);
}

//==============================================================================
Duration time_of_day(const std::string& text, const std::string& key)
{
  try
  {
    return time::parse_time_of_day(text);
  }
  catch (const std::invalid_argument& e)
  {
    throw configuration_error(
      "[Configuration] Invalid value for [" + key + "]: " + e.what());
  }
}

//==============================================================================
TimeZone zone_from(const std::string& spec)
{
  try
  {
    return TimeZone(spec);
  }
  catch (const std::invalid_argument& e)
  {
    throw configuration_error(
      std::string("[Configuration] Invalid time zone: ") + e.what());
  }
}

//==============================================================================
Duration seconds(const YAML::Node& node, const std::string& key)
{
  const long value = node[key].as<long>();
  if (value <= 0)
  {
    throw configuration_error(
      "[Configuration::from_yaml] [" + key + "] must be positive");
  }

  return std::chrono::seconds(value);
}

//==============================================================================
// Keys are often stored with their line breaks escaped, e.g. in environment
// variables or single line YAML strings.
std::string unescape_newlines(std::string key)
{
  std::size_t pos = 0;
  while ((pos = key.find("\\n", pos)) != std::string::npos)
  {
    key.replace(pos, 2, "\n");
    ++pos;
  }

  return key;
}

} // anonymous namespace

//==============================================================================
configuration_error::configuration_error(const std::string& what)
: std::runtime_error(what)
{
  // Do nothing
}

//==============================================================================
class Configuration::Implementation
{
public:

  TimeZone zone = TimeZone(default_time_zone());
  Duration open = std::chrono::hours(9);
  Duration close = std::chrono::hours(18);
  Duration ttl = std::chrono::seconds(60);
  Duration timeout = std::chrono::seconds(10);
  std::vector<Room> rooms;
  std::optional<Credentials> credentials;

};

//==============================================================================
const std::string& Configuration::default_time_zone()
{
  static const std::string zone = "NZST+12NZDT,M9.5.0/02:00,M4.1.0/03:00";
  return zone;
}

//==============================================================================
Configuration::Configuration()
: _pimpl(rmf_utils::make_impl<Implementation>())
{
  // Do nothing
}

//==============================================================================
Configuration Configuration::from_yaml(const YAML::Node& node)
{
  if (!node.IsMap())
  {
    throw configuration_error(
      "[Configuration::from_yaml] The configuration must be a YAML map");
  }

  Configuration config;
  try
  {
    if (node["timezone"])
      config.time_zone(zone_from(scalar(node, "timezone")));

    if (const YAML::Node window = node["window"])
    {
      if (!window.IsMap())
      {
        throw configuration_error(
          "[Configuration::from_yaml] [window] must be a map");
      }

      if (window["open"])
        config.window_open(time_of_day(scalar(window, "open"), "window.open"));

      if (window["close"])
      {
        config.window_close(
          time_of_day(scalar(window, "close"), "window.close"));
      }
    }

    if (node["cache_ttl_seconds"])
      config.cache_ttl(seconds(node, "cache_ttl_seconds"));

    if (node["fetch_timeout_seconds"])
      config.fetch_timeout(seconds(node, "fetch_timeout_seconds"));

    if (const YAML::Node rooms = node["rooms"])
    {
      if (!rooms.IsSequence())
      {
        throw configuration_error(
          "[Configuration::from_yaml] [rooms] must be a list");
      }

      for (const auto& room : rooms)
      {
        const std::string name = scalar(room, "name");
        config.add_room(
          Room{
            name,
            scalar(room, "calendar"),
            optional_scalar(room, "display", name)
          });
      }
    }

    if (const YAML::Node credentials = node["credentials"])
    {
      config.credentials(
        Credentials{
          optional_scalar(credentials, "client_email", ""),
          unescape_newlines(optional_scalar(credentials, "private_key", "")),
          optional_scalar(credentials, "subject", "")
        });
    }
  }
  catch (const YAML::Exception& e)
  {
    throw configuration_error(
      std::string("[Configuration::from_yaml] Malformed configuration: ")
      + e.what());
  }

  return config;
}

//==============================================================================
Configuration Configuration::from_file(const std::string& path)
{
  YAML::Node node;
  try
  {
    node = YAML::LoadFile(path);
  }
  catch (const YAML::Exception& e)
  {
    throw configuration_error(
      "[Configuration::from_file] Unable to load [" + path + "]: " + e.what());
  }

  return from_yaml(node);
}

//==============================================================================
Configuration& Configuration::apply_environment()
{
  if (const char* zone = std::getenv("TIMEZONE"))
    time_zone(zone_from(zone));

  if (const char* open = std::getenv("BOOKING_WINDOW_START"))
    window_open(time_of_day(open, "BOOKING_WINDOW_START"));

  if (const char* close = std::getenv("BOOKING_WINDOW_END"))
    window_close(time_of_day(close, "BOOKING_WINDOW_END"));

  return *this;
}

//==============================================================================
const TimeZone& Configuration::time_zone() const
{
  return _pimpl->zone;
}

//==============================================================================
Configuration& Configuration::time_zone(TimeZone zone)
{
  _pimpl->zone = std::move(zone);
  return *this;
}

//==============================================================================
Duration Configuration::window_open() const
{
  return _pimpl->open;
}

//==============================================================================
Configuration& Configuration::window_open(const Duration open)
{
  _pimpl->open = open;
  return *this;
}

//==============================================================================
Duration Configuration::window_close() const
{
  return _pimpl->close;
}

//==============================================================================
Configuration& Configuration::window_close(const Duration close)
{
  _pimpl->close = close;
  return *this;
}

//==============================================================================
Duration Configuration::cache_ttl() const
{
  return _pimpl->ttl;
}

//==============================================================================
Configuration& Configuration::cache_ttl(const Duration ttl)
{
  _pimpl->ttl = ttl;
  return *this;
}

//==============================================================================
Duration Configuration::fetch_timeout() const
{
  return _pimpl->timeout;
}

//==============================================================================
Configuration& Configuration::fetch_timeout(const Duration timeout)
{
  _pimpl->timeout = timeout;
  return *this;
}

//==============================================================================
const std::vector<Configuration::Room>& Configuration::rooms() const
{
  return _pimpl->rooms;
}

//==============================================================================
Configuration& Configuration::add_room(Room room)
{
  _pimpl->rooms.push_back(std::move(room));
  return *this;
}

//==============================================================================
auto Configuration::find_room(const std::string& name) const -> const Room*
{
  for (const auto& room : _pimpl->rooms)
  {
    if (room.name == name)
      return &room;
  }

  return nullptr;
}

//==============================================================================
auto Configuration::credentials() const -> const std::optional<Credentials>&
{
  return _pimpl->credentials;
}

//==============================================================================
Configuration& Configuration::credentials(
  std::optional<Credentials> credentials)
{
  _pimpl->credentials = std::move(credentials);
  return *this;
}

//==============================================================================
void Configuration::validate() const
{
  if (_pimpl->rooms.empty())
  {
    throw configuration_error(
      "[Configuration::validate] No rooms are configured");
  }

  std::unordered_set<std::string> names;
  for (const auto& room : _pimpl->rooms)
  {
    if (room.name.empty() || room.calendar.empty())
    {
      throw configuration_error(
        "[Configuration::validate] Every room needs a name and a calendar");
    }

    if (!names.insert(room.name).second)
    {
      throw configuration_error(
        "[Configuration::validate] Room [" + room.name + "] is configured "
        "more than once");
    }
  }

  if (!(_pimpl->open < _pimpl->close))
  {
    throw configuration_error(
      "[Configuration::validate] The booking window must open before it "
      "closes");
  }

  if (!_pimpl->credentials.has_value())
  {
    throw configuration_error(
      "[Configuration::validate] Calendar credentials are not configured");
  }

  const auto& credentials = *_pimpl->credentials;
  if (credentials.client_email.find('@') == std::string::npos
    || credentials.private_key.empty())
  {
    throw configuration_error(
      "[Configuration::validate] Calendar credentials are malformed: a client "
      "email address and a private key are required");
  }
}

} // namespace roomhub
