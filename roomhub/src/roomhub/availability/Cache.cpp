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

#include <roomhub/availability/Cache.hpp>

#include <algorithm>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace roomhub {
namespace availability {

//==============================================================================
class Cache::Implementation
{
public:

  struct Entry
  {
    ConstDayAvailabilityPtr value;
    Time created_at;
    Version version;
  };

  Duration ttl;
  ClockFunction clock;

  mutable std::mutex mutex;
  mutable Version last_version = 0;
  std::unordered_map<std::string, Entry> entries;

  struct Watermark
  {
    Version version;
    Time stamped_at;
  };

  // The most recent invalidation of each date. Watermarks older than the ttl
  // are folded into pruned_at.
  std::unordered_map<std::string, Watermark> invalidated_at;

  // The version stamped on the most recent invalidate_all()
  Version cleared_at = 0;

  // The newest watermark that has been pruned. Tickets at or below it are
  // rejected for every date.
  Version pruned_at = 0;

  Implementation(Duration ttl_, ClockFunction clock_)
  : ttl(ttl_),
    clock(std::move(clock_))
  {
    // Do nothing
  }

  bool fresh(const Entry& entry, const Time now) const
  {
    return now - entry.created_at < ttl;
  }

  void sweep(const Time now)
  {
    for (auto it = entries.begin(); it != entries.end(); )
    {
      if (fresh(it->second, now))
        ++it;
      else
        it = entries.erase(it);
    }

    for (auto it = invalidated_at.begin(); it != invalidated_at.end(); )
    {
      if (now - it->second.stamped_at < ttl)
      {
        ++it;
        continue;
      }

      pruned_at = std::max(pruned_at, it->second.version);
      it = invalidated_at.erase(it);
    }
  }

  bool is_stale(const std::string& date, const Version ticket) const
  {
    if (ticket <= cleared_at || ticket <= pruned_at)
      return true;

    const auto inv = invalidated_at.find(date);
    if (inv != invalidated_at.end() && ticket <= inv->second.version)
      return true;

    const auto existing = entries.find(date);
    if (existing != entries.end() && ticket < existing->second.version)
      return true;

    return false;
  }

  void store(
    const std::string& date,
    ConstDayAvailabilityPtr value,
    const Version version)
  {
    const Time now = clock();
    sweep(now);
    entries[date] = Entry{std::move(value), now, version};
  }
};

//==============================================================================
Duration Cache::default_ttl()
{
  return std::chrono::seconds(60);
}

//==============================================================================
Cache::Cache(const Duration ttl, ClockFunction clock)
: _pimpl(rmf_utils::make_unique_impl<Implementation>(ttl, std::move(clock)))
{
  // Do nothing
}

//==============================================================================
ConstDayAvailabilityPtr Cache::get(const std::string& date) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->entries.find(date);
  if (it == _pimpl->entries.end())
    return nullptr;

  if (!_pimpl->fresh(it->second, _pimpl->clock()))
    return nullptr;

  return it->second.value;
}

//==============================================================================
void Cache::set(const std::string& date, ConstDayAvailabilityPtr value)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->store(date, std::move(value), ++_pimpl->last_version);
}

//==============================================================================
auto Cache::ticket() const -> Version
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return ++_pimpl->last_version;
}

//==============================================================================
bool Cache::set(
  const std::string& date,
  ConstDayAvailabilityPtr value,
  const Version ticket)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  if (_pimpl->is_stale(date, ticket))
    return false;

  _pimpl->store(date, std::move(value), ticket);
  return true;
}

//==============================================================================
void Cache::invalidate(const std::string& date)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const Time now = _pimpl->clock();
  _pimpl->sweep(now);
  _pimpl->entries.erase(date);
  _pimpl->invalidated_at[date] =
    Implementation::Watermark{++_pimpl->last_version, now};
}

//==============================================================================
void Cache::invalidate_all()
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->entries.clear();

  // A single watermark now covers every date
  _pimpl->invalidated_at.clear();
  _pimpl->cleared_at = ++_pimpl->last_version;
}

//==============================================================================
std::size_t Cache::size() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->entries.size();
}

//==============================================================================
std::size_t Cache::invalidations() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->invalidated_at.size();
}

//==============================================================================
Duration Cache::ttl() const
{
  return _pimpl->ttl;
}

} // namespace availability
} // namespace roomhub
