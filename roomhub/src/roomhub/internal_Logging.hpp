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

#ifndef SRC__ROOMHUB__INTERNAL_LOGGING_HPP
#define SRC__ROOMHUB__INTERNAL_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace roomhub {

//==============================================================================
/// The logger used by roomhub. Applications can register a logger named
/// "roomhub" to redirect the output, otherwise the default logger is used.
inline std::shared_ptr<spdlog::logger> logger()
{
  if (auto named = spdlog::get("roomhub"))
    return named;

  return spdlog::default_logger();
}

} // namespace roomhub

#endif // SRC__ROOMHUB__INTERNAL_LOGGING_HPP
