/* Sluice
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "sluice/log/mutex_drain.hpp"
#include <cassert>

namespace sluice::log
{

Mutex_drain::Mutex_drain(Drain::Ptr inner) :
  m_inner(std::move(inner))
{
  assert(m_inner);
}

Drain_error Mutex_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return m_inner->log(record, fields);
}

bool Mutex_drain::is_enabled(Level level) const // Virtual.
{
  return m_inner->is_enabled(level);
}

} // namespace sluice::log
