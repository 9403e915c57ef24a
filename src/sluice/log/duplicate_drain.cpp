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
#include "sluice/log/duplicate_drain.hpp"
#include <cassert>

namespace sluice::log
{

Duplicate_drain::Duplicate_drain(Drain::Ptr first, Drain::Ptr second) :
  m_first(std::move(first)),
  m_second(std::move(second))
{
  assert(m_first && m_second);
}

Drain_error Duplicate_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  // Careful: no short-circuiting.  The second drain gets the record even if the first failed (or threw).
  const auto err1 = log_contained(m_first.get(), record, fields);
  const auto err2 = log_contained(m_second.get(), record, fields);
  return Drain_error::aggregate(err1, err2);
}

bool Duplicate_drain::is_enabled(Level level) const // Virtual.
{
  return m_first->is_enabled(level) || m_second->is_enabled(level);
}

} // namespace sluice::log
