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
#include "sluice/log/atomic_switch_drain.hpp"
#include <cassert>

namespace sluice::log
{

Atomic_switch_drain::Atomic_switch_drain(Drain::Ptr initial) :
  m_inner(std::move(initial))
{
  assert(m_inner.load());
}

Drain_error Atomic_switch_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  // One snapshot for the whole call; a concurrent set() cannot take it away from under us.
  const auto inner = m_inner.load();
  return inner->log(record, fields);
}

bool Atomic_switch_drain::is_enabled(Level level) const // Virtual.
{
  return m_inner.load()->is_enabled(level);
}

void Atomic_switch_drain::set(Drain::Ptr inner)
{
  assert(inner);
  m_inner.store(std::move(inner));
}

Drain::Ptr Atomic_switch_drain::swap(Drain::Ptr inner)
{
  assert(inner);
  return m_inner.exchange(std::move(inner));
}

Drain::Ptr Atomic_switch_drain::get() const
{
  return m_inner.load();
}

} // namespace sluice::log
