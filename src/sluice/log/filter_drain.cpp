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
#include "sluice/log/filter_drain.hpp"
#include <cassert>

namespace sluice::log
{

// Filter_drain implementations.

Filter_drain::Filter_drain(Predicate predicate, Drain::Ptr inner) :
  m_predicate(std::move(predicate)),
  m_inner(std::move(inner))
{
  assert(!m_predicate.empty());
  assert(m_inner);
}

Drain_error Filter_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  if (!m_predicate(record))
  {
    return Drain_error();
  }
  // else
  return m_inner->log(record, fields);
}

bool Filter_drain::is_enabled(Level level) const // Virtual.
{
  return m_inner->is_enabled(level);
}

// Filter_level_drain implementations.

Filter_level_drain::Filter_level_drain(Level min_level, Drain::Ptr inner) :
  m_min_level(min_level),
  m_inner(std::move(inner))
{
  assert(m_inner);
}

Drain_error Filter_level_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  if (!level_passes(record.m_level, m_min_level))
  {
    return Drain_error();
  }
  // else
  return m_inner->log(record, fields);
}

bool Filter_level_drain::is_enabled(Level level) const // Virtual.
{
  return level_passes(level, m_min_level) && m_inner->is_enabled(level);
}

} // namespace sluice::log
