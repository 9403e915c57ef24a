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
#include "sluice/log/error_mapping_drain.hpp"
#include <cassert>

namespace sluice::log
{

// Map_error_drain implementations.

Map_error_drain::Map_error_drain(Error_mapper mapper, Drain::Ptr inner) :
  m_mapper(std::move(mapper)),
  m_inner(std::move(inner))
{
  assert(!m_mapper.empty());
  assert(m_inner);
}

Drain_error Map_error_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  auto err = m_inner->log(record, fields);
  if (err)
  {
    return m_mapper(err);
  }
  // else
  return err;
}

bool Map_error_drain::is_enabled(Level level) const // Virtual.
{
  return m_inner->is_enabled(level);
}

// Ignore_result_drain implementations.

Ignore_result_drain::Ignore_result_drain(Drain::Ptr inner) :
  m_inner(std::move(inner))
{
  assert(m_inner);
}

Drain_error Ignore_result_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  [[maybe_unused]] const auto err = m_inner->log(record, fields);
  return Drain_error();
}

bool Ignore_result_drain::is_enabled(Level level) const // Virtual.
{
  return m_inner->is_enabled(level);
}

} // namespace sluice::log
