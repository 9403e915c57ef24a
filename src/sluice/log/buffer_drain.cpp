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
#include "sluice/log/buffer_drain.hpp"

namespace sluice::log
{

// Implementations.

Buffer_drain::Buffer_drain(bool use_human_friendly_time_stamps) :
  m_os_writer(m_os.os(), use_human_friendly_time_stamps)
{
  // Nothing else.
}

Drain_error Buffer_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  // Prevent simultaneous logging, reading-by-copy.
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);

  // m_os_writer wraps String_ostream, which wraps std::string.  Write the whole record to that std::string.
  return m_os_writer.log(record, fields);
}

const std::string& Buffer_drain::buffer_str() const
{
  return m_os.str(); // (Mutex lock wouldn't help here, even if we used it, as this returns [basically] a pointer.)
}

const std::string Buffer_drain::buffer_str_copy() const
{
  // Prevent simultaneous logging, reading.
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);

  return buffer_str(); // Copy occurs here; then mutex is unlocked.
}

} // namespace sluice::log
