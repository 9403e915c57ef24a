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
#include "sluice/log/ostream_drain.hpp"
#include "sluice/log/ostream_record_writer.hpp"

namespace sluice::log
{

// Implementations.

Ostream_drain::Ostream_drain(std::ostream& os, std::ostream& os_for_err, bool use_human_friendly_time_stamps)
{
  // If stream is same for both types of records, use one writer for both; then its state is saved/restored 1x only.
  m_os_writers[0] = boost::make_shared<Ostream_record_writer>(os, use_human_friendly_time_stamps);
  m_os_writers[1]
    = (&os == &os_for_err)
        ? m_os_writers[0]
        : boost::make_shared<Ostream_record_writer>(os_for_err, use_human_friendly_time_stamps);
}

Drain_error Ostream_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  /* Prevent simultaneous logging.  One mutex, even for 2 different streams: they may well lead to the same device
   * (think 2>&1), and the point is to avoid interleaving. */
  util::Lock_guard<decltype(m_log_mutex)> lock(m_log_mutex);

  // This blocks the calling thread for however long the writing takes.  Hence Async_drain.
  return m_os_writers[(record.m_level > Level::S_WARNING) ? 0 : 1]->log(record, fields);
}

} // namespace sluice::log
