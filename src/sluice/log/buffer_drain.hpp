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
#pragma once

#include "sluice/log/log.hpp"
#include "sluice/log/ostream_record_writer.hpp"
#include "sluice/util/string_ostream.hpp"

namespace sluice::log
{

// Types.

/**
 * Drain that writes each record (in the Ostream_record_writer format) to an internal, ever-growing `string`, which
 * can be read via buffer_str() or buffer_str_copy().  Meant for tests and for short-lived tools that want to show the
 * log only at the end; there is no way to clear the buffer.
 *
 * ### Thread safety ###
 * Concurrent log() calls are serialized.  buffer_str_copy() is safe to call concurrently with log(); buffer_str()
 * is not (it returns a reference into the buffer).
 */
class Buffer_drain :
  public Drain
{
public:
  // Constructors/destructor.

  /**
   * Constructs the drain with an empty buffer.
   *
   * @param use_human_friendly_time_stamps
   *        See Ostream_record_writer.
   */
  explicit Buffer_drain(bool use_human_friendly_time_stamps = true);

  // Methods.

  /**
   * Implements interface method by writing the record to the buffer.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields; all realized.
   * @return Falsy, unless a field fails to encode.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Read-only access to the buffer.  Not safe while log() may be executing; see class doc header.
   * @return See above.
   */
  const std::string& buffer_str() const;

  /**
   * Returns a copy of the buffer.  Safe while log() may be executing.
   * @return See above.
   */
  const std::string buffer_str_copy() const;

private:
  // Data.

  /// The buffer, wrapped in an `ostream`.
  util::String_ostream m_os;

  /// Writes to #m_os.
  Ostream_record_writer m_os_writer;

  /// Mutex protecting against concurrent writing to (and copying of) the buffer.
  mutable util::Mutex_non_recursive m_log_mutex;
}; // class Buffer_drain

} // namespace sluice::log
