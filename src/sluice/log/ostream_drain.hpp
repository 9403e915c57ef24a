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
#include <boost/array.hpp>
#include <iostream>

namespace sluice::log
{

// Types.

/**
 * Drain that writes each record as one human-readable line (see Ostream_record_writer for the format) to one of two
 * given `ostream`s: WARNING and more severe records to the "error" stream; the rest to the other.  E.g., `cerr` and
 * `cout`.  Both may be the same stream.  Never filters: wrap it in a Filter_level_drain (etc.) for that.
 *
 * Suitable for console output, and in a pinch for file output; for heavy-duty output put it behind an Async_drain,
 * so that logging threads do not block on the I/O.
 *
 * ### Thread safety ###
 * Concurrent log() calls on the same `*this` write serially to each other (one mutex, even if the 2 streams
 * differ: they may well lead to the same terminal).  Do not access the streams from elsewhere, including another
 * Ostream_drain, while `*this` may be logging: the writer uses stateful formatters.
 *
 * ### Errors ###
 * log() reports log::error::Code::S_IO_FAILURE if the stream is in a failed state after writing.  The stream stays
 * that way until someone clears it; so every subsequent record will fail too.
 */
class Ostream_drain :
  public Drain
{
public:
  // Constructors/destructor.

  /**
   * Constructs the drain.
   *
   * @param os
   *        Stream for INFO and less severe records; must outlive `*this`.
   * @param os_for_err
   *        Stream for WARNING and more severe records; must outlive `*this`.
   * @param use_human_friendly_time_stamps
   *        See Ostream_record_writer.
   */
  explicit Ostream_drain(std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr,
                         bool use_human_friendly_time_stamps = true);

  // Methods.

  /**
   * Implements interface method by writing the record to the appropriate stream.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields; all realized.
   * @return See class doc header.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

private:
  // Types.

  /// Short-hand for ref-counted pointer to a given Ostream_record_writer.  See #m_os_writers for why ref-counted.
  using Ostream_record_writer_ptr = boost::shared_ptr<Ostream_record_writer>;

  // Data.

  /**
   * Stream writers via which to log records, each element corresponding to a certain set of possible levels (as of
   * this writing, [0] is for INFO and less severe; [1] is for the rest).  If the 2 streams are the same, the 2
   * pointers point to the same writer.  Hence ref-counted: the writer is destroyed once.
   */
  boost::array<Ostream_record_writer_ptr, 2> m_os_writers;

  /// Mutex protecting against concurrent writing via #m_os_writers.
  util::Mutex_non_recursive m_log_mutex;
}; // class Ostream_drain

} // namespace sluice::log
