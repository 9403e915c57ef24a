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
#include <boost/io/ios_state.hpp>
#include <array>
#include <chrono>
#include <ostream>
#include <vector>

namespace sluice::log
{

// Types.

/**
 * Utility class, each object of which wraps a given `ostream` and outputs complete log records to it, one per line,
 * in a human-readable format.  It is the formatter behind Ostream_drain and Buffer_drain; a user Drain that
 * writes to some other stream-like destination may use it as well.
 *
 * The format is:
 *
 *   ~~~
 *   <time stamp> [<levl>]: T<thread ID>: <module>: <file>:<function>(<line>): <message> {<key>=<value>, ...}
 *   ~~~
 *
 * The `<module>: ` part is omitted when the module is empty; the ` {...}` part when there are no fields.
 * The fields are realized and written via an Ostream_serializer, in Field_seq order.
 *
 * The time stamp is either `<seconds>.<microseconds>` since the POSIX epoch (compact; sorts and diffs easily) or a
 * human-friendly local time such as `2026-10-19 13:04:05.123456789 +0200`, per ctor arg.
 *
 * ### Thread safety ###
 * None.  One thread at a time, and nobody else touching the `ostream` concurrently; Ostream_drain and Buffer_drain
 * use a mutex for that.
 *
 * @internal
 * ### Impl ###
 * Formatting the human-friendly time stamp is relatively expensive, yet all but the seconds part only changes
 * once a minute.  So we remember the last one we formatted, and as long as the whole-seconds value is the same we
 * re-format only the seconds part, splicing it into the remembered string.  fmt does the formatting, as it can be
 * told to format directly into our buffer.
 */
class Ostream_record_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.  `os` formatting state is saved now and restored in the destructor; it must not be used
   * by anyone else in the meantime.
   *
   * @param os
   *        Stream to which to write; must outlive `*this`.
   * @param use_human_friendly_time_stamps
   *        See class doc header.
   */
  explicit Ostream_record_writer(std::ostream& os, bool use_human_friendly_time_stamps = true);

  /// Restores the `ostream` formatting state saved in the ctor.
  ~Ostream_record_writer() noexcept;

  // Methods.

  /**
   * Writes the given record, with fields, as one line; flushes.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields; realized here.
   * @return Falsy on success; log::error::Code::S_IO_FAILURE if the stream is in a failed state after writing; or
   *         any failure to encode a field.
   */
  Error_code log(const Record& record, const Field_seq& fields);

private:
  // Types.

  /// Short-hand for the std.chrono time point fmt formats; the equivalent of Record::m_called_when.
  using Std_time_point = std::chrono::system_clock::time_point;

  // Constants.

  /// Mapping from Level to the 4-character string for that Level.  Indexed by the Level `enum` value.
  static const std::vector<util::String_view> S_LEVEL_STRS;

  /// Example of the longest possible human-friendly time stamp, up to but excluding the seconds part.
  static constexpr util::String_view S_HUMAN_FRIENDLY_TIME_STAMP_MIN_SZ_TEMPLATE = "2026-10-19 13:04:";

  /// Example of the rest of the human-friendly time stamp (longest possible).
  static constexpr util::String_view S_HUMAN_FRIENDLY_TIME_STAMP_REST_SZ_TEMPLATE = "05.123456789 +0200 ";

  // Methods.

  /**
   * Converts a Record time stamp to its std.chrono equivalent.
   *
   * @param time_stamp
   *        Time stamp.
   * @return See above.
   */
  static Std_time_point to_std_time_point(const boost::chrono::system_clock::time_point& time_stamp);

  /**
   * Writes the time stamp as `sec.usec ` since the epoch; then log_past_time_stamp().
   *
   * @param record
   *        See log().
   * @param fields
   *        See log().
   * @return See log().
   */
  Error_code do_log_with_epoch_time_stamp(const Record& record, const Field_seq& fields);

  /**
   * Writes the human-friendly time stamp; then log_past_time_stamp().
   *
   * @param record
   *        See log().
   * @param fields
   *        See log().
   * @return See log().
   */
  Error_code do_log_with_human_friendly_time_stamp(const Record& record, const Field_seq& fields);

  /**
   * Writes everything after the time stamp.
   *
   * @param record
   *        See log().
   * @param fields
   *        See log().
   * @return See log().
   */
  Error_code log_past_time_stamp(const Record& record, const Field_seq& fields);

  // Data.

  /// Points to do_log_with_epoch_time_stamp() or do_log_with_human_friendly_time_stamp(), per ctor arg.
  const Function<Error_code (Ostream_record_writer*, const Record&, const Field_seq&)> m_do_log_func;

  /// Reference to stream to which to log messages.
  std::ostream& m_os;

  /// Formatter state of #m_os at construction.  Used at least in the destructor to restore it.
  boost::io::ios_all_saver m_clean_os_state;

  /// The last human-friendly time stamp we formatted, sans NUL; the first #m_last_human_friendly_time_stamp_str_sz chars.
  std::array<char,
             S_HUMAN_FRIENDLY_TIME_STAMP_MIN_SZ_TEMPLATE.size() + S_HUMAN_FRIENDLY_TIME_STAMP_REST_SZ_TEMPLATE.size() + 1>
    m_last_human_friendly_time_stamp_str;

  /// See #m_last_human_friendly_time_stamp_str.
  size_t m_last_human_friendly_time_stamp_str_sz;

  /// Whole-seconds value of the time stamp when #m_last_human_friendly_time_stamp_str was fully formatted.
  std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds> m_cached_rounded_time_stamp;
}; // class Ostream_record_writer

} // namespace sluice::log
