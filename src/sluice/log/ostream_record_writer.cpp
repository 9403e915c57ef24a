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
#include "sluice/log/ostream_record_writer.hpp"
#include "sluice/log/ostream_serializer.hpp"
#include "sluice/log/error/error.hpp"
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <cassert>
#include <iomanip>

namespace sluice::log
{

// Static initializations.

const std::vector<util::String_view> Ostream_record_writer::S_LEVEL_STRS({ "null", // Never used (sentinel).
                                                                           "crit", "eror", "warn",
                                                                           "info", "debg", "trce" });

// Implementations.

Ostream_record_writer::Ostream_record_writer(std::ostream& os, bool use_human_friendly_time_stamps) :
  m_do_log_func(use_human_friendly_time_stamps
                  ? (&Ostream_record_writer::do_log_with_human_friendly_time_stamp)
                  : (&Ostream_record_writer::do_log_with_epoch_time_stamp)),
  m_os(os),
  m_clean_os_state(m_os), // Memorize this before any messing with formatting.
  m_last_human_friendly_time_stamp_str_sz(0)
{
  using std::setfill;

  /* The ostream here is unrelated to the one used to build the message in the first place; so formatters we set
   * here cannot affect the user's messages.  They would affect other users of m_os; but we've been promised there are
   * none until we're destroyed, at which point m_clean_os_state restores everything. */
  if (!use_human_friendly_time_stamps)
  {
    m_os << setfill('0');
  }
}

Ostream_record_writer::~Ostream_record_writer() noexcept
{
  // m_clean_os_state dtor auto-restores any formatting changes we'd made to m_os.
}

Error_code Ostream_record_writer::log(const Record& record, const Field_seq& fields)
{
  return m_do_log_func(this, record, fields);
}

Ostream_record_writer::Std_time_point
  Ostream_record_writer::to_std_time_point(const boost::chrono::system_clock::time_point& time_stamp) // Static.
{
  using std::chrono::nanoseconds;
  using std::chrono::duration_cast;

  const auto nsec = boost::chrono::duration_cast<boost::chrono::nanoseconds>(time_stamp.time_since_epoch());
  return Std_time_point(duration_cast<Std_time_point::duration>(nanoseconds(nsec.count())));
}

Error_code Ostream_record_writer::do_log_with_epoch_time_stamp(const Record& record, const Field_seq& fields)
{
  using std::setw;
  using boost::chrono::duration_cast;
  using boost::chrono::microseconds;

  /* POSIX time stamp: ubiquitous (if not 100% unambiguous, due to leap seconds).  Show as seconds.microseconds with
   * padding.  The clock may well be more precise than microseconds; but SSSSSS000-style output is not useful. */
  const auto usec_since_epoch = duration_cast<microseconds>(record.m_called_when.time_since_epoch()).count();
  const microseconds::rep sec = usec_since_epoch / 1000000;
  const microseconds::rep usec = usec_since_epoch % 1000000;

  // We've already set 0 as fill character.  setw(6) affects only one <<.
  m_os << sec << '.'
       << setw(6) << usec << ' ';

  return log_past_time_stamp(record, fields);
}

Error_code Ostream_record_writer::do_log_with_human_friendly_time_stamp(const Record& record, const Field_seq& fields)
{
  using util::String_view;
  using std::chrono::time_point_cast;
  using std::chrono::seconds;
  using std::chrono::system_clock;

  // Offset from start of human-friendly time stamp output, where the seconds.subseconds output begins.
  constexpr size_t SECONDS_START = S_HUMAN_FRIENDLY_TIME_STAMP_MIN_SZ_TEMPLATE.size();

  const auto called_when = to_std_time_point(record.m_called_when);

  // See class doc header Impl section.
  const auto rounded_time_stamp = time_point_cast<seconds>(called_when);
  if (m_cached_rounded_time_stamp != rounded_time_stamp)
  {
    /* Re-output the whole thing.  localtime() gives the present time zone but only whole seconds; so take %S, with
     * its sub-second part, from the full-precision time point. */
    const auto end = fmt::format_to(m_last_human_friendly_time_stamp_str.begin(),
                                    "{0:%Y-%m-%d %H:%M:}{1:%S} {0:%z} ",
                                    fmt::localtime(system_clock::to_time_t(called_when)),
                                    called_when);
    *end = '\0'; // Perhaps unnecessary, but it's cheap enough and nice for debugging.

    m_cached_rounded_time_stamp = rounded_time_stamp;
    m_last_human_friendly_time_stamp_str_sz = end - m_last_human_friendly_time_stamp_str.begin();
  }
  else
  {
    // m_last_human_friendly_time_stamp_str_sz is already correct, except the %S part needs to be overwritten.
    fmt::format_to(m_last_human_friendly_time_stamp_str.begin() + SECONDS_START, "{:%S}", called_when);
  }

  m_os << String_view(m_last_human_friendly_time_stamp_str.data(), m_last_human_friendly_time_stamp_str_sz);

  return log_past_time_stamp(record, fields);
}

Error_code Ostream_record_writer::log_past_time_stamp(const Record& record, const Field_seq& fields)
{
  using std::flush;

  // time_stamp [<levl>]: T<thread ID>: <module>: <file>:<function>(<line>): <msg> {<fields>}

  assert((record.m_level != Level::S_NONE) && (record.m_level < Level::S_END_SENTINEL));

  m_os << '[' << S_LEVEL_STRS[static_cast<size_t>(record.m_level)] << "]: T" << record.m_call_thread_id << ": ";
  if (!record.m_module.empty())
  {
    m_os << record.m_module << ": ";
  }
  m_os << SLUICE_UTIL_WHERE_AM_I_FROM_ARGS(record.m_src_file, record.m_src_function, record.m_src_line)
       << ": "
       << record.m_msg;

  Error_code err_code;
  if (!fields.empty())
  {
    Ostream_serializer serializer(m_os);
    m_os << " {";
    err_code = fields.serialize(record, &serializer);
    m_os << '}';
  }

  m_os << '\n' << flush;

  if (!m_os)
  {
    return error::Code::S_IO_FAILURE;
  }
  // else
  return err_code;
}

} // namespace sluice::log
