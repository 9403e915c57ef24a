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
#include "sluice/common.hpp"
#include <string>
#include <utility>
#include <vector>

namespace sluice::test
{

/**
 * Drain used for testing purposes: remembers a copy of everything it is given (the fields realized, in order), and
 * returns a configurable result.  Thread-safe.
 */
class Test_drain :
  public log::Drain
{
public:
  /// What was captured per log() call.
  struct Entry
  {
    /// Record::m_level.
    log::Level m_level;
    /// Copy of Record::m_msg.
    std::string m_msg;
    /// Copy of Record::m_module.
    std::string m_module;
    /// Copy of Record::m_src_file.
    std::string m_src_file;
    /// Record::m_src_line.
    unsigned int m_src_line;
    /// Record::m_call_thread_id.
    util::Thread_id m_call_thread_id;
    /// The fields, realized, in Field_seq order; empty if the drain was told not to realize.
    std::vector<std::pair<std::string, log::Scalar>> m_fields;
  };

  /**
   * Constructor.
   *
   * @param realize_fields
   *        If `false` the fields are not touched at all (so lazy values stay unevaluated).
   * @param min_level
   *        is_enabled() returns `true` only for levels at least this severe.
   */
  explicit Test_drain(bool realize_fields = true, log::Level min_level = log::Level::S_TRACE) :
    m_realize_fields(realize_fields),
    m_min_level(min_level)
  {
    // Nothing else.
  }

  /// Captures the record; returns the result set via fail_with() (success by default).
  log::Drain_error log(const log::Record& record, const log::Field_seq& fields) override
  {
    Entry entry{ record.m_level, std::string(record.m_msg), std::string(record.m_module),
                 std::string(record.m_src_file), record.m_src_line, record.m_call_thread_id, {} };
    if (m_realize_fields)
    {
      for (const auto& kv : fields)
      {
        entry.m_fields.emplace_back(std::string(kv.m_key), fields.realize(kv.m_value, record));
      }
    }

    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    m_entries.push_back(std::move(entry));
    return m_result;
  }

  /// Forwards to log::level_passes() against the min_level given to ctor.
  bool is_enabled(log::Level level) const override
  {
    return log::level_passes(level, m_min_level);
  }

  /**
   * Makes subsequent log() calls return the given code.
   *
   * @param err_code
   *        Code; falsy to succeed again.
   */
  void fail_with(const Error_code& err_code)
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    m_result = err_code;
  }

  /**
   * Returns copy of what was captured so far.
   * @return See above.
   */
  std::vector<Entry> entries() const
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    return m_entries;
  }

  /**
   * Returns number of log() calls so far.
   * @return See above.
   */
  size_t count() const
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    return m_entries.size();
  }

  /**
   * Returns the keys of the captured fields of the given entry, in order.
   *
   * @param entry
   *        An entry.
   * @return See above.
   */
  static std::vector<std::string> keys(const Entry& entry)
  {
    std::vector<std::string> result;
    for (const auto& field : entry.m_fields)
    {
      result.push_back(field.first);
    }
    return result;
  }

private:
  /// See ctor.
  const bool m_realize_fields;

  /// See ctor.
  const log::Level m_min_level;

  /// Protects the below.
  mutable util::Mutex_non_recursive m_mutex;

  /// See fail_with().
  Error_code m_result;

  /// See entries().
  std::vector<Entry> m_entries;
}; // class Test_drain

/**
 * Returns a Record suitable for calling Drain::log() directly, with fixed source location and the current time and
 * thread.  The strings must outlive the Record.
 *
 * @param level
 *        Level.
 * @param msg
 *        Message.
 * @param module
 *        Module.
 * @return See above.
 */
inline log::Record test_record(log::Level level, util::String_view msg = "test message",
                               util::String_view module = "test")
{
  return log::Record(level, msg, "test_drain.hpp", 1, 0, "test_record", module,
                     boost::chrono::system_clock::now(), util::this_thread::get_id());
}

} // namespace sluice::test
