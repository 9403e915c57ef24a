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

#include "sluice/util/util_fwd.hpp"
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace sluice::util
{

/**
 * An `ostream` appending to a `std::string` that can be read in place, without the copy `ostringstream::str()`
 * makes.  The log macros build each record's message in one; Buffer_drain keeps its whole output in one.
 *
 * Writes to os() are buffered.  str() and str_clear() see only what has been flushed; str_view() flushes first.
 *
 * Not safe for concurrent use.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the stream, appending to the given string, or to an internal one.
   *
   * @param target_str
   *        String to append to; it must outlive `*this` and must not be touched except through `*this` meanwhile.
   *        Null to use an internal string, initially empty.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * The stream.
   * @return See above.
   */
  std::ostream& os();

  /**
   * The stream (read-only, e.g., to check its state).
   * @return See above.
   */
  const std::ostream& os() const;

  /**
   * The target string, as of the last flush.  The reference (not the contents) is the same for the life of `*this`.
   * @return See above.
   */
  const std::string& str() const;

  /**
   * Flushes os(); then returns a view of the whole target string, valid until the next write or str_clear().
   * @return See above.
   */
  String_view str_view();

  /// Empties the target string.  Flush first, or buffered output will reappear later.
  void str_clear();

private:
  // Types.

  /// The device: appends to a `std::string`.
  using Appender = boost::iostreams::back_insert_device<std::string>;

  // Data.

  /// The target if ctor was given null; else unused.
  std::string m_own_target_str;

  /// The target string.
  std::string* const m_target;

  /// The stream over an Appender into #m_target.
  boost::iostreams::stream<Appender> m_target_ostream;
}; // class String_ostream

} // namespace sluice::util
