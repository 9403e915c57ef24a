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

namespace sluice::log
{

// Types.

/**
 * Drain that makes a non-thread-safe inner drain safe to share: each log() call to the inner drain happens while
 * holding a mutex.  Calls are therefore serialized, in no particular order among concurrent callers.
 *
 * is_enabled() is forwarded without locking; so the inner drain's is_enabled() must itself be thread-safe (as the
 * Drain contract requires regardless).
 *
 * Lazy values realized by the inner drain are computed while the mutex is held.
 */
class Mutex_drain :
  public Drain
{
public:
  // Constructors/destructor.

  /**
   * Constructs the wrapper.
   *
   * @param inner
   *        Drain to which to forward; not null.
   */
  explicit Mutex_drain(Drain::Ptr inner);

  // Methods.

  /**
   * Implements interface method by forwarding to the inner drain while holding the mutex.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields.
   * @return The inner drain's result.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method by asking the inner drain (without locking).
   *
   * @param level
   *        The level.
   * @return See above.
   */
  bool is_enabled(Level level) const override;

private:
  // Data.

  /// See ctor.
  const Drain::Ptr m_inner;

  /// Protects calls to `m_inner->log()`.
  util::Mutex_non_recursive m_mutex;
}; // class Mutex_drain

} // namespace sluice::log
