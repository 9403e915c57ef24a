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
#include <boost/smart_ptr/atomic_shared_ptr.hpp>

namespace sluice::log
{

// Types.

/**
 * Drain whose inner drain can be replaced at runtime, while other threads are logging through it: e.g., to
 * switch output verbosity or destination on a signal or an admin command without re-creating any Logger.
 *
 * ### Semantics ###
 * Each log() call loads one snapshot of the current inner drain and uses it for the whole call; so every record is
 * handled by exactly one installed drain, never by two, and never lost.  set() (or swap()) installs a new inner
 * drain for all log() calls that begin after it returns; calls already under way finish with the drain they loaded.
 * A replaced drain is destroyed when the last holder (the switch, or an in-progress log() call, or the user) drops
 * its pointer.
 *
 * ### Implementation ###
 * The inner pointer is a `boost::atomic_shared_ptr`: load() and exchange() are atomic, so readers never see a torn
 * value.  (In Boost's implementation these hold a tiny spinlock for the duration of the ref-count copy; there is no
 * blocking on a mutex shared with anything else.)
 */
class Atomic_switch_drain :
  public Drain
{
public:
  // Constructors/destructor.

  /**
   * Constructs the switch.
   *
   * @param initial
   *        Initial inner drain; not null.  Discard_drain is a reasonable "off" state.
   */
  explicit Atomic_switch_drain(Drain::Ptr initial);

  // Methods.

  /**
   * Implements interface method by forwarding to a snapshot of the current inner drain.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields.
   * @return The inner drain's result.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method by asking the current inner drain.
   *
   * @param level
   *        The level.
   * @return See above.
   */
  bool is_enabled(Level level) const override;

  /**
   * Installs a new inner drain.
   *
   * @param inner
   *        New inner drain; not null.
   */
  void set(Drain::Ptr inner);

  /**
   * Installs a new inner drain and returns the previous one.
   *
   * @param inner
   *        New inner drain; not null.
   * @return The drain installed just before.
   */
  Drain::Ptr swap(Drain::Ptr inner);

  /**
   * Returns the current inner drain.
   * @return See above.  Not null.
   */
  Drain::Ptr get() const;

private:
  // Data.

  /// The current inner drain.  Never null.
  boost::atomic_shared_ptr<Drain> m_inner;
}; // class Atomic_switch_drain

} // namespace sluice::log
