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
 * Drain that drops every record, successfully, without looking at the fields.  is_enabled() is always `false`, so
 * a Logger whose drain is (or resolves to) a Discard_drain does not even build the message at the call site.
 *
 * Useful as a placeholder, e.g., the initial drain of an Atomic_switch_drain, or a Duplicate_drain branch that is
 * turned off.
 */
class Discard_drain :
  public Drain
{
public:
  // Methods.

  /**
   * Implements interface method by doing nothing.
   *
   * @param record
   *        Ignored.
   * @param fields
   *        Ignored; not touched.
   * @return Success.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method by returning `false`.
   *
   * @param level
   *        Ignored.
   * @return `false`.
   */
  bool is_enabled(Level level) const override;
}; // class Discard_drain

} // namespace sluice::log
