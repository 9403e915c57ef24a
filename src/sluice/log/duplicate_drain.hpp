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
 * Drain that forwards every record to two inner drains, in order: first, then second.  Both are always invoked, even
 * if the first fails.  A lazy value realized by both is still computed only once (see Field_seq::realize()).
 *
 * For more than 2 destinations, nest them: `Duplicate_drain(a, Duplicate_drain(b, c))`.
 */
class Duplicate_drain :
  public Drain
{
public:
  // Constructors/destructor.

  /**
   * Constructs the fan-out.
   *
   * @param first
   *        Drain invoked first; not null.
   * @param second
   *        Drain invoked second; not null.
   */
  explicit Duplicate_drain(Drain::Ptr first, Drain::Ptr second);

  // Methods.

  /**
   * Implements interface method by forwarding to both drains.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields.
   * @return Drain_error::aggregate() of both results: thus success if both succeeded; the failing one's error if one
   *         failed; both errors if both failed.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method: `true` if either inner drain is enabled.
   *
   * @param level
   *        The level.
   * @return See above.
   */
  bool is_enabled(Level level) const override;

private:
  // Data.

  /// See ctor.
  const Drain::Ptr m_first;

  /// See ctor.
  const Drain::Ptr m_second;
}; // class Duplicate_drain

} // namespace sluice::log
