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
 * Drain that forwards a record to an inner drain if and only if a user predicate on the Record (level, module, message,
 * source location...) returns `true`; otherwise returns success without touching the fields, so no lazy value is
 * evaluated on behalf of a filtered-out record.
 *
 * The predicate may be called concurrently from many threads; it must be safe for that.  It cannot see the fields:
 * it must decide on the Record alone.
 *
 * @see make_verbosity_filter(), which builds one of these from a Verbosity_config.
 */
class Filter_drain :
  public Drain
{
public:
  // Types.

  /// The predicate type.
  using Predicate = Function<bool (const Record& record)>;

  // Constructors/destructor.

  /**
   * Constructs the filter.
   *
   * @param predicate
   *        The predicate; not `empty()`.
   * @param inner
   *        Drain to which to forward passing records; not null.
   */
  explicit Filter_drain(Predicate predicate, Drain::Ptr inner);

  // Methods.

  /**
   * Implements interface method by forwarding to the inner drain if and only if the predicate passes the record.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields; touched only by the inner drain.
   * @return Success if filtered out; else the inner drain's result.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method by asking the inner drain; the predicate needs a whole Record so cannot be consulted.
   *
   * @param level
   *        The level.
   * @return See above.
   */
  bool is_enabled(Level level) const override;

private:
  // Data.

  /// See ctor.
  const Predicate m_predicate;

  /// See ctor.
  const Drain::Ptr m_inner;
}; // class Filter_drain

/**
 * Drain that forwards a record to an inner drain if and only if its level is at least as severe as a threshold (see
 * level_passes()); otherwise returns success without touching the fields.  It also answers is_enabled() exactly, so
 * log call sites with filtered-out levels do not build messages or fields at all.
 */
class Filter_level_drain :
  public Drain
{
public:
  // Constructors/destructor.

  /**
   * Constructs the filter.
   *
   * @param min_level
   *        Least severe level that passes.  Level::S_NONE passes nothing.
   * @param inner
   *        Drain to which to forward passing records; not null.
   */
  explicit Filter_level_drain(Level min_level, Drain::Ptr inner);

  // Methods.

  /**
   * Implements interface method by forwarding to the inner drain if and only if `level_passes(record.m_level, min)`.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields; touched only by the inner drain.
   * @return Success if filtered out; else the inner drain's result.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method: `true` if and only if the level passes and the inner drain is enabled for it.
   *
   * @param level
   *        The level.
   * @return See above.
   */
  bool is_enabled(Level level) const override;

private:
  // Data.

  /// See ctor.
  const Level m_min_level;

  /// See ctor.
  const Drain::Ptr m_inner;
}; // class Filter_level_drain

} // namespace sluice::log
