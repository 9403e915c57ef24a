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
 * Drain that forwards every record to an inner drain and, if the latter fails, returns a user-supplied
 * transformation of the failure instead.  E.g., one may collapse any failure of an output drain into
 * log::error::Code::S_DOWNSTREAM_REJECTED; or log it and return success.
 *
 * The function may be called concurrently from many threads; it must be safe for that.
 */
class Map_error_drain :
  public Drain
{
public:
  // Types.

  /// The error-mapping function type.  Called only with a failure; may return success.
  using Error_mapper = Function<Drain_error (const Drain_error& err)>;

  // Constructors/destructor.

  /**
   * Constructs the mapper.
   *
   * @param mapper
   *        The function; not `empty()`.
   * @param inner
   *        Drain to which to forward; not null.
   */
  explicit Map_error_drain(Error_mapper mapper, Drain::Ptr inner);

  // Methods.

  /**
   * Implements interface method by forwarding to the inner drain and mapping any failure.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields.
   * @return Success if the inner drain succeeded; else `mapper(err)`.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method by asking the inner drain.
   *
   * @param level
   *        The level.
   * @return See above.
   */
  bool is_enabled(Level level) const override;

private:
  // Data.

  /// See ctor.
  const Error_mapper m_mapper;

  /// See ctor.
  const Drain::Ptr m_inner;
}; // class Map_error_drain

/**
 * Drain that forwards every record to an inner drain and always reports success: the explicit way to opt out of
 * error propagation for a branch of the drain tree (so that, e.g., a failing secondary output inside a
 * Duplicate_drain does not reach the Logger's Error_handler).
 */
class Ignore_result_drain :
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
  explicit Ignore_result_drain(Drain::Ptr inner);

  // Methods.

  /**
   * Implements interface method by forwarding to the inner drain and discarding its result.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields.
   * @return Success.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method by asking the inner drain.
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
}; // class Ignore_result_drain

} // namespace sluice::log
