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

#include "sluice/log/field_seq.hpp"
#include <ostream>

namespace sluice::log
{

// Types.

/**
 * Serializer that writes fields to an `ostream` as `key=value` pairs separated by `", "`, values formatted by the
 * Scalar `ostream<<` (strings as-is, without quoting or escaping).  It is the field encoding of Ostream_record_writer;
 * a drain with a stricter format (JSON, say) would implement its own Serializer.
 *
 * One object is meant for one record: the separator logic counts the fields emitted so far.
 */
class Ostream_serializer :
  public Serializer
{
public:
  // Constructors/destructor.

  /**
   * Constructs the serializer.
   *
   * @param os
   *        Stream to which to write; must outlive `*this`.
   */
  explicit Ostream_serializer(std::ostream& os);

  // Methods.

  /**
   * Implements interface method by writing `[, ]key=value`.
   *
   * @param key
   *        The key.
   * @param val
   *        The value.
   * @return Falsy on success; log::error::Code::S_IO_FAILURE if the stream is in a failed state after writing.
   */
  Error_code emit(util::String_view key, const Scalar& val) override;

  /**
   * Returns the number of emit() calls so far.
   * @return See above.
   */
  size_t n_emitted() const;

private:
  // Data.

  /// See ctor.
  std::ostream& m_os;

  /// See n_emitted().
  size_t m_n_emitted;
}; // class Ostream_serializer

} // namespace sluice::log
