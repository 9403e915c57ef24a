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
#include "sluice/log/ostream_serializer.hpp"
#include "sluice/log/error/error.hpp"

namespace sluice::log
{

Ostream_serializer::Ostream_serializer(std::ostream& os) :
  m_os(os),
  m_n_emitted(0)
{
  // Nothing else.
}

Error_code Ostream_serializer::emit(util::String_view key, const Scalar& val) // Virtual.
{
  if (m_n_emitted++ != 0)
  {
    m_os << ", ";
  }
  m_os << key << '=' << val;

  return m_os ? Error_code() : Error_code(error::Code::S_IO_FAILURE);
}

size_t Ostream_serializer::n_emitted() const
{
  return m_n_emitted;
}

} // namespace sluice::log
