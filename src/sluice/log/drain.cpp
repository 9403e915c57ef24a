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
#include "sluice/log/drain.hpp"
#include "sluice/log/error/error.hpp"
#include <cassert>
#include <exception>
#include <ostream>

namespace sluice::log
{

// Drain_error implementations.

Drain_error::Drain_error() = default;

Drain_error::Drain_error(const Error_code& err_code)
{
  if (err_code)
  {
    m_codes.push_back(err_code);
  }
}

Drain_error Drain_error::aggregate(const Drain_error& err1, const Drain_error& err2) // Static.
{
  Drain_error result(err1);
  result.m_codes.insert(result.m_codes.end(), err2.m_codes.begin(), err2.m_codes.end());
  return result;
}

Drain_error::operator bool() const
{
  return !m_codes.empty();
}

Error_code Drain_error::code() const
{
  switch (m_codes.size())
  {
    case 0:
      return Error_code();
    case 1:
      return m_codes.front();
    default:
      return error::Code::S_MULTIPLE_DRAINS_FAILED;
  }
}

const std::vector<Error_code>& Drain_error::codes() const
{
  return m_codes;
}

// Drain implementations.

bool Drain::is_enabled(Level) const // Virtual.
{
  return true;
}

// Free function implementations.

Drain_error log_contained(Drain* drain, const Record& record, const Field_seq& fields, std::string* what)
{
  assert(drain);
  try
  {
    return drain->log(record, fields);
  }
  catch (const std::exception& exc)
  {
    if (what)
    {
      *what = exc.what();
    }
    return Drain_error(error::Code::S_DRAIN_EXCEPTION);
  }
}

std::ostream& operator<<(std::ostream& os, const Drain_error& val)
{
  if (!val)
  {
    return os << "success";
  }
  // else

  bool first = true;
  for (const auto& err_code : val.codes())
  {
    if (!first)
    {
      os << ", ";
    }
    first = false;
    os << '[' << err_code << "] [" << err_code.message() << ']';
  }
  return os;
}

} // namespace sluice::log
