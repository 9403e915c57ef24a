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
#include "sluice/log/value.hpp"
#include <cassert>
#include <ostream>

namespace sluice::log
{

namespace
{

/**
 * Checks the pointer before anything reads through it; then wraps it.
 *
 * @param val
 *        NUL-terminated string; not null.
 * @return See above.
 */
util::String_view c_str_to_view(const char* val)
{
  assert(val && "A `const char*` Value requires a non-null string.");
  return util::String_view(val);
}

} // namespace (anon)

// Value implementations.

Value::Value() :
  Value(None())
{
  // Nothing else.
}

Value::Value(Scalar val) :
  m_payload(std::in_place_index<0>, std::move(val))
{
  // Nothing else.
}

Value::Value(None val) :
  m_payload(std::in_place_index<0>, val)
{
  // Nothing else.
}

Value::Value(bool val) :
  m_payload(std::in_place_index<0>, std::in_place_type<bool>, val)
{
  // Nothing else.
}

Value::Value(double val) :
  m_payload(std::in_place_index<0>, std::in_place_type<double>, val)
{
  // Nothing else.
}

Value::Value(const char* val) :
  Value(c_str_to_view(val))
{
  // Nothing else.
}

Value::Value(util::String_view val) :
  m_payload(std::in_place_index<0>, std::in_place_type<std::string>, val)
{
  // Nothing else.
}

Value::Value(std::string val) :
  m_payload(std::in_place_index<0>, std::in_place_type<std::string>, std::move(val))
{
  // Nothing else.
}

Value::Value(Lazy_func_ptr func) :
  m_payload(std::in_place_index<1>, std::move(func))
{
  assert(std::get<1>(m_payload) && "Use an eager Value (or None) instead of a null lazy function.");
}

bool Value::is_lazy() const
{
  return m_payload.index() == 1;
}

const Scalar& Value::eager() const
{
  assert(!is_lazy());
  return std::get<0>(m_payload);
}

const Value::Lazy_func_ptr& Value::lazy_func() const
{
  assert(is_lazy());
  return std::get<1>(m_payload);
}

// Kv implementations.

Kv::Kv(util::String_view key, Value value) :
  m_key(key),
  m_value(std::move(value))
{
  // Nothing else.
}

// Free function implementations.

std::ostream& operator<<(std::ostream& os, const None&)
{
  return os << "none";
}

std::ostream& operator<<(std::ostream& os, const Scalar& val)
{
  std::visit([&](const auto& alt)
  {
    using Alt = std::decay_t<decltype(alt)>;
    if constexpr(std::is_same_v<Alt, bool>)
    {
      os << (alt ? "true" : "false");
    }
    else
    {
      os << alt;
    }
  }, val);
  return os;
}

bool operator==(const None&, const None&)
{
  return true;
}

bool operator!=(const None&, const None&)
{
  return false;
}

} // namespace sluice::log
