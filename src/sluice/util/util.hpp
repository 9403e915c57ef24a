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

#include "sluice/util/util_fwd.hpp"
#include "sluice/util/detail/util.hpp"
#include "sluice/util/string_ostream.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>
#include <cassert>
#include <cctype>
#include <locale>
#include <type_traits>

namespace sluice::util
{

// Types.

/**
 * An empty interface, consisting of nothing but a default `virtual` destructor, intended as a boiler-plate-reducing
 * base for any other (presumably `virtual`-method-having) class that would otherwise require a default `virtual`
 * destructor.
 *
 * Usually, if you have a base class `C` at the top of a `virtual`-method-having hierarchy, then it needs a `virtual`
 * destructor, even if it is `= default` or `{}`.  Otherwise, trying to delete an object of subclass `C2 : public C`
 * via a `C*` pointer will fail to call destructor `~C2()` -- which may not be empty, causing leaks and so on.
 * So, instead, `public`ly derive from Null_interface.  log::Drain is the main user.
 */
class Null_interface
{
public:
  // Destructor.

  /**
   * Boring `virtual` destructor.
   *
   * It is pure, so that Null_interface becomes abstract and cannot be itself instantiated.  A subclass need not
   * define a body: the compiler generates an empty (and, because of us, `virtual`) destructor for it.
   */
  virtual ~Null_interface() = 0;
};

// Template implementations.

template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args)
{
  // Induction step for variadic template.
  feed_args_to_ostream(os, ostream_arg1);
  feed_args_to_ostream(os, remaining_ostream_args...);
}

template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg)
{
  // Induction base.
  *os << only_ostream_arg;
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  using std::flush;

  /* Pushes characters directly onto an `std::string`, instead of doing so into an `ostringstream` and then getting it
   * by copy via `ostringstream::str()`.  The log macros build every message this way. */
  String_ostream os(target_str);
  feed_args_to_ostream(&(os.os()), ostream_args...);
  os.os() << flush;
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  using std::string;

  string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding, bool case_sensitive,
                     Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::equals;
  using boost::algorithm::is_iequal;
  using std::locale;
  using std::string;
  using std::isdigit;
  using std::isalnum;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  assert(enum_t(enum_lowest) >= 0); // Otherwise we'd have to allow '-' (minus sign), and we'd... just rather not.
  auto& is = *is_ptr;
  const is_iequal i_equal_func(locale::classic());

  // Read into `token` until (and not including) the first non-alphanumeric/underscore character or stream end.
  string token;
  Traits::int_type ch;
  while (((ch = is.peek()) != Traits::eof()) && (isalnum(ch) || (ch == '_')))
  {
    token += Traits::to_char_type(ch);
    is.get();
  }

  Enum val = enum_default;

  if (!token.empty())
  {
    if (accept_num_encoding && isdigit(token.front())) // Hence ostream<< shouldn't serialize a digit-leading value.
    {
      enum_t num_enum;
      try
      {
        num_enum = lexical_cast<enum_t>(token);
        if ((num_enum >= enum_t(enum_sentinel) || (num_enum < enum_t(enum_lowest))))
        {
          num_enum = enum_t(enum_default);
        }
        val = Enum(num_enum);
      }
      catch (const bad_lexical_cast&)
      {
        assert(val == enum_default);
      }
    } // if (accept_num_encoding && isdigit())
    else // if (!(accept_num_encoding && isdigit()))
    {
      enum_t idx;
      for (idx = enum_t(enum_lowest); idx != enum_t(enum_sentinel); ++idx)
      {
        const auto candidate = Enum(idx);
        // lexical_cast<string>(Enum) is the symbolic operator<<() encoding, not the numeric one.
        if (case_sensitive ? equals(token, lexical_cast<string>(candidate))
                           : equals(token, lexical_cast<string>(candidate), i_equal_func))
        {
          val = candidate;
          break;
        }
      }
      assert((idx != enum_t(enum_sentinel)) || (val == enum_default));
    } // else if (!(accept_num_encoding && isdigit()))
  } // if (!token.empty())

  return val;
} // istream_to_enum()

} // namespace sluice::util
