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
#include "sluice/log/error/error.hpp"
#include <cassert>
#include <string>

namespace sluice::log::error
{

// Types.

/**
 * The boost.system category for errors returned by the `log` Sluice module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `sluice::Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::category().name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements superclass API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging sluice::Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements superclass API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, an error::Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;
/* ^-- Static-initialization-order note: an error accessed (for its message) during static initialization of another
 * translation unit could precede this.  We expect Sluice not to be used for logging until main() runs. */

// Implementations.

Error_code make_error_code(Code err_code)
{
  // Glue Category::name()/message() to the Code enum.
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "sluice_log";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_IO_FAILURE:
    return "Writing a record to an output stream failed; the stream is in a bad state.";
  case Code::S_ENCODING_FAILURE:
    return "A field value could not be encoded by the serializer.";
  case Code::S_DOWNSTREAM_REJECTED:
    return "A downstream drain rejected the record.";
  case Code::S_MULTIPLE_DRAINS_FAILED:
    return "More than one drain failed while handling a single record; see the individual codes.";
  case Code::S_RECORDS_DROPPED:
    return "Records were dropped from a full asynchronous queue.";
  case Code::S_FLUSH_FROM_WORKER_THREAD:
    return "An asynchronous drain was asked to flush from its own worker thread, which would never complete.";
  case Code::S_DRAIN_EXCEPTION:
    return "A drain threw an exception while handling a record; the exception was contained.";
  }
  assert(false);
  return "";
} // Category::message()

} // namespace sluice::log::error
