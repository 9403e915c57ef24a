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

#include "sluice/error/error.hpp"
#include "sluice/log/error/error.hpp"
#include <gtest/gtest.h>

namespace sluice::error::test
{

namespace
{
using std::string;

/// Fails with `code` if `fail`; else returns `val`.  Follows the optional-`err_code` convention.
int maybe_fail(bool fail, int val, Error_code* err_code = 0)
{
  SLUICE_ERROR_EXEC_AND_THROW_ON_ERROR(int, maybe_fail, fail, val, _1);
  // If got here, err_code is not null.

  if (fail)
  {
    *err_code = log::error::Code::S_DOWNSTREAM_REJECTED;
    return 0;
  }
  // else
  err_code->clear();
  return val;
}

/// Void variant of the above, via exec_void_and_throw_on_error() directly.
void maybe_fail_void(bool fail, Error_code* err_code = 0)
{
  if (exec_void_and_throw_on_error([&](Error_code* actual_err_code) { maybe_fail_void(fail, actual_err_code); },
                                   err_code, "maybe_fail_void()"))
  {
    return;
  }
  // else
  if (fail)
  {
    *err_code = log::error::Code::S_IO_FAILURE;
    return;
  }
  // else
  err_code->clear();
}

} // Anonymous namespace

TEST(Runtime_error, Interface)
{
  const Runtime_error no_code("just context");
  EXPECT_FALSE(no_code.code());
  EXPECT_EQ(string(no_code.what()), "just context");

  const Runtime_error with_code(log::error::Code::S_IO_FAILURE, "ctx");
  EXPECT_EQ(with_code.code(), log::error::Code::S_IO_FAILURE);
  const string what = with_code.what();
  EXPECT_NE(what.find("ctx"), string::npos) << what;
  EXPECT_NE(what.find(Error_code(log::error::Code::S_IO_FAILURE).message()), string::npos) << what;
}

TEST(Exec_and_throw_on_error, Interface)
{
  Error_code err_code;

  // Non-null err_code: never throws.
  EXPECT_EQ(maybe_fail(false, 5, &err_code), 5);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(maybe_fail(true, 5, &err_code), 0);
  EXPECT_EQ(err_code, log::error::Code::S_DOWNSTREAM_REJECTED);

  // Null err_code: throws on error only.
  EXPECT_EQ(maybe_fail(false, 7), 7);
  try
  {
    maybe_fail(true, 7);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), log::error::Code::S_DOWNSTREAM_REJECTED);
    EXPECT_NE(string(exc.what()).find("maybe_fail"), string::npos) << exc.what();
  }

  maybe_fail_void(true, &err_code);
  EXPECT_EQ(err_code, log::error::Code::S_IO_FAILURE);
  EXPECT_NO_THROW(maybe_fail_void(false));
  EXPECT_THROW(maybe_fail_void(true), Runtime_error);
} // TEST(Exec_and_throw_on_error, Interface)

} // namespace sluice::error::test
