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

#include "sluice/util/util.hpp"
#include <gtest/gtest.h>
#include <iomanip>
#include <sstream>

namespace sluice::util::test
{

namespace
{
using std::string;

/// A little `enum` with the `<<` and `>>` that istream_to_enum() is meant to help implement.
enum class Color : size_t
{
  S_NONE = 0,
  S_RED,
  S_DARK_BLUE,
  S_END_SENTINEL
};

std::ostream& operator<<(std::ostream& os, Color val)
{
  switch (val)
  {
    case Color::S_NONE: return os << "NONE";
    case Color::S_RED: return os << "RED";
    case Color::S_DARK_BLUE: return os << "DARK_BLUE";
    case Color::S_END_SENTINEL: break;
  }
  return os << "?";
}

Color parse_color(const string& str, bool case_sensitive = false)
{
  std::istringstream is(str);
  return istream_to_enum(&is, Color::S_NONE, Color::S_END_SENTINEL, true, case_sensitive);
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX SLUICE_UTIL_WHERE_AM_I_STR()

TEST(Util_misc, Interface)
{
  // ostream_op_string() is built on top of various things, so this alone is a pretty decent check.
  EXPECT_EQ(ostream_op_string("abc[", 2, "] flag[", true, "]:", std::hex, 12),
            "abc[2] flag[1]:c");

  string out("prefix:");
  ostream_op_to_string(&out, 'x', 3.5, "-", 7u);
  EXPECT_EQ(out, "prefix:x3.5-7");

  static_assert(get_last_path_segment("/a/b/c.cpp") == "c.cpp", "Compile-time path reduction broken.");
  EXPECT_EQ(get_last_path_segment("c.cpp"), "c.cpp");
  EXPECT_EQ(get_last_path_segment("dir/"), "");
  EXPECT_EQ(get_last_path_segment(""), "");

  const string where = CTX;
  EXPECT_NE(where.find("util_test.cpp:"), string::npos) << where;
  EXPECT_EQ(where.find('/'), string::npos) << where;
  EXPECT_EQ(get_where_am_i_str("x/y/file.cpp", "func", 12), "file.cpp:func(12)");
} // TEST(Util_misc, Interface)

TEST(String_ostream, Interface)
{
  String_ostream os;
  EXPECT_TRUE(os.str().empty());
  os.os() << "abc" << 12 << std::flush;
  EXPECT_EQ(os.str(), "abc12");
  os.os() << '!' << std::flush;
  EXPECT_EQ(os.str(), "abc12!");
  os.str_clear();
  EXPECT_TRUE(os.str().empty());
  os.os() << "again";
  EXPECT_EQ(os.str_view(), "again");
  EXPECT_EQ(os.str(), "again");

  // Appending to a caller's string.
  string target("pre:");
  {
    String_ostream target_os(&target);
    target_os.os() << 42;
    EXPECT_EQ(target_os.str_view(), "pre:42");
    EXPECT_EQ(&target_os.str(), &target);
  }
  EXPECT_EQ(target, "pre:42");
}

TEST(Istream_to_enum, Interface)
{
  EXPECT_EQ(parse_color("RED"), Color::S_RED);
  EXPECT_EQ(parse_color("red"), Color::S_RED);
  EXPECT_EQ(parse_color("Dark_Blue"), Color::S_DARK_BLUE);
  EXPECT_EQ(parse_color("2"), Color::S_DARK_BLUE);
  EXPECT_EQ(parse_color("0"), Color::S_NONE);

  // Out of range, unknown, empty: the default.
  EXPECT_EQ(parse_color("3"), Color::S_NONE);
  EXPECT_EQ(parse_color("77"), Color::S_NONE);
  EXPECT_EQ(parse_color("green"), Color::S_NONE);
  EXPECT_EQ(parse_color(""), Color::S_NONE);

  EXPECT_EQ(parse_color("red", true), Color::S_NONE);
  EXPECT_EQ(parse_color("RED", true), Color::S_RED);

  // Reading stops at the first character that cannot be part of a token; the rest stays in the stream.
  std::istringstream is("red,blue");
  EXPECT_EQ(istream_to_enum(&is, Color::S_NONE, Color::S_END_SENTINEL), Color::S_RED);
  EXPECT_EQ(char(is.get()), ',');
} // TEST(Istream_to_enum, Interface)

} // namespace sluice::util::test
