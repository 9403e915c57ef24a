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

#include "sluice/log/ostream_drain.hpp"
#include "sluice/log/buffer_drain.hpp"
#include "sluice/log/error/error.hpp"
#include "sluice/test/test_drain.hpp"
#include <gtest/gtest.h>
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <sstream>

namespace sluice::log::test
{

namespace
{
using sluice::test::test_record;
using boost::algorithm::ends_with;
using boost::algorithm::starts_with;
using std::string;
using std::vector;

/// Splits the given output into lines; checks each was terminated by a newline.
vector<string> lines(const string& output)
{
  EXPECT_TRUE(output.empty() || (output.back() == '\n')) << output;
  vector<string> result;
  std::istringstream is(output);
  string line;
  while (std::getline(is, line))
  {
    result.push_back(line);
  }
  return result;
}

/// `true` if and only if `line` starts with `<digits>.<6 digits> `.
bool has_epoch_time_stamp(const string& line)
{
  const auto dot_pos = line.find('.');
  if ((dot_pos == string::npos) || (dot_pos == 0) || (line.size() < dot_pos + 8) || (line[dot_pos + 7] != ' '))
  {
    return false;
  }
  for (size_t idx = 0; idx != dot_pos + 7; ++idx)
  {
    if ((idx != dot_pos) && (!std::isdigit(static_cast<unsigned char>(line[idx]))))
    {
      return false;
    }
  }
  return true;
}

} // Anonymous namespace

#define CTX SLUICE_UTIL_WHERE_AM_I_STR()

TEST(Ostream_drain, Format)
{
  std::ostringstream os;
  std::ostringstream os_for_err;
  {
    Ostream_drain drain(os, os_for_err, false);
    const Kv pairs[] = { { "a", 1 }, { "b", "x y" }, { "ok", true } };
    const Field_seq fields(std::begin(pairs), std::end(pairs));

    EXPECT_FALSE(drain.log(test_record(Level::S_INFO, "hello", "net"), fields));
    EXPECT_FALSE(drain.log(test_record(Level::S_DEBUG, "no fields, no module", ""), Field_seq()));
    EXPECT_FALSE(drain.log(test_record(Level::S_WARNING, "bad"), Field_seq()));
    EXPECT_FALSE(drain.log(test_record(Level::S_CRITICAL, "worse"), Field_seq()));
  }

  const auto out = lines(os.str());
  ASSERT_EQ(out.size(), 2u);
  for (const auto& line : out)
  {
    EXPECT_TRUE(has_epoch_time_stamp(line)) << line;
  }
  EXPECT_NE(out[0].find(" [info]: T"), string::npos) << out[0];
  EXPECT_TRUE(ends_with(out[0], ": net: test_drain.hpp:test_record(1): hello {a=1, b=x y, ok=true}")) << out[0];
  EXPECT_NE(out[1].find(" [debg]: T"), string::npos) << out[1];
  EXPECT_TRUE(ends_with(out[1], ": test_drain.hpp:test_record(1): no fields, no module")) << out[1];

  // WARNING and more severe: the other stream.
  const auto err = lines(os_for_err.str());
  ASSERT_EQ(err.size(), 2u);
  EXPECT_NE(err[0].find(" [warn]: T"), string::npos) << err[0];
  EXPECT_TRUE(ends_with(err[0], ": test: test_drain.hpp:test_record(1): bad")) << err[0];
  EXPECT_NE(err[1].find(" [crit]: T"), string::npos) << err[1];

  // The writer's formatting changes are undone.
  EXPECT_EQ(os.fill(), ' ');
  os << 5;
  EXPECT_TRUE(ends_with(os.str(), "\n5"));
} // TEST(Ostream_drain, Format)

TEST(Ostream_drain, Human_friendly_time_stamps)
{
  std::ostringstream os;
  Ostream_drain drain(os, os);
  drain.log(test_record(Level::S_TRACE, "one"), Field_seq());
  drain.log(test_record(Level::S_ERROR, "two"), Field_seq());

  const auto out = lines(os.str());
  ASSERT_EQ(out.size(), 2u);
  for (const auto& line : out)
  {
    // YYYY-MM-DD HH:MM:SS...
    ASSERT_GT(line.size(), 19u) << line;
    EXPECT_EQ(line[4], '-') << line;
    EXPECT_EQ(line[7], '-') << line;
    EXPECT_EQ(line[10], ' ') << line;
    EXPECT_EQ(line[13], ':') << line;
    EXPECT_EQ(line[16], ':') << line;
  }
  EXPECT_NE(out[0].find(" [trce]: T"), string::npos) << out[0];
  EXPECT_TRUE(ends_with(out[0], "): one")) << out[0];
  EXPECT_TRUE(ends_with(out[1], "): two")) << out[1];
} // TEST(Ostream_drain, Human_friendly_time_stamps)

TEST(Ostream_drain, Io_failure)
{
  std::ostringstream os;
  os.setstate(std::ios_base::badbit);
  Ostream_drain drain(os, os);

  const auto err = drain.log(test_record(Level::S_INFO), Field_seq());
  EXPECT_EQ(err.code(), error::Code::S_IO_FAILURE);
  const Kv pairs[] = { { "k", "v" } };
  EXPECT_EQ(drain.log(test_record(Level::S_ERROR), Field_seq(std::begin(pairs), std::end(pairs))).code(),
            error::Code::S_IO_FAILURE);

  // Under a Logger: reported out of band; the caller just carries on.
  unsigned int n_reported = 0;
  const Logger logger(boost::make_shared<Ostream_drain>(os, os), {},
                      [&](const Drain_error& drain_err, const Record&)
  {
    EXPECT_EQ(drain_err.code(), error::Code::S_IO_FAILURE);
    ++n_reported;
  });
  SLUICE_LOG_SET_CONTEXT(logger, "io");
  SLUICE_LOG_INFO("Lost.", { "k", "v" });
  EXPECT_EQ(n_reported, 1u);
} // TEST(Ostream_drain, Io_failure)

TEST(Buffer_drain, Interface)
{
  const auto drain = boost::make_shared<Buffer_drain>(false);
  EXPECT_TRUE(drain->buffer_str().empty());

  const Logger logger(drain, { { "svc", "buf" } });
  {
    SLUICE_LOG_SET_CONTEXT(logger, "mod");
    SLUICE_LOG_WARNING("First [" << 1 << "].", { "n", 1 });
    SLUICE_LOG_TRACE("Second.");
  }

  const auto out = lines(drain->buffer_str_copy());
  ASSERT_EQ(out.size(), 2u);
  EXPECT_TRUE(has_epoch_time_stamp(out[0])) << out[0];
  EXPECT_NE(out[0].find(" [warn]: T"), string::npos) << out[0];
  EXPECT_NE(out[0].find(": mod: ostream_drain_test.cpp:"), string::npos) << out[0];
  EXPECT_TRUE(ends_with(out[0], "): First [1]. {n=1, svc=buf}")) << out[0];
  EXPECT_TRUE(ends_with(out[1], "): Second. {svc=buf}")) << out[1];
  EXPECT_EQ(drain->buffer_str(), drain->buffer_str_copy());
} // TEST(Buffer_drain, Interface)

} // namespace sluice::log::test
