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

#include "sluice/log/atomic_switch_drain.hpp"
#include "sluice/log/discard_drain.hpp"
#include "sluice/test/test_drain.hpp"
#include <gtest/gtest.h>
#include <boost/move/make_unique.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <set>
#include <vector>

namespace sluice::log::test
{

namespace
{
using sluice::test::Test_drain;
using sluice::test::test_record;
using std::vector;
} // Anonymous namespace

TEST(Atomic_switch_drain, Interface)
{
  const auto off = boost::make_shared<Discard_drain>();
  const auto on = boost::make_shared<Test_drain>(true, Level::S_INFO);
  const auto drain = boost::make_shared<Atomic_switch_drain>(off);
  const Logger logger(drain);

  EXPECT_EQ(drain->get(), off);
  EXPECT_FALSE(logger.is_enabled(Level::S_CRITICAL));
  logger.log(test_record(Level::S_CRITICAL), {});

  drain->set(on);
  EXPECT_EQ(drain->get(), on);
  EXPECT_TRUE(logger.is_enabled(Level::S_INFO));
  EXPECT_FALSE(logger.is_enabled(Level::S_DEBUG));
  logger.log(test_record(Level::S_INFO), {});
  EXPECT_EQ(on->count(), 1u);

  EXPECT_EQ(drain->swap(off), on);
  EXPECT_EQ(drain->get(), off);
  logger.log(test_record(Level::S_INFO), {});
  EXPECT_EQ(on->count(), 1u);
} // TEST(Atomic_switch_drain, Interface)

TEST(Atomic_switch_drain, Concurrent_switching)
{
  constexpr unsigned int N_THREADS = 4;
  constexpr unsigned int N_RECORDS = 2000;

  const auto drain_a = boost::make_shared<Test_drain>();
  const auto drain_b = boost::make_shared<Test_drain>();
  const auto drain = boost::make_shared<Atomic_switch_drain>(drain_a);
  const Logger logger(drain);
  std::atomic<bool> done(false);

  util::Thread switcher([&]()
  {
    bool use_b = true;
    while (!done)
    {
      drain->set(use_b ? Drain::Ptr(drain_b) : Drain::Ptr(drain_a));
      use_b = !use_b;
      util::this_thread::yield();
    }
  });

  vector<boost::movelib::unique_ptr<util::Thread>> threads;
  for (unsigned int thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.emplace_back(boost::movelib::make_unique<util::Thread>([&, thread_idx]()
    {
      for (unsigned int rec_idx = 0; rec_idx != N_RECORDS; ++rec_idx)
      {
        logger.log(test_record(Level::S_INFO), { { "id", thread_idx * N_RECORDS + rec_idx } });
      }
    }));
  }
  for (const auto& thread : threads)
  {
    thread->join();
  }
  done = true;
  switcher.join();

  // Every record reached exactly one of the two drains.
  std::multiset<uint64_t> ids;
  for (const auto& inner : { drain_a, drain_b })
  {
    for (const auto& entry : inner->entries())
    {
      ASSERT_EQ(entry.m_fields.size(), 1u);
      ids.insert(std::get<uint64_t>(entry.m_fields.front().second));
    }
  }
  ASSERT_EQ(ids.size(), N_THREADS * N_RECORDS);
  uint64_t expected_id = 0;
  for (const auto id : ids)
  {
    EXPECT_EQ(id, expected_id++);
  }
} // TEST(Atomic_switch_drain, Concurrent_switching)

} // namespace sluice::log::test
