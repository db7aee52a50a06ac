/* Flow-Xfer: Remote file-transfer session pooling
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
#include "xfer/session/session_pool.hpp"
#include "xfer/session/error.hpp"
#include "test_common.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <boost/unordered_set.hpp>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace xfer::session::test
{

using xfer::test::Fake_session_factory;
using xfer::test::Fake_channel_faults;
using xfer::test::test_logger;

namespace
{

Session_pool_config capacity(size_t max_idle_sessions)
{
  Session_pool_config config;
  config.m_max_idle_sessions = max_idle_sessions;
  return config;
}

} // namespace (anon)

TEST(Session_pool_test, Defaults)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory);

  EXPECT_EQ(pool.max_idle_sessions(), 10u);
  EXPECT_EQ(pool.max_idle_sessions(), Session_pool_config::S_DEFAULT_MAX_IDLE_SESSIONS);
  EXPECT_FALSE(pool.auto_startup());
  EXPECT_EQ(pool.phase(), 0);
  EXPECT_FALSE(pool.running());
  EXPECT_EQ(pool.idle_count(), 0u);
}

TEST(Session_pool_test, Acquire_before_start_fails_without_factory)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory);

  Error_code err_code;
  const auto session = pool.acquire(&err_code);
  EXPECT_EQ(err_code, error::Code::S_POOL_NOT_STARTED);
  EXPECT_FALSE(session);
  EXPECT_EQ(factory.call_count(), 0u);

  // Null err_code => exception carrying the same code.
  try
  {
    pool.acquire();
    ADD_FAILURE() << "acquire() before start() should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_POOL_NOT_STARTED);
  }
  EXPECT_EQ(factory.call_count(), 0u);
}

TEST(Session_pool_test, Start_with_zero_capacity_fails)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(0));

  Error_code err_code;
  pool.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_FALSE(pool.running());

  // No container was allocated: acquire() still says not-started.
  pool.acquire(&err_code);
  EXPECT_EQ(err_code, error::Code::S_POOL_NOT_STARTED);
  EXPECT_EQ(factory.call_count(), 0u);

  EXPECT_THROW(pool.start(), flow::error::Runtime_error);
}

TEST(Session_pool_test, Start_without_factory_fails)
{
  Session_pool pool(test_logger(), nullptr);

  Error_code err_code;
  pool.start(&err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_FALSE(pool.running());
}

TEST(Session_pool_test, Acquire_on_empty_creates_once)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();
  EXPECT_TRUE(pool.running());

  Error_code err_code;
  auto session = pool.acquire(&err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(session);
  EXPECT_EQ(factory.call_count(), 1u);
  EXPECT_EQ(pool.idle_count(), 0u); // Checked out, not idle.
  EXPECT_TRUE(session->connected());

  pool.release(std::move(session));
}

TEST(Session_pool_test, Release_then_acquire_reuses)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();

  auto session = pool.acquire();
  const auto id = session->id();
  pool.release(std::move(session));
  EXPECT_FALSE(session);
  EXPECT_EQ(pool.idle_count(), 1u);

  session = pool.acquire();
  EXPECT_EQ(session->id(), id);
  EXPECT_EQ(factory.call_count(), 1u);
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_FALSE(factory.closed(0));
}

TEST(Session_pool_test, Capacity_bounds_idle_sessions)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();

  auto a = pool.acquire();
  auto b = pool.acquire();
  auto c = pool.acquire();
  const auto a_id = a->id();
  const auto b_id = b->id();
  ASSERT_EQ(factory.created_count(), 3u);

  pool.release(std::move(a));
  pool.release(std::move(b));
  pool.release(std::move(c));

  // {A, B} kept, in insertion order; C destroyed.
  EXPECT_EQ(pool.idle_count(), 2u);
  EXPECT_FALSE(factory.closed(0));
  EXPECT_FALSE(factory.closed(1));
  EXPECT_TRUE(factory.closed(2));

  EXPECT_EQ(pool.acquire()->id(), a_id);
  EXPECT_EQ(pool.acquire()->id(), b_id);
}

TEST(Session_pool_test, Release_null_is_noop)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();
  pool.release(pool.acquire());
  ASSERT_EQ(pool.idle_count(), 1u);

  pool.release(Session_ptr());
  EXPECT_EQ(pool.idle_count(), 1u);

  pool.stop();
  pool.release(Session_ptr());
  EXPECT_EQ(pool.idle_count(), 0u);
}

TEST(Session_pool_test, Factory_failure_passes_through)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();
  factory.set_fail(true);

  Error_code err_code;
  const auto session = pool.acquire(&err_code);
  EXPECT_EQ(err_code, Fake_session_factory::S_CREATE_ERROR);
  EXPECT_FALSE(session);
  EXPECT_EQ(pool.idle_count(), 0u);

  try
  {
    pool.acquire();
    ADD_FAILURE() << "acquire() should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Fake_session_factory::S_CREATE_ERROR);
  }

  // The pool is fine afterwards.
  factory.set_fail(false);
  EXPECT_TRUE(pool.acquire(&err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(pool.running());
}

TEST(Session_pool_test, Stop_destroys_idle_and_stops_caching)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();

  auto a = pool.acquire();
  auto b = pool.acquire();
  auto c = pool.acquire();
  pool.release(std::move(a));
  pool.release(std::move(b));

  pool.stop();
  EXPECT_FALSE(pool.running());
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_TRUE(factory.closed(0));
  EXPECT_TRUE(factory.closed(1));
  EXPECT_EQ(factory.channel(0).disconnect_count(), 1u);
  EXPECT_EQ(factory.connection(0).disconnect_count(), 1u);

  // Released while not running: destroyed, not cached.
  EXPECT_FALSE(factory.closed(2));
  pool.release(std::move(c));
  EXPECT_TRUE(factory.closed(2));
  EXPECT_EQ(pool.idle_count(), 0u);

  // Still able to hand out (fresh) sessions.
  Error_code err_code;
  auto d = pool.acquire(&err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(d);
  EXPECT_EQ(factory.call_count(), 4u);
  pool.release(std::move(d));
  EXPECT_TRUE(factory.closed(3));
}

TEST(Session_pool_test, Stop_with_callback)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();

  auto a = pool.acquire();
  auto b = pool.acquire();
  pool.release(std::move(a));
  pool.release(std::move(b));

  unsigned int n_calls = 0;
  bool running_in_callback = true;
  pool.stop([&]()
  {
    ++n_calls;
    running_in_callback = pool.running();
  });

  EXPECT_EQ(n_calls, 1u);
  EXPECT_FALSE(running_in_callback);
  EXPECT_FALSE(pool.running());
  EXPECT_TRUE(factory.closed(0));
  EXPECT_TRUE(factory.closed(1));
}

TEST(Session_pool_test, Stop_callback_exception_propagates_after_stopping)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();
  pool.release(pool.acquire());

  EXPECT_THROW(pool.stop([]() { throw std::runtime_error("dependent shutdown failed"); }), std::runtime_error);
  EXPECT_FALSE(pool.running());
  EXPECT_TRUE(factory.closed(0));
}

TEST(Session_pool_test, Stop_before_start)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory);

  bool called = false;
  pool.stop([&]() { called = true; });
  EXPECT_TRUE(called);
  EXPECT_FALSE(pool.running());

  Error_code err_code;
  pool.acquire(&err_code);
  EXPECT_EQ(err_code, error::Code::S_POOL_NOT_STARTED);
}

TEST(Session_pool_test, Restart_destroys_stale_sessions)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();
  pool.release(pool.acquire());
  ASSERT_EQ(pool.idle_count(), 1u);

  // Double start(): still running; the cached session is torn down rather than leaked.
  pool.start();
  EXPECT_TRUE(pool.running());
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_TRUE(factory.closed(0));

  pool.stop();
  pool.start();
  EXPECT_TRUE(pool.running());
  pool.release(pool.acquire());
  EXPECT_EQ(pool.idle_count(), 1u);
  EXPECT_EQ(factory.call_count(), 2u);
}

TEST(Session_pool_test, Discard_never_caches)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));
  pool.start();

  auto session = pool.acquire();
  pool.discard(std::move(session));
  EXPECT_FALSE(session);
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_TRUE(factory.closed(0));

  pool.discard(Session_ptr()); // No-op.
  EXPECT_EQ(pool.idle_count(), 0u);
}

TEST(Session_pool_test, Destruction_failures_are_ignored)
{
  Fake_channel_faults faults;
  faults.m_throw_on_disconnect = true;
  Fake_session_factory factory(nullptr, faults);
  Session_pool pool(test_logger(), &factory, capacity(1));
  pool.start();

  auto a = pool.acquire();
  auto b = pool.acquire();
  pool.release(std::move(a));
  EXPECT_NO_THROW(pool.release(std::move(b))); // Over capacity => destroyed; its channel throws.
  // The connection is closed regardless.
  EXPECT_FALSE(factory.connection(1).connected());
  EXPECT_EQ(factory.channel(1).disconnect_count(), 1u);

  EXPECT_NO_THROW(pool.stop());
  EXPECT_FALSE(factory.connection(0).connected());
}

TEST(Session_pool_test, Release_before_start_destroys)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(2));

  // A session obtained elsewhere, handed to a pool that was never started.
  Error_code err_code;
  auto session = factory.create_session(&err_code);
  ASSERT_FALSE(err_code);
  ASSERT_TRUE(session);

  pool.release(std::move(session));
  EXPECT_TRUE(factory.closed(0));
  EXPECT_EQ(factory.channel(0).disconnect_count(), 1u);
  EXPECT_EQ(factory.connection(0).disconnect_count(), 1u);
  EXPECT_EQ(pool.idle_count(), 0u);
  EXPECT_FALSE(pool.running());

  // Still in Created state.
  pool.acquire(&err_code);
  EXPECT_EQ(err_code, error::Code::S_POOL_NOT_STARTED);
}

TEST(Session_pool_test, Non_std_destruction_failures_are_ignored)
{
  Fake_channel_faults faults;
  faults.m_throw_non_std_on_disconnect = true;
  Fake_session_factory factory(nullptr, faults);
  Session_pool pool(test_logger(), &factory, capacity(1));
  pool.start();

  auto a = pool.acquire();
  auto b = pool.acquire();
  pool.release(std::move(a));
  pool.release(std::move(b)); // Over capacity => destroyed; its channel throws a non-std value.
  EXPECT_FALSE(factory.connection(1).connected());

  auto c = pool.acquire();
  pool.discard(std::move(c));
  EXPECT_FALSE(factory.connection(0).connected());

  pool.release(pool.acquire()); // Fresh one, cached.
  pool.stop();
  EXPECT_FALSE(factory.connection(2).connected());
}

TEST(Session_pool_test, Destructor_destroys_idle_sessions)
{
  Fake_session_factory factory;
  {
    Session_pool pool(test_logger(), &factory, capacity(2));
    pool.start();
    pool.release(pool.acquire());
  }
  EXPECT_TRUE(factory.closed(0));
}

TEST(Session_pool_test, Concurrent_acquire_release)
{
  constexpr size_t N_THREADS = 8;
  constexpr size_t N_CYCLES = 500;
  constexpr size_t MAX_IDLE = 3;

  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(MAX_IDLE));
  pool.start();

  std::mutex checked_out_mutex;
  boost::unordered_set<uint64_t> checked_out;
  std::atomic<bool> double_checkout(false);
  std::atomic<bool> over_capacity(false);

  std::vector<std::thread> threads;
  for (size_t thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.emplace_back([&]()
    {
      for (size_t cycle = 0; cycle != N_CYCLES; ++cycle)
      {
        auto session = pool.acquire();
        const auto id = session->id();
        {
          std::lock_guard<std::mutex> lock(checked_out_mutex);
          if (!checked_out.insert(id).second)
          {
            double_checkout = true;
          }
        }
        // Hold it a little, so another thread would have a chance to be handed the same one.
        std::this_thread::yield();
        if (!session->connected())
        {
          double_checkout = true; // Closed under us: someone else destroyed it.
        }
        std::this_thread::yield();
        {
          std::lock_guard<std::mutex> lock(checked_out_mutex);
          checked_out.erase(id);
        }
        pool.release(std::move(session));
        if (pool.idle_count() > MAX_IDLE)
        {
          over_capacity = true;
        }
      }
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  EXPECT_FALSE(double_checkout);
  EXPECT_FALSE(over_capacity);
  EXPECT_LE(pool.idle_count(), MAX_IDLE);
  EXPECT_LE(factory.created_count(), N_THREADS * N_CYCLES);

  // Every session created was either closed or is idle now.
  size_t n_open = 0;
  for (size_t idx = 0; idx != factory.created_count(); ++idx)
  {
    if (!factory.closed(idx))
    {
      ++n_open;
    }
  }
  EXPECT_EQ(n_open, pool.idle_count());
}

TEST(Session_pool_test, Output)
{
  Fake_session_factory factory;
  Session_pool pool(test_logger(), &factory, capacity(4));

  std::ostringstream os;
  os << pool;
  EXPECT_NE(os.str().find("max_idle[4]"), std::string::npos);
}

} // namespace xfer::session::test
