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
#include "xfer/session/session.hpp"
#include "xfer/session/error.hpp"
#include "test_common.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>
#include <sstream>

namespace xfer::session::test
{

using xfer::test::Fake_channel;
using xfer::test::Fake_channel_faults;
using xfer::test::Fake_connection;
using xfer::test::test_logger;
using boost::make_shared;

TEST(Session_test, Connected_requires_both)
{
  auto channel = make_shared<Fake_channel>();
  auto connection = make_shared<Fake_connection>();
  Session session(channel, connection);
  EXPECT_TRUE(session.connected());

  Error_code err_code;
  connection->disconnect(&err_code);
  EXPECT_FALSE(session.connected());
  EXPECT_TRUE(channel->connected());
}

TEST(Session_test, Ids_are_unique)
{
  Session a(make_shared<Fake_channel>(), make_shared<Fake_connection>());
  Session b(make_shared<Fake_channel>(), make_shared<Fake_connection>());
  EXPECT_NE(a.id(), b.id());

  std::ostringstream os;
  os << a;
  EXPECT_EQ(os.str(), "xfer_sess[" + std::to_string(a.id()) + ']');
}

TEST(Session_test, Close_only_disconnects_connected)
{
  auto channel = make_shared<Fake_channel>();
  auto connection = make_shared<Fake_connection>();
  Session session(channel, connection);

  Error_code err_code;
  channel->disconnect(&err_code);
  ASSERT_EQ(channel->disconnect_count(), 1u);

  session.close(test_logger());
  EXPECT_EQ(channel->disconnect_count(), 1u); // Already not connected: left alone.
  EXPECT_EQ(connection->disconnect_count(), 1u);
  EXPECT_FALSE(session.connected());
}

TEST(Session_test, Close_is_best_effort)
{
  Fake_channel_faults faults;
  faults.m_fail_disconnect = true;
  auto channel = make_shared<Fake_channel>(nullptr, faults);
  auto connection = make_shared<Fake_connection>();
  Session session(channel, connection);

  EXPECT_NO_THROW(session.close(test_logger()));
  EXPECT_EQ(channel->disconnect_count(), 1u);
  EXPECT_FALSE(connection->connected());

  faults.m_fail_disconnect = false;
  faults.m_throw_on_disconnect = true;
  auto throwing_channel = make_shared<Fake_channel>(nullptr, faults);
  auto connection2 = make_shared<Fake_connection>();
  Session session2(throwing_channel, connection2);
  EXPECT_NO_THROW(session2.close(nullptr));
  EXPECT_FALSE(connection2->connected());

  // Not even a std::exception: still swallowed; the connection is still closed.
  faults.m_throw_on_disconnect = false;
  faults.m_throw_non_std_on_disconnect = true;
  auto int_throwing_channel = make_shared<Fake_channel>(nullptr, faults);
  auto connection3 = make_shared<Fake_connection>();
  Session session3(int_throwing_channel, connection3);
  EXPECT_NO_THROW(session3.close(test_logger()));
  EXPECT_EQ(int_throwing_channel->disconnect_count(), 1u);
  EXPECT_FALSE(connection3->connected());
}

TEST(Session_error_test, Category)
{
  const Error_code err_code = error::Code::S_POOL_NOT_STARTED;
  EXPECT_STREQ(err_code.category().name(), "xfer/session");
  EXPECT_FALSE(err_code.message().empty());

  std::ostringstream os;
  os << error::Code::S_POOL_NOT_STARTED;
  error::Code code = error::Code::S_INVALID_ARGUMENT;
  std::istringstream is(os.str());
  is >> code;
  EXPECT_EQ(code, error::Code::S_POOL_NOT_STARTED);
}

} // namespace xfer::session::test
