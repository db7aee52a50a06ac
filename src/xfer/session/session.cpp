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
#include <atomic>
#include <cassert>
#include <exception>

namespace xfer::session
{

namespace
{

/// File-local helper variable: the last value of Session::id() issued; so the next one = this plus 1.
std::atomic<uint64_t> last_session_id(0);

} // namespace (anon)

// Implementations.

Channel::~Channel() = default;

Connection::~Connection() = default;

Session_factory::~Session_factory() = default;

Session::Session(Channel_ptr channel, Connection_ptr connection) :
  m_channel(std::move(channel)),
  m_connection(std::move(connection)),
  m_id(++last_session_id)
{
  assert(m_channel && m_connection && "Session must comprise a channel and a connection.");
}

Channel& Session::channel() const
{
  return *m_channel;
}

Connection& Session::connection() const
{
  return *m_connection;
}

bool Session::connected() const
{
  return m_channel->connected() && m_connection->connected();
}

uint64_t Session::id() const
{
  return m_id;
}

void Session::close(flow::log::Logger* logger_ptr) noexcept
{
  using std::exception;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_SESSION);

  /* Both steps are best-effort, and each is attempted regardless of how the other went.  The transport is
   * supposed to report via Error_code when given a non-null one; but it's not our code, so we also catch
   * what it might throw anyway rather than let it escape into a cleanup path. */

  Error_code err_code;
  try
  {
    if (m_channel->connected())
    {
      m_channel->disconnect(&err_code);
    }
  }
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Channel disconnect threw [" << exc.what() << "]; ignoring.");
  }
  catch (...)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Channel disconnect threw a non-std exception; ignoring.");
  }
  if (err_code)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Channel disconnect failed with [" << err_code << "] "
                     "[" << err_code.message() << "]; ignoring.");
    err_code.clear();
  }

  try
  {
    if (m_connection->connected())
    {
      m_connection->disconnect(&err_code);
    }
  }
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Connection disconnect threw [" << exc.what() << "]; ignoring.");
  }
  catch (...)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Connection disconnect threw a non-std exception; ignoring.");
  }
  if (err_code)
  {
    FLOW_LOG_WARNING("Session [" << *this << "]: Connection disconnect failed with [" << err_code << "] "
                     "[" << err_code.message() << "]; ignoring.");
  }

  FLOW_LOG_TRACE("Session [" << *this << "]: Closed (best-effort).");
} // Session::close()

std::ostream& operator<<(std::ostream& os, const Remote_file& val)
{
  return os << '[' << val.m_name << (val.m_is_dir ? "/" : "") << "] size[" << val.m_size << ']';
}

std::ostream& operator<<(std::ostream& os, const Session& val)
{
  return os << "xfer_sess[" << val.id() << ']';
}

} // namespace xfer::session
