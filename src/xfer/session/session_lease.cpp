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
#include "xfer/session/session_lease.hpp"
#include <cassert>

namespace xfer::session
{

// Implementations.

Session_lease::Session_lease(Session_pool* pool, Error_code* err_code) :
  m_pool(pool),
  m_session(m_pool->acquire(err_code)) // Throws if err_code is null and it fails.
{
  // That's it.
}

Session_lease::~Session_lease()
{
  release();
}

bool Session_lease::empty() const
{
  return !m_session;
}

Session* Session_lease::get() const
{
  return m_session.get();
}

Session* Session_lease::operator->() const
{
  assert(m_session);
  return m_session.get();
}

Session& Session_lease::operator*() const
{
  assert(m_session);
  return *m_session;
}

void Session_lease::release()
{
  if (m_session)
  {
    m_pool->release(std::move(m_session));
  }
}

void Session_lease::discard()
{
  if (m_session)
  {
    m_pool->discard(std::move(m_session));
  }
}

} // namespace xfer::session
