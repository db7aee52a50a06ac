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
#include <flow/error/error.hpp>
#include <cassert>

namespace xfer::session
{

// Implementations.

Session_pool::Session_pool(flow::log::Logger* logger_ptr, Session_factory* session_factory,
                           const Session_pool_config& config) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_session_factory(session_factory),
  m_config(config),
  m_running(false)
{
  FLOW_LOG_INFO("Session pool [" << *this << "]: Created with config [" << m_config << "].  "
                "Sessions are not available until start().");
}

Session_pool::~Session_pool()
{
  Idle_sessions doomed;
  {
    Lock_guard lock(m_mutex);
    if (m_idle_sessions_or_none)
    {
      doomed.swap(*m_idle_sessions_or_none);
    }
  }

  FLOW_LOG_INFO("Session pool [" << *this << "]: Shutting down.  Idle sessions remaining: "
                "[" << doomed.size() << "]; they will now be destroyed.");
  destroy_sessions(std::move(doomed), "pool destruction");
}

void Session_pool::start(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { start(actual_err_code); },
         err_code, "Session_pool::start()"))
  {
    return;
  }
  // else

  if ((m_config.m_max_idle_sessions == 0) || (!m_session_factory))
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    FLOW_LOG_WARNING("Session pool [" << *this << "]: Start request: Cannot start; max-idle-sessions must be "
                     "positive, and a session factory must be supplied.  Error emitted: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  Idle_sessions stale;
  bool was_running;
  {
    Lock_guard lock(m_mutex);

    was_running = m_running;
    if (m_idle_sessions_or_none)
    {
      // Restart (or double start()): don't just drop whatever is cached -- those are live connections.
      stale.swap(*m_idle_sessions_or_none);
    }
    m_idle_sessions_or_none.emplace();
    m_running = true;
  }

  FLOW_LOG_INFO("Session pool [" << *this << "]: Started (was running? = [" << was_running << "]).  Idle "
                "sessions from before, to destroy: [" << stale.size() << "].");
  destroy_sessions(std::move(stale), "pool (re)start");

  err_code->clear();
} // Session_pool::start()

void Session_pool::stop()
{
  Idle_sessions doomed;
  bool had_container;
  {
    Lock_guard lock(m_mutex);

    had_container = bool(m_idle_sessions_or_none);
    if (had_container)
    {
      /* Move them out, leaving an empty (but existing) container: acquire() remains available (it will just
       * always create new sessions); release() will destroy, as m_running is about to become false. */
      doomed.swap(*m_idle_sessions_or_none);
    }
    m_running = false;
  }

  if (!had_container)
  {
    FLOW_LOG_INFO("Session pool [" << *this << "]: Stop request: Pool was never started; nothing to destroy.");
    return;
  }
  // else

  FLOW_LOG_INFO("Session pool [" << *this << "]: Stop request: Stopped.  Destroying idle sessions: "
                "[" << doomed.size() << "].  Sessions released from now on shall be destroyed, not cached.");
  destroy_sessions(std::move(doomed), "pool stop");
} // Session_pool::stop()

bool Session_pool::running() const
{
  Lock_guard lock(m_mutex);
  return m_running;
}

Session_ptr Session_pool::acquire(Error_code* err_code)
{
  Session_ptr session;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Session_ptr { return acquire(actual_err_code); },
         &session, err_code, "Session_pool::acquire()"))
  {
    return session;
  }
  // else

  Lock_guard lock(m_mutex);

  if (!m_idle_sessions_or_none)
  {
    *err_code = error::Code::S_POOL_NOT_STARTED;
    FLOW_LOG_WARNING("Session pool [" << *this << "]: Acquire request: Pool was never started.  Error emitted: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return session;
  }
  // else
  auto& idle_sessions = *m_idle_sessions_or_none;

  if (!idle_sessions.empty())
  {
    session = std::move(idle_sessions.front());
    idle_sessions.pop_front();

    FLOW_LOG_TRACE("Session pool [" << *this << "]: Acquire request: Checking out idle session "
                   "[" << *session << "]; idle sessions remaining: [" << idle_sessions.size() << "].");
    err_code->clear();
    return session;
  }
  // else

  /* Cache miss.  Make one, still holding the lock, so that the check-then-create is atomic.  Yes, that means
   * connection establishment blocks everyone else; see class doc header Thread safety section.
   * If the factory throws (despite our non-null err_code), it goes straight to the caller; the lock
   * is released by ~Lock_guard; and nothing was inserted anywhere. */
  FLOW_LOG_TRACE("Session pool [" << *this << "]: Acquire request: No idle session; creating one (lock held).");
  session = m_session_factory->create_session(err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Session pool [" << *this << "]: Acquire request: Session factory failed.  Error passed "
                     "through: [" << *err_code << "] [" << err_code->message() << "].");
    session.reset();
    return session;
  }
  // else

  assert(session && "Session_factory contract: non-null Session on success.");
  FLOW_LOG_INFO("Session pool [" << *this << "]: Acquire request: Created and checking out new session "
                "[" << *session << "].");
  return session;
} // Session_pool::acquire()

void Session_pool::release(Session_ptr&& session_arg)
{
  Session_ptr session(std::move(session_arg));
  if (!session)
  {
    return;
  }
  // else

  {
    Lock_guard lock(m_mutex);

    if (m_running)
    {
      /* m_running implies we have a container (running => started).  Enforce the capacity at the point of
       * insertion: this is the only place where the container grows. */
      assert(m_idle_sessions_or_none);
      auto& idle_sessions = *m_idle_sessions_or_none;

      if (idle_sessions.size() < m_config.m_max_idle_sessions)
      {
        FLOW_LOG_TRACE("Session pool [" << *this << "]: Release request: Caching session [" << *session << "]; "
                       "idle sessions: [" << (idle_sessions.size() + 1) << "].");
        idle_sessions.emplace_back(std::move(session));
        return;
      }
      // else
      FLOW_LOG_TRACE("Session pool [" << *this << "]: Release request: Idle sessions at capacity "
                     "[" << idle_sessions.size() << "]; will destroy session [" << *session << "].");
    }
    else
    {
      FLOW_LOG_TRACE("Session pool [" << *this << "]: Release request: Pool not running; will destroy session "
                     "[" << *session << "].");
    }
  } // Lock_guard lock(m_mutex);

  destroy_session(std::move(session), "release");
} // Session_pool::release()

void Session_pool::discard(Session_ptr&& session_arg)
{
  Session_ptr session(std::move(session_arg));
  if (session)
  {
    FLOW_LOG_INFO("Session pool [" << *this << "]: Discard request: User reports session [" << *session << "] "
                  "broken; destroying it.");
    destroy_session(std::move(session), "discard");
  }
}

size_t Session_pool::idle_count() const
{
  Lock_guard lock(m_mutex);
  return m_idle_sessions_or_none ? m_idle_sessions_or_none->size() : 0;
}

size_t Session_pool::max_idle_sessions() const
{
  return m_config.m_max_idle_sessions;
}

bool Session_pool::auto_startup() const
{
  return m_config.m_auto_startup;
}

int Session_pool::phase() const
{
  return m_config.m_phase;
}

void Session_pool::destroy_sessions(Idle_sessions&& sessions, String_view context)
{
  for (auto& session : sessions)
  {
    destroy_session(std::move(session), context);
  }
  sessions.clear();
}

void Session_pool::destroy_session(Session_ptr&& session_arg, String_view context)
{
  Session_ptr session(std::move(session_arg));
  if (!session)
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Session pool [" << *this << "]: Destroying session [" << *session << "] (" << context << ").");
  session->close(get_logger());
  // session dtor runs now; the Channel/Connection go away with it unless shared elsewhere.
}

std::ostream& operator<<(std::ostream& os, const Session_pool_config& val)
{
  return os << "max_idle[" << val.m_max_idle_sessions << "] auto_startup[" << val.m_auto_startup << "] "
               "phase[" << val.m_phase << ']';
}

std::ostream& operator<<(std::ostream& os, const Session_pool& val)
{
  // Careful: may be invoked with m_mutex locked.  Only touch immutable things.
  return os << "xfer_sess_pool@" << static_cast<const void*>(&val) << " max_idle[" << val.max_idle_sessions() << ']';
}

} // namespace xfer::session
