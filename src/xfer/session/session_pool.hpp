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
#pragma once

#include "xfer/session/session.hpp"
#include "xfer/session/error.hpp"
#include <boost/noncopyable.hpp>
#include <deque>
#include <optional>

namespace xfer::session
{

// Types.

/**
 * Configuration of a Session_pool.  A simple data store, copied into the Session_pool at construction.
 *
 * Only #m_max_idle_sessions is interpreted by Session_pool itself.  #m_auto_startup and #m_phase are merely
 * recorded and exposed for the benefit of an outside orchestrator (see lifecycle::Lifecycle_manager).
 */
struct Session_pool_config
{
  // Constants.

  /// Default for #m_max_idle_sessions.
  static constexpr size_t S_DEFAULT_MAX_IDLE_SESSIONS = 10;

  // Data.

  /**
   * The most sessions the pool shall keep cached while idle; must be positive, or Session_pool::start() fails.
   * Does not limit how many sessions may be checked out (live) simultaneously.
   */
  size_t m_max_idle_sessions = S_DEFAULT_MAX_IDLE_SESSIONS;

  /// Whether an orchestrator should start() the pool automatically.  Not interpreted by the pool.
  bool m_auto_startup = false;

  /// Start/stop ordering hint for an orchestrator: lower starts earlier and stops later.  Not interpreted by the pool.
  int m_phase = 0;
}; // struct Session_pool_config

/**
 * A bounded cache of idle Session objects, with acquire()/release() to check sessions out and in, creating new
 * ones lazily via a Session_factory on a cache miss; gated by a start()/stop() lifecycle.
 *
 * ### Lifecycle ###
 * There are 3 states:
 *   - *Created* (the initial state): no idle-session container exists yet.  acquire() fails with
 *     error::Code::S_POOL_NOT_STARTED (it never auto-starts; nor does it block).  release() destroys.
 *   - *Running* (after start()): acquire() serves from the idle container, else makes a new Session;
 *     release() caches into the container if there's room, else destroys.
 *   - *Stopped* (after stop()): the idle container has been emptied (its sessions destroyed).  release() destroys;
 *     acquire() still works but can only create new sessions, which will be destroyed on release().
 *
 * start() may be invoked again after stop(), in which case the pool is Running again.  start() while already
 * Running destroys the currently idle sessions and starts over with an empty container.
 *
 * ### Capacity ###
 * Session_pool_config::m_max_idle_sessions bounds the number of *idle* sessions at all times; the check is done
 * at release() time.  No bound is placed on the number of sessions checked out at a given time: a burst of N
 * concurrent acquire()s on an empty pool makes N sessions, and at most `max_idle_sessions()` of them will remain
 * after they are all release()d.
 *
 * Idle sessions are handed out in FIFO order (the one release()d earliest goes out first).  No health-check is
 * performed on an idle session before handing it out: a session is trusted until the caller proves it broken,
 * at which point the caller should discard() it instead of release()ing it.
 *
 * ### Error handling ###
 * acquire() can fail: error::Code::S_POOL_NOT_STARTED; or whatever the Session_factory emitted (passed-through
 * unmodified; an exception thrown by it is likewise not caught).  start() can fail:
 * error::Code::S_INVALID_ARGUMENT.  release(), discard(), stop() never fail: session destruction is best-effort
 * (see Session::close()), its failures merely logged.  `stop(F)` will let an exception thrown by `F()` through,
 * but by then `*this` is already Stopped.
 *
 * ### Thread safety ###
 * All public methods may be invoked concurrently with each other.  A single mutex protects the idle container and
 * the running flag.  acquire() holds it while invoking Session_factory::create_session(): hence a slow
 * connection establishment delays all concurrent operations on `*this`.  There is no timeout; a user
 * wanting a bounded wait must impose it around acquire() externally.  Session::close() on the other hand is
 * always done *outside* the mutex (the session having been removed from `*this` inside it).
 *
 * @internal
 * ### Implementation ###
 * The state is #m_idle_sessions_or_none (container; `nullopt` means Created state) and #m_running; both
 * accessed only with #m_mutex locked.  The container is a plain (not internally synchronized) `deque`: the
 * check-then-create sequence of acquire() must be atomic anyway, so the mutex is needed regardless.
 */
class Session_pool :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the pool in Created state.  No sessions are made.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param session_factory
   *        Makes sessions on an acquire() cache miss.  Must outlive `*this`.  If null, start() will fail.
   * @param config
   *        See Session_pool_config.  It is copied.
   */
  explicit Session_pool(flow::log::Logger* logger_ptr, Session_factory* session_factory,
                        const Session_pool_config& config = Session_pool_config());

  /// Destroys (see Session::close()) all idle sessions.  Checked-out sessions are, of course, not touched.
  ~Session_pool();

  // Methods.

  /**
   * Moves to Running state, allocating a fresh, empty idle-session container.  If there is an existing container
   * (restart after stop(); or start() while Running) its sessions, if any, are destroyed first.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`max_idle_sessions() == 0`, or null Session_factory; state unchanged).
   */
  void start(Error_code* err_code = 0);

  /**
   * Moves to Stopped state: the idle sessions are destroyed (best-effort) and removed; subsequently release()
   * destroys instead of caching.  No-op (other than logging) if never started.
   */
  void stop();

  /**
   * Same as stop(); then synchronously invokes `on_stopped_func()` to signal the stop is complete.  If that
   * throws, the exception propagates; `*this` is already Stopped at that point regardless.
   *
   * The callback is invoked without any `*this` lock held; so it may safely invoke `*this` methods.
   *
   * @tparam Task
   *         Function object invoked as `void` with no args.
   * @param on_stopped_func
   *        See above.
   */
  template<typename Task>
  void stop(Task&& on_stopped_func);

  /**
   * Returns `true` if and only if `*this` is in Running state.
   *
   * @return See above.
   */
  bool running() const;

  /**
   * Checks out a Session: a cached idle one if available; otherwise a brand-new one from the Session_factory.
   * Never waits for a session to be release()d.
   *
   * The returned session is no longer in the idle container; it is owned solely by the caller until
   * release()d (or discard()ed) back to `*this`.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_POOL_NOT_STARTED (start() was never called; Session_factory not invoked);
   *        whatever Session_factory::create_session() emits.
   * @return The session on success; null on failure.
   */
  Session_ptr acquire(Error_code* err_code = 0);

  /**
   * Checks in a Session previously obtained from acquire(): if Running and the idle container has room
   * (fewer than max_idle_sessions() entries) it is cached; otherwise it is destroyed (see Session::close()).
   * A null `session` is a no-op.  Never fails.
   *
   * @param session
   *        The session.  It is moved-from (becomes null).
   */
  void release(Session_ptr&& session);

  /**
   * Checks in a Session previously obtained from acquire() that the caller has found broken: it is destroyed
   * (see Session::close()), regardless of state or capacity.  A null `session` is a no-op.  Never fails.
   *
   * @param session
   *        The session.  It is moved-from (becomes null).
   */
  void discard(Session_ptr&& session);

  /**
   * Returns the number of sessions currently cached idle.  Always `<= max_idle_sessions()`.  0 in Created state.
   *
   * @return See above.
   */
  size_t idle_count() const;

  /**
   * Returns Session_pool_config::m_max_idle_sessions from ctor.
   *
   * @return See above.
   */
  size_t max_idle_sessions() const;

  /**
   * Returns Session_pool_config::m_auto_startup from ctor.
   *
   * @return See above.
   */
  bool auto_startup() const;

  /**
   * Returns Session_pool_config::m_phase from ctor.
   *
   * @return See above.
   */
  int phase() const;

private:
  // Types.

  /// The idle-session container type.  Sessions are pushed at the back and popped from the front.
  using Idle_sessions = std::deque<Session_ptr>;

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Session::close()s each of the given sessions; the sessions are then deleted.  Must be called *without*
   * #m_mutex locked.
   *
   * @param sessions
   *        Sessions removed from `*this` (or never added to it) previously.
   * @param context
   *        Brief description of why, for logging.
   */
  void destroy_sessions(Idle_sessions&& sessions, String_view context);

  /**
   * Same as the other overload but for 1 session.  Null is fine (no-op).
   *
   * @param session
   *        See other overload.
   * @param context
   *        See other overload.
   */
  void destroy_session(Session_ptr&& session, String_view context);

  // Data.

  /// See ctor.
  Session_factory* const m_session_factory;

  /// See ctor.
  const Session_pool_config m_config;

  /// Protects #m_idle_sessions_or_none and #m_running.
  mutable Mutex m_mutex;

  /// The idle-session container; `nullopt` in Created state.  Protected by #m_mutex.
  std::optional<Idle_sessions> m_idle_sessions_or_none;

  /// See running().  Protected by #m_mutex.
  bool m_running;
}; // class Session_pool

// Template implementations.

template<typename Task>
void Session_pool::stop(Task&& on_stopped_func)
{
  stop();

  FLOW_LOG_TRACE("Session pool [" << *this << "]: Stopped; invoking on-stopped callback.");
  on_stopped_func();
  FLOW_LOG_TRACE("Handler finished.");
}

} // namespace xfer::session
