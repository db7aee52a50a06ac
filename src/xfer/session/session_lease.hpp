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

#include "xfer/session/session_pool.hpp"

namespace xfer::session
{

// Types.

/**
 * RAII borrower of one Session from a Session_pool: the ctor does Session_pool::acquire(); the dtor does
 * Session_pool::release() -- unless discard() was called, in which case the session was already handed to
 * Session_pool::discard().
 *
 * Typical use:
 *
 *   ~~~
 *   session::Session_lease lease(&pool); // Throws on failure.
 *   const auto files = lease->channel().ls("/outbound", &err_code);
 *   if (err_code)
 *   {
 *     lease.discard(); // Don't return a busted session to the pool.
 *     return;
 *   }
 *   // ...
 *   // (Session released back into pool when `lease` goes out of scope.)
 *   ~~~
 */
class Session_lease :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Checks out a session via `pool->acquire()`.  On failure (with `err_code` not null) `*this` is empty.
   *
   * @param pool
   *        The pool.  Must outlive `*this`.
   * @param err_code
   *        See Session_pool::acquire().
   */
  explicit Session_lease(Session_pool* pool, Error_code* err_code = 0);

  /// Returns the session (if any) to the pool via Session_pool::release().
  ~Session_lease();

  // Methods.

  /**
   * Returns `true` if and only if `*this` holds a session.
   *
   * @return See above.
   */
  bool empty() const;

  /**
   * The session; null if empty().
   *
   * @return See above.
   */
  Session* get() const;

  /**
   * The session; behavior undefined if empty() (assertion may trip).
   *
   * @return See above.
   */
  Session* operator->() const;

  /**
   * The session; behavior undefined if empty() (assertion may trip).
   *
   * @return See above.
   */
  Session& operator*() const;

  /// Returns the session to the pool now via Session_pool::release(); `*this` becomes empty().  No-op if empty().
  void release();

  /// Hands the session to Session_pool::discard() now; `*this` becomes empty().  No-op if empty().
  void discard();

private:
  // Data.

  /// See ctor.
  Session_pool* const m_pool;

  /// The session; null if empty().
  Session_ptr m_session;
}; // class Session_lease

} // namespace xfer::session
