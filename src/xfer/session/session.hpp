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

#include "xfer/session/session_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace xfer::session
{

// Types.

/// One entry in a remote directory listing, as emitted by Channel::ls().
struct Remote_file
{
  // Data.

  /// Name of the entry within its directory: no path separators.
  std::string m_name;

  /// `true` if and only if the entry is a directory (including the `.` and `..` pseudo-entries).
  bool m_is_dir;

  /// Size in bytes as reported by the remote side; meaningless for directories.
  uint64_t m_size;
}; // struct Remote_file

/**
 * The file-transfer subsystem half of a Session: the remote-file operations, plus the ability to query and
 * force-close its own liveness.  Implementations (SFTP subsystem channel, whatever) are outside Flow-Xfer; see
 * Session_factory.
 *
 * ### Error reporting ###
 * Implementations shall follow the Flow convention used throughout: each method taking `Error_code* err_code`
 * emits failure into `*err_code` (and clears it on success) if it is not null; or throws
 * `flow::error::Runtime_error` on failure if it is null.
 *
 * ### Thread safety ###
 * None required: a Channel belongs to exactly one Session, which is in turn accessed by exactly one party at a time.
 */
class Channel
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Channel();

  // Methods.

  /**
   * Returns `true` if and only if the channel is open.  Must not block.
   *
   * @return See above.
   */
  virtual bool connected() const = 0;

  /**
   * Closes the channel.  Afterwards connected() shall return `false`.
   *
   * @param err_code
   *        See class doc header.
   */
  virtual void disconnect(Error_code* err_code) = 0;

  /**
   * Lists the contents of the given remote directory.
   *
   * @param remote_dir
   *        Remote directory path.
   * @param err_code
   *        See class doc header.
   * @return The entries; empty on failure.
   */
  virtual std::vector<Remote_file> ls(const std::string& remote_dir, Error_code* err_code) = 0;

  /**
   * Downloads the given remote file into the given local file, creating or truncating the latter.
   *
   * @param remote_path
   *        Remote file path.
   * @param local_path
   *        Local file path.
   * @param err_code
   *        See class doc header.
   */
  virtual void get(const std::string& remote_path, const fs::path& local_path, Error_code* err_code) = 0;

  /**
   * Removes the given remote file.
   *
   * @param remote_path
   *        Remote file path.
   * @param err_code
   *        See class doc header.
   */
  virtual void rm(const std::string& remote_path, Error_code* err_code) = 0;
}; // class Channel

/**
 * The transport half of a Session: the authenticated connection underneath its Channel.  Same notes as for
 * Channel regarding error reporting and thread safety.
 */
class Connection
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Connection();

  // Methods.

  /**
   * Returns `true` if and only if the connection is up.  Must not block.
   *
   * @return See above.
   */
  virtual bool connected() const = 0;

  /**
   * Closes the connection.  Afterwards connected() shall return `false`.
   *
   * @param err_code
   *        See Channel doc header.
   */
  virtual void disconnect(Error_code* err_code) = 0;
}; // class Connection

/**
 * One live, authenticated connection to a remote file-transfer endpoint: a Channel plus its underlying Connection,
 * each independently queryable for liveness and independently closable.  A Session is created exclusively by
 * a Session_factory and is passed around (owned) via #Session_ptr.
 *
 * The Channel and Connection are held via `shared_ptr`, as transports are free to share those objects
 * among themselves (e.g., a Connection multiplexing channels); but the Session, as such, is not shareable.
 *
 * The only nontrivial operation is close(), the best-effort teardown used by Session_pool whenever it decides
 * not to cache a session.
 */
class Session :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted Channel handle.
  using Channel_ptr = boost::shared_ptr<Channel>;

  /// Short-hand for ref-counted Connection handle.
  using Connection_ptr = boost::shared_ptr<Connection>;

  // Constructors/destructor.

  /**
   * Constructs the session.  Nothing is connected or otherwise touched.
   *
   * @param channel
   *        The channel.  Null causes undefined behavior (assertion may trip).
   * @param connection
   *        The connection underlying `channel`.  Null causes undefined behavior (assertion may trip).
   */
  explicit Session(Channel_ptr channel, Connection_ptr connection);

  // Methods.

  /**
   * The channel.
   *
   * @return See above.
   */
  Channel& channel() const;

  /**
   * The connection.
   *
   * @return See above.
   */
  Connection& connection() const;

  /**
   * Returns `true` if and only if both the channel and the connection report themselves connected.
   *
   * @return See above.
   */
  bool connected() const;

  /**
   * Process-unique number identifying `*this`; for logging.
   *
   * @return See above.
   */
  uint64_t id() const;

  /**
   * Best-effort teardown: disconnects the channel, if it reports itself connected; then disconnects the
   * connection, if it reports itself connected.  Any failure in either step is logged (WARNING) and otherwise
   * ignored -- including the other step still being attempted.  Never throws; so it is safe to use in cleanup
   * paths.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  Null means no logging.
   */
  void close(flow::log::Logger* logger_ptr) noexcept;

private:
  // Data.

  /// See ctor.
  const Channel_ptr m_channel;

  /// See ctor.
  const Connection_ptr m_connection;

  /// See id().
  const uint64_t m_id;
}; // class Session

/**
 * Capability producing a new, ready-to-use Session on demand: typically by connecting to and authenticating
 * against a particular remote endpoint.  Session_pool treats it as entirely opaque and never retries.
 */
class Session_factory
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Session_factory();

  // Methods.

  /**
   * Produces a new connected Session or fails.  May block (connection establishment).
   *
   * @param err_code
   *        Same semantics as in Channel doc header.  #Error_code generated: implementation-defined
   *        (network unreachable, authentication rejected...).
   * @return The new Session on success; null on failure.
   */
  virtual Session_ptr create_session(Error_code* err_code) = 0;
}; // class Session_factory

} // namespace xfer::session
