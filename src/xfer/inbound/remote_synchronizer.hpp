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

#include "xfer/inbound/file_source.hpp"
#include "xfer/inbound/pattern_file_list_filter.hpp"
#include "xfer/session/session_pool.hpp"
#include <boost/noncopyable.hpp>

namespace xfer::inbound
{

// Types.

/**
 * Synchronizer that mirrors the files of a remote directory into a local directory, borrowing a session from
 * a session::Session_pool for the duration of each pass.
 *
 * One pass (sync_remote_to_local()):
 *   -# Ensures the local directory exists (see ensure_local_directory(); Inbound_config::m_auto_create_local_dir).
 *   -# Checks out a session (session::Session_lease).
 *   -# Lists the remote directory; keeps the non-directory entries; and, if Inbound_config::m_filename_pattern is
 *      set, only those accepted by a Pattern_file_list_filter thereof.
 *   -# For each such file, unless a same-named file already exists locally: downloads it to the local directory
 *      under a temporary name (Inbound_config::m_temporary_file_suffix appended), then renames it into place;
 *      then, if Inbound_config::m_delete_remote_files, removes the remote file.
 *   -# Returns the session to the pool.
 *
 * The pass stops at the first failure, reporting it.  If a remote operation fails and the session no longer
 * reports itself connected, the session is discarded (session::Session_pool::discard()) instead of being returned
 * to the pool.
 *
 * ### Thread safety ###
 * sync_remote_to_local() may be invoked concurrently; passes are serialized by an internal mutex (they'd only
 * step on each other's temporary files otherwise).
 */
class Remote_synchronizer :
  public Synchronizer,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the synchronizer.  Nothing remote or local is touched.  Behavior is undefined if `*this` is used
   * after this emitted an error.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param pool
   *        Source of sessions.  Must outlive `*this`.  Need not be started yet (but must be, by the
   *        first sync_remote_to_local()).
   * @param config
   *        See Inbound_config.  It is copied.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (bad Inbound_config::m_filename_pattern; empty local directory or
   *        temporary suffix).
   */
  explicit Remote_synchronizer(flow::log::Logger* logger_ptr, session::Session_pool* pool,
                               const Inbound_config& config, Error_code* err_code = 0);

  // Methods.

  /**
   * Implements Synchronizer API.  See class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see ensure_local_directory(); see session::Session_pool::acquire(); whatever session::Channel
   *        emits; system error codes (local rename failed).
   * @return See Synchronizer::sync_remote_to_local().
   */
  size_t sync_remote_to_local(Error_code* err_code = 0) override;

  /**
   * The config from ctor.
   *
   * @return See above.
   */
  const Inbound_config& config() const;

private:
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Builds the remote path of the given file in Inbound_config::m_remote_dir.
   *
   * @param name
   *        File name.
   * @return See above.
   */
  std::string remote_path(const std::string& name) const;

  // Data.

  /// See ctor.
  session::Session_pool* const m_pool;

  /// See ctor.
  const Inbound_config m_config;

  /// Made from Inbound_config::m_filename_pattern, if any.
  std::optional<Pattern_file_list_filter> m_filter_or_none;

  /// Serializes sync_remote_to_local().
  mutable Mutex m_mutex;
}; // class Remote_synchronizer

} // namespace xfer::inbound
