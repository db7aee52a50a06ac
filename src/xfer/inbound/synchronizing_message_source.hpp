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
#include "xfer/session/session_fwd.hpp"
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace xfer::inbound
{

// Types.

/**
 * File_source serving files that originate in a remote directory: receive() polls a local File_source; if that has
 * nothing, it invokes a Synchronizer once (a single remote round-trip, not a loop), then polls the local
 * File_source again, returning whatever that yields (possibly nothing).
 *
 * Normally one constructs it from a session::Session_pool and an Inbound_config; it then creates, and owns, a
 * Directory_poller on Inbound_config::m_local_dir and a Remote_synchronizer configured with the same
 * Inbound_config (file name pattern included).  Alternatively both capabilities can be supplied by the user.
 *
 * On the first receive() (and on each subsequent one, until it succeeds) the local directory is validated: see
 * ensure_local_directory() and Inbound_config::m_auto_create_local_dir.
 *
 * ### Thread safety ###
 * receive() may be invoked concurrently, provided the two capabilities allow it (the built-in ones do).
 */
class Synchronizing_message_source :
  public File_source,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for owning handle of the local File_source.
  using File_source_ptr = boost::movelib::unique_ptr<File_source>;

  /// Short-hand for owning handle of the Synchronizer.
  using Synchronizer_ptr = boost::movelib::unique_ptr<Synchronizer>;

  // Constants.

  /// Brief description of what `*this` is, for logging and diagnostics.
  static constexpr char S_COMPONENT_TYPE[] = "xfer:inbound-channel-adapter";

  // Constructors/destructor.

  /**
   * Constructs the source, creating a Directory_poller and a Remote_synchronizer (which borrows sessions from
   * `pool`) from `config`.  Nothing remote or local is touched yet.  Behavior is undefined if `*this` is used
   * after this emitted an error.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param pool
   *        See Remote_synchronizer ctor.
   * @param config
   *        See Inbound_config.  It is copied.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see Remote_synchronizer ctor.
   */
  explicit Synchronizing_message_source(flow::log::Logger* logger_ptr, session::Session_pool* pool,
                                        const Inbound_config& config, Error_code* err_code = 0);

  /**
   * Constructs the source with user-supplied capabilities.  Of `config` only Inbound_config::m_local_dir
   * and Inbound_config::m_auto_create_local_dir are used.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param config
   *        See above.
   * @param file_source
   *        The local File_source.  Must not be null.
   * @param synchronizer
   *        The Synchronizer.  Must not be null.
   */
  explicit Synchronizing_message_source(flow::log::Logger* logger_ptr, const Inbound_config& config,
                                        File_source_ptr&& file_source, Synchronizer_ptr&& synchronizer);

  // Methods.

  /**
   * Implements File_source API.  See class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see ensure_local_directory(); whatever the local File_source and the Synchronizer emit.
   * @return See File_source::receive().
   */
  std::optional<File_message> receive(Error_code* err_code = 0) override;

private:
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Validates (or creates) the local directory, unless that has already succeeded before.
   *
   * @param err_code
   *        Not null.  See receive().
   */
  void init(Error_code* err_code);

  // Data.

  /// See ctor.
  const Inbound_config m_config;

  /// See ctor.
  File_source_ptr m_file_source;

  /// See ctor.
  Synchronizer_ptr m_synchronizer;

  /// Protects #m_initialized.
  mutable Mutex m_mutex;

  /// Whether init() has succeeded.  Protected by #m_mutex.
  bool m_initialized;
}; // class Synchronizing_message_source

} // namespace xfer::inbound
