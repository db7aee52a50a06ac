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
#include <boost/unordered_set.hpp>
#include <boost/noncopyable.hpp>
#include <deque>

namespace xfer::inbound
{

// Types.

/**
 * File_source serving the regular files in one local directory, each file at most once (accept-once) over the
 * lifetime of `*this`.
 *
 * receive() serves from an internal queue; when that is empty it rescans the directory and enqueues each regular
 * file it has not enqueued before, in file name order.  Files whose name ends in the temporary suffix given at
 * construction (downloads in progress) are skipped without being remembered, so they will be picked up under their
 * final name.  Sub-directories are not descended into.
 *
 * A file is considered consumed once emitted; `*this` does not remove or otherwise touch it.
 *
 * ### Thread safety ###
 * receive() may be invoked concurrently; an internal mutex serializes it.
 */
class Directory_poller :
  public File_source,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the poller.  The directory is not accessed until receive().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param directory
   *        Local directory to serve.
   * @param temporary_file_suffix
   *        See class doc header.  Empty means no file is skipped on this account.
   */
  explicit Directory_poller(flow::log::Logger* logger_ptr, const fs::path& directory,
                            const std::string& temporary_file_suffix = Inbound_config::S_DEFAULT_TEMPORARY_FILE_SUFFIX);

  // Methods.

  /**
   * Implements File_source API.  See class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system error codes (the directory could not be listed: e.g., it does not exist).
   * @return See File_source::receive().
   */
  std::optional<File_message> receive(Error_code* err_code = 0) override;

  /**
   * The directory from ctor.
   *
   * @return See above.
   */
  const fs::path& directory() const;

private:
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Enqueues the not-yet-seen eligible files of #m_directory into #m_queue.  #m_mutex must be locked.
   *
   * @param err_code
   *        Not null.  See receive().
   */
  void scan(Error_code* err_code);

  /**
   * Returns `true` if and only if `name` ends in #m_temporary_file_suffix (and the latter is not empty).
   *
   * @param name
   *        File name.
   * @return See above.
   */
  bool is_temporary(const std::string& name) const;

  // Data.

  /// See ctor.
  const fs::path m_directory;

  /// See ctor.
  const std::string m_temporary_file_suffix;

  /// Protects the following.
  mutable Mutex m_mutex;

  /// Files found but not yet emitted, in emission order.
  std::deque<fs::path> m_queue;

  /// Names of all files ever enqueued.  Grows forever; accept-once must remember everything.
  boost::unordered_set<std::string> m_seen;
}; // class Directory_poller

} // namespace xfer::inbound
