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

#include "xfer/inbound/inbound_fwd.hpp"
#include <optional>
#include <string>

namespace xfer::inbound
{

// Types.

/// What a File_source emits: one local file, ready to be consumed.
struct File_message
{
  // Data.

  /// Path to the file.  It is in the local directory of the emitting File_source.
  fs::path m_file;
}; // struct File_message

/**
 * The configuration of inbound synchronization: of a Remote_synchronizer, and of a Synchronizing_message_source
 * (which also uses it to configure the Remote_synchronizer it may create).  A simple data store.
 */
struct Inbound_config
{
  // Constants.

  /// Default for #m_temporary_file_suffix.
  static constexpr char S_DEFAULT_TEMPORARY_FILE_SUFFIX[] = ".writing";

  // Data.

  /// Remote directory to mirror.  Files only (not sub-directories) are considered.
  std::string m_remote_dir;

  /// Local directory into which remote files are downloaded, and from which they are served.
  fs::path m_local_dir;

  /**
   * If not `nullopt`: ECMAScript regular expression; only remote files whose *entire* name matches it are
   * downloaded.  If `nullopt`: all remote files are.
   */
  std::optional<std::string> m_filename_pattern;

  /// Whether to create #m_local_dir (with missing parents) if it does not exist, instead of failing.
  bool m_auto_create_local_dir = false;

  /// Whether to remove each remote file once it has been downloaded successfully.
  bool m_delete_remote_files = false;

  /**
   * A file is downloaded as its name plus this suffix, and renamed to its actual name once complete.  Files thus
   * suffixed are ignored by Directory_poller.  Must not be empty.
   */
  std::string m_temporary_file_suffix = S_DEFAULT_TEMPORARY_FILE_SUFFIX;
}; // struct Inbound_config

/**
 * Capability emitting local files to a polling consumer, one at a time: receive() returns the next file, or
 * nothing if none is available right now.  It never blocks waiting for a file to appear.
 *
 * Error reporting follows the Flow convention (null `err_code` => throw).  Implementations must be safe for
 * concurrent receive() calls.
 */
class File_source
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~File_source();

  // Methods.

  /**
   * Returns the next file available, or `nullopt` if none (or on failure).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: implementation-defined.
   * @return See above.
   */
  virtual std::optional<File_message> receive(Error_code* err_code = 0) = 0;
}; // class File_source

/**
 * Capability performing one remote-to-local synchronization pass: copying remote files (of interest) into a
 * local directory.  Error reporting as for File_source.  Implementations must be safe for concurrent calls.
 */
class Synchronizer
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Synchronizer();

  // Methods.

  /**
   * Performs one synchronization pass.  Blocks for the duration (remote I/O).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: implementation-defined.
   * @return Number of files newly placed into the local directory (even on failure, those before the failure).
   */
  virtual size_t sync_remote_to_local(Error_code* err_code = 0) = 0;
}; // class Synchronizer

} // namespace xfer::inbound
