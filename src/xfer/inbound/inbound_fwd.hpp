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

#include "xfer/common.hpp"
#include <ostream>

/**
 * Flow-Xfer module that mirrors a remote directory into a local one and serves the local files, one at a time, to
 * a polling consumer.  It is a user of xfer::session (by way of Remote_synchronizer borrowing sessions from a
 * session::Session_pool) rather than a part of it.
 *
 * The main class is Synchronizing_message_source, whose receive() polls a local File_source (normally a
 * Directory_poller) and, if that has nothing, runs one Synchronizer pass (normally Remote_synchronizer) and polls
 * again.  All configuration -- including the optional file name pattern, via Pattern_file_list_filter -- is
 * given once, at construction, via Inbound_config.
 */
namespace xfer::inbound
{

// Types.

// Find doc headers near the bodies of these compound types.

struct File_message;
struct Inbound_config;
class File_source;
class Synchronizer;
class Pattern_file_list_filter;
class Directory_poller;
class Remote_synchronizer;
class Synchronizing_message_source;

// Free functions.

/**
 * Ensures the given local directory exists: if it does, nothing happens; if it does not, it is created
 * (with any missing parents) if `auto_create`; else error::Code::S_LOCAL_DIRECTORY_NOT_FOUND is emitted.
 * If something other than a directory is there, error::Code::S_LOCAL_PATH_NOT_A_DIRECTORY is emitted.
 *
 * @param logger_ptr
 *        Logger to use for logging (INFO on creation; WARNING on error).
 * @param local_dir
 *        The directory path.  Empty causes error::Code::S_INVALID_ARGUMENT.
 * @param auto_create
 *        See above.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_INVALID_ARGUMENT, error::Code::S_LOCAL_DIRECTORY_NOT_FOUND,
 *        error::Code::S_LOCAL_PATH_NOT_A_DIRECTORY, system error codes (checking existence or creating failed).
 */
void ensure_local_directory(flow::log::Logger* logger_ptr, const fs::path& local_dir, bool auto_create,
                            Error_code* err_code = 0);

/**
 * Prints string representation of the given `File_message` to the given `ostream`.
 *
 * @relatesalso File_message
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const File_message& val);

/**
 * Prints string representation of the given `Inbound_config` to the given `ostream`.
 *
 * @relatesalso Inbound_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Inbound_config& val);

} // namespace xfer::inbound
