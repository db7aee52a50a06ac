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
#include <boost/move/unique_ptr.hpp>
#include <ostream>

/**
 * Flow-Xfer module providing a bounded cache of reusable remote-file-transfer sessions (think: SFTP connections),
 * so that code performing remote I/O can obtain a ready-to-use session without paying per-request
 * connection-setup (TCP, key exchange, authentication) cost.  A synopsis follows:
 *
 * A Session is one authenticated connection to a remote file-transfer endpoint; it comprises a Channel (the
 * file-transfer subsystem: listing, downloading, removing remote files) and the Connection underneath it.
 * Sessions are made exclusively by a Session_factory; how is not our concern in the slightest: xfer::session
 * does not speak any wire protocol.
 *
 * The Session_pool is the meat of the module.  acquire() hands out a cached idle Session or, lacking one, has the
 * Session_factory make a new one on the spot; release() returns it, whereupon it is either cached (room
 * permitting) or torn down.  Only the *idle* sessions are bounded; the number checked out at a given time is not.
 * A start()/stop() lifecycle gates all this; it is designed to be driven by an outside orchestrator such as
 * lifecycle::Lifecycle_manager.
 *
 * Session_lease is an RAII helper pairing acquire() with release() (or discard()) automatically.
 */
namespace xfer::session
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Remote_file;
class Channel;
class Connection;
class Session;
class Session_factory;
struct Session_pool_config;
class Session_pool;
class Session_lease;

/**
 * The handle through which a Session is passed around, a/k/a owned: by the Session_pool while idle; by exactly
 * one caller while checked out.  Unique ownership is what makes "never held by two parties at once" hold by
 * construction.
 */
using Session_ptr = boost::movelib::unique_ptr<Session>;

// Free functions.

/**
 * Prints string representation of the given `Remote_file` to the given `ostream`.
 *
 * @relatesalso Remote_file
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Remote_file& val);

/**
 * Prints string representation of the given `Session` to the given `ostream`.
 *
 * @relatesalso Session
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session& val);

/**
 * Prints string representation of the given `Session_pool_config` to the given `ostream`.
 *
 * @relatesalso Session_pool_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session_pool_config& val);

/**
 * Prints string representation of the given `Session_pool` to the given `ostream`.
 *
 * @relatesalso Session_pool
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session_pool& val);

} // namespace xfer::session
