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
#include <iosfwd>

/**
 * Namespace containing the xfer::inbound module's extension of boost.system error conventions.  Historically this
 * was written after xfer::session::error, and essentially all the notes in that namespace apply equally here.
 * File system failures are not mapped into this set: they are emitted as the system-category codes
 * boost.filesystem reports.  Likewise errors from the Session_pool and the remote Channel pass through unmodified.
 */
namespace xfer::inbound::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by xfer::inbound functions/methods *outside of*
 * those passed-through from xfer::session, the remote transport, or the local file system.
 *
 * All notes from session::error::Code doc header apply here.
 */
enum class Code
{
  /// User called an API with 1 or more arguments against its documented requirements.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Local directory: it does not exist, and automatic creation of local directories is disabled.
  S_LOCAL_DIRECTORY_NOT_FOUND,

  /// Local directory: the path exists but is not a directory.
  S_LOCAL_PATH_NOT_A_DIRECTORY,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Analogous to session::error::make_error_code().
 *
 * @param err_code
 *        See above.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Analogous to session::error::operator>>().
 *
 * @param is
 *        See above.
 * @param val
 *        See above.
 * @return See above.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Analogous to session::error::operator<<().
 *
 * @param os
 *        See above.
 * @param val
 *        See above.
 * @return See above.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace xfer::inbound::error

namespace boost::system
{

// Types.

/// See the counterpart specialization for session::error::Code.
template<>
struct is_error_code_enum<::xfer::inbound::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
