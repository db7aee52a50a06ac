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
 * Namespace containing the xfer::session module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Errors emitted by a
 * Session_factory or by a Channel/Connection belong to whatever module (or the system) generated them and are
 * passed through unmodified; this set covers only what the Session_pool itself decides.
 */
namespace xfer::session::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by xfer::session functions/methods *outside of*
 * errors passed-through from a Session_factory (session establishment) or from the transport itself.
 *
 * Each member's doc header is the message returned by the `Error_code::message()` of a code with that value.
 */
enum class Code
{
  /// User called an API with 1 or more arguments against its documented requirements.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /**
   * Session pool: session is unavailable, since the pool was never started; start() it first.  Sessions are
   * never created (nor waited-for) on behalf of a not-yet-started pool.
   */
  S_POOL_NOT_STARTED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight `Error_code` (`boost::system::error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general)
 * `Error_code` to the (xfer::session-specific) error code set, so that one can implicitly covert
 * from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return Corresponding `Error_code`.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a session::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "<number>", where <number> is the numeric value of the `enum` member; or
 *   - "<symbol>", where <symbol> is the `S_`-less name of the member, case-insensitively.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

/**
 * Serializes a session::error::Code to a standard output stream.  This is the symbolic name (sans `S_`)
 * understood by operator>>(); not the long-form message.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

} // namespace xfer::session::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::xfer::session::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
