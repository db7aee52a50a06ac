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
#include "xfer/session/session.hpp"
#include <regex>
#include <string>
#include <vector>

namespace xfer::inbound
{

// Types.

/**
 * Filters a remote directory listing (session::Channel::ls() result) by file name: an entry is accepted if and only
 * if it is not a directory and its entire name matches the regular expression given at construction.
 *
 * Immutable after construction; hence safe for concurrent use.
 */
class Pattern_file_list_filter
{
public:
  // Constructors/destructor.

  /**
   * Compiles the pattern.  Behavior is undefined if `*this` is used after this emitted an error.
   *
   * @param pattern
   *        ECMAScript regular expression.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (`pattern` does not compile).
   */
  explicit Pattern_file_list_filter(const std::string& pattern, Error_code* err_code = 0);

  // Methods.

  /**
   * Returns `true` if and only if `file` is accepted; see class doc header.
   *
   * @param file
   *        A remote directory entry.
   * @return See above.
   */
  bool accept(const session::Remote_file& file) const;

  /**
   * Returns the accepted subset of `files`, in the same order.
   *
   * @param files
   *        A remote directory listing.
   * @return See above.
   */
  std::vector<session::Remote_file> filter(const std::vector<session::Remote_file>& files) const;

  /**
   * The pattern from ctor.
   *
   * @return See above.
   */
  const std::string& pattern() const;

private:
  // Data.

  /// See ctor.
  const std::string m_pattern;

  /// Compiled #m_pattern.
  std::regex m_regex;
}; // class Pattern_file_list_filter

} // namespace xfer::inbound
