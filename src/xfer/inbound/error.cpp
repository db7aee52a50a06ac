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
#include "xfer/inbound/error.hpp"
#include <flow/util/util.hpp>
#include <cassert>
#include <istream>
#include <ostream>

namespace xfer::inbound::error
{

// Types.

/**
 * The boost.system category for errors returned by the xfer::inbound module.  Analogous to
 * session::error::Category.  All notes therein apply.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Analogous to session::error::Category::name().
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Analogous to session::error::Category::message().
   *
   * @param val
   *        See above.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Analogous to session::error::Category::code_symbol().
   *
   * @param code
   *        See above.
   * @return See above.
   */
  static String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "xfer/inbound";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against its documented requirements.";
  case Code::S_LOCAL_DIRECTORY_NOT_FOUND:
    return "Local directory: it does not exist, and automatic creation of local directories is disabled.";
  case Code::S_LOCAL_PATH_NOT_A_DIRECTORY:
    return "Local directory: the path exists but is not a directory.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_LOCAL_DIRECTORY_NOT_FOUND:
    return "LOCAL_DIRECTORY_NOT_FOUND";
  case Code::S_LOCAL_PATH_NOT_A_DIRECTORY:
    return "LOCAL_PATH_NOT_A_DIRECTORY";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  // See session::error::operator>>().
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace xfer::inbound::error
